//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Evaluator_Call.cpp
// Purpose: Method dispatch, invocation frames and object construction.
// Key invariants: CallScope restores the call stack, the method context, the
//                 environment frame and the call depth on every exit path.
//
//===----------------------------------------------------------------------===//

#include "vm/Evaluator.hpp"

using namespace pulse::frontend;
using pulse::runtime::Value;

namespace pulse::vm
{

/// @brief Everything a method invocation pushes, popped in reverse order.
class Evaluator::CallScope
{
  public:
    CallScope(Evaluator &ev,
              const MethodDecl &method,
              ClassInfo *cls,
              runtime::ObjectRef self,
              std::string name)
        : ev_(ev), depth_(ev.state_.safety), frame_(ev.state_.env), name_(std::move(name))
    {
        ev_.state_.callStack.push_back(name_);
        ev_.contexts_.push_back(
            MethodContext{&method,
                          cls,
                          std::move(self),
                          method.findAnnotation(AnnotationKind::RealTime) != nullptr,
                          method.findAnnotation(AnnotationKind::SafetyCheck) != nullptr});
        ev_.state_.trace.onCallEnter(name_, ev_.state_.callStack.size());
    }

    ~CallScope()
    {
        ev_.state_.trace.onCallExit(name_);
        ev_.contexts_.pop_back();
        ev_.state_.callStack.pop_back();
    }

    CallScope(const CallScope &) = delete;
    CallScope &operator=(const CallScope &) = delete;

  private:
    Evaluator &ev_;
    CallDepthGuard depth_;
    runtime::FrameGuard frame_;
    std::string name_;
};

std::string Evaluator::qualifiedName(const MethodDecl &method, const ClassInfo *cls) const
{
    return cls ? cls->decl->name + "." + method.name : method.name;
}

std::vector<Value> Evaluator::evalArgs(const std::vector<ExprPtr> &args)
{
    std::vector<Value> values;
    values.reserve(args.size());
    for (const auto &arg : args)
        values.push_back(eval(*arg));
    return values;
}

const MethodDecl *Evaluator::findMethod(ClassInfo *cls, const std::string &name, size_t arity) const
{
    if (cls)
    {
        auto [first, last] = cls->methods.equal_range(name);
        for (auto it = first; it != last; ++it)
        {
            if (it->second->params.size() == arity)
                return it->second;
        }
        return nullptr;
    }
    for (const auto &method : program_.methods)
    {
        if (method->name == name && method->params.size() == arity)
            return method.get();
    }
    return nullptr;
}

//===----------------------------------------------------------------------===//
// Calls
//===----------------------------------------------------------------------===//

Value Evaluator::evalCall(const CallExpr &expr)
{
    const uint32_t line = expr.loc.line;
    const Expr &callee = *expr.callee;

    if (callee.kind == ExprKind::Ident)
    {
        const std::string &name = static_cast<const IdentExpr &>(callee).name;
        std::vector<Value> args = evalArgs(expr.args);
        const MethodContext *ctx = context();
        if (ctx && ctx->cls)
        {
            if (const MethodDecl *method = findMethod(ctx->cls, name, args.size()))
            {
                runtime::ObjectRef self = method->modifiers.isStatic ? nullptr : ctx->self;
                if (!method->modifiers.isStatic && !self)
                    throw RuntimeError(line,
                                       "Cannot call instance method '" + name +
                                           "' from a static context");
                return invoke(*method, ctx->cls, std::move(self), std::move(args), line);
            }
        }
        if (const MethodDecl *method = findMethod(nullptr, name, args.size()))
            return invoke(*method, nullptr, nullptr, std::move(args), line);
        throw RuntimeError(line, "Unknown method: " + name);
    }

    if (callee.kind != ExprKind::Member)
        throw RuntimeError(line, "Expression is not callable");

    const auto &member = static_cast<const MemberExpr &>(callee);

    std::string builtin;
    if (isBuiltinReceiver(*member.object, builtin))
        return callBuiltin(builtin, member.member, evalArgs(expr.args), line);

    if (ClassInfo *cls = classReference(*member.object))
    {
        std::vector<Value> args = evalArgs(expr.args);
        const MethodDecl *method = findMethod(cls, member.member, args.size());
        if (!method)
            throw RuntimeError(line, "Unknown method: " + cls->decl->name + "." + member.member);
        if (!method->modifiers.isStatic)
            throw RuntimeError(line,
                               "Cannot call instance method " + cls->decl->name + "." +
                                   member.member + " without an instance");
        return invoke(*method, cls, nullptr, std::move(args), line);
    }

    const Value receiver = eval(*member.object);
    std::vector<Value> args = evalArgs(expr.args);

    if (receiver.isNull())
    {
        handleViolations(state_.safety.checkNullAccess(receiver, line));
        return Value::makeNull();
    }
    if (receiver.isString())
        return callStringMethod(receiver.asString(), member.member, args, line);
    if (receiver.isObject())
    {
        const auto &object = receiver.asObject();
        ClassInfo *cls = findClass(object->className);
        const MethodDecl *method = cls ? findMethod(cls, member.member, args.size()) : nullptr;
        if (!method)
            throw RuntimeError(line, "Unknown method: " + object->className + "." + member.member);
        return invoke(*method, cls, method->modifiers.isStatic ? nullptr : object, std::move(args), line);
    }
    throw RuntimeError(line,
                       "Cannot call method '" + member.member + "' on " +
                           runtime::typeNameOf(receiver));
}

Value Evaluator::invoke(const MethodDecl &method,
                        ClassInfo *cls,
                        runtime::ObjectRef self,
                        std::vector<Value> args,
                        uint32_t line)
{
    const std::string name = qualifiedName(method, cls);
    if (args.size() != method.params.size())
        throw RuntimeError(line,
                           "Method '" + name + "' expects " + std::to_string(method.params.size()) +
                               " argument(s), got " + std::to_string(args.size()));

    handleViolations(state_.safety.checkMethodCall(line));

    CallScope scope(*this, method, cls, std::move(self), name);

    for (size_t i = 0; i < args.size(); ++i)
    {
        const Param &param = method.params[i];
        declareVariable(param.name, param.type, args[i], line);
    }

    if (const Annotation *sensor = method.findAnnotation(AnnotationKind::Sensor))
        state_.trace.onSensorMethod(name, sensor->stringArg("type").value_or(""));

    state_.deadlines.startMethod(name);
    returnValue_ = Value::makeVoid();
    const ExecSignal signal =
        method.body ? executeSequence(method.body->statements) : ExecSignal::Normal;
    Value result = signal == ExecSignal::Return ? std::move(returnValue_) : Value::makeVoid();
    returnValue_ = Value::makeVoid();
    if (auto violation = state_.deadlines.endMethod(name))
        reportDeadline(*violation);

    if (method.isConstructor || (method.returnType.name == "void" && !method.returnType.isArray))
        return Value::makeVoid();
    if (result.isVoid())
        throw RuntimeError(line,
                           "Method '" + name + "' must return a value of type " +
                               method.returnType.str());
    return coerce(result, method.returnType, line);
}

//===----------------------------------------------------------------------===//
// Objects
//===----------------------------------------------------------------------===//

runtime::ObjectRef Evaluator::instantiate(ClassInfo &cls, uint32_t line)
{
    auto object = std::make_shared<runtime::ObjectInstance>();
    object->className = cls.decl->name;
    object->identity = state_.nextIdentity++;
    for (const FieldDecl *field : cls.instanceFields)
        object->fields[field->name] = runtime::defaultValueFor(field->type.name, field->type.isArray);

    contexts_.push_back(MethodContext{nullptr, &cls, object, false, false});
    try
    {
        for (const FieldDecl *field : cls.instanceFields)
        {
            if (field->init)
            {
                object->fields[field->name] = coerce(eval(*field->init), field->type, line);
                ++object->version;
            }
        }
    }
    catch (...)
    {
        contexts_.pop_back();
        throw;
    }
    contexts_.pop_back();
    return object;
}

Value Evaluator::evalNew(const NewExpr &expr)
{
    const uint32_t line = expr.loc.line;
    ClassInfo *cls = findClass(expr.className);
    if (!cls)
        throw RuntimeError(line, "Unknown class: " + expr.className);

    std::vector<Value> args = evalArgs(expr.args);
    const MethodDecl *ctor = nullptr;
    for (const MethodDecl *candidate : cls->constructors)
    {
        if (candidate->params.size() == args.size())
        {
            ctor = candidate;
            break;
        }
    }
    if (!ctor && (!args.empty() || !cls->constructors.empty()))
        throw RuntimeError(line,
                           "No constructor for " + expr.className + " taking " +
                               std::to_string(args.size()) + " argument(s)");

    runtime::ObjectRef object = instantiate(*cls, line);
    const Value value = Value::makeObject(object);

    const size_t requested = value.sizeBytes();
    if (state_.heap.wouldOverflow(requested))
        state_.collectGarbage();
    handleViolations(state_.safety.checkAllocation(
        requested, state_.heap.used(), state_.heap.budget(), line));

    if (ctor)
        invoke(*ctor, cls, object, std::move(args), line);
    return value;
}

} // namespace pulse::vm
