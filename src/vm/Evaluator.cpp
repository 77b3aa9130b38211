//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Evaluator.cpp
// Purpose: Program loading, the entry-point policy and the runtime services
//          (violations, allocation, type coercion) shared by the evaluator.
// Key invariants: Every binding the evaluator creates is registered with the
//                 heap; a critical violation always leaves the run through
//                 ExecutionHalted.
//
//===----------------------------------------------------------------------===//

#include "vm/Evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

using namespace pulse::frontend;
using pulse::runtime::Value;

namespace pulse::vm
{

namespace
{

/// @brief Milliseconds with two decimals, e.g. `12.34`.
std::string formatElapsed(double ms)
{
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::fixed << std::setprecision(2) << ms;
    return os.str();
}

/// @brief Budget as written: integral values without a fraction.
std::string formatBudget(double ms)
{
    if (std::floor(ms) == ms && std::fabs(ms) < 1e15)
        return std::to_string(static_cast<long long>(ms));
    return runtime::formatDouble(ms);
}

} // namespace

std::pair<double, double> sensorRange(std::string_view type)
{
    if (type == "temperature")
        return {20.0, 35.0};
    if (type == "humidity")
        return {40.0, 70.0};
    if (type == "pressure")
        return {90.0, 110.0};
    if (type == "light")
        return {0.0, 1000.0};
    return {0.0, 100.0};
}

Evaluator::Evaluator(RuntimeState &state, const Program &program)
    : state_(state), program_(program)
{
}

//===----------------------------------------------------------------------===//
// Loading
//===----------------------------------------------------------------------===//

void Evaluator::loadDeclarations()
{
    for (const auto &cls : program_.classes)
    {
        ClassInfo &info = classes_[cls->name];
        info.decl = cls.get();
        for (const auto &field : cls->fields)
        {
            info.fieldDecls[field->name] = field.get();
            if (!field->modifiers.isStatic)
                info.instanceFields.push_back(field.get());
        }
        for (const auto &method : cls->methods)
        {
            if (method->isConstructor)
                info.constructors.push_back(method.get());
            else
                info.methods.emplace(method->name, method.get());
            registerDeadline(*method, qualifiedName(*method, &info));
        }
    }
    for (const auto &method : program_.methods)
        registerDeadline(*method, method->name);
}

void Evaluator::registerDeadline(const MethodDecl &method, const std::string &name)
{
    const Annotation *deadline = method.findAnnotation(AnnotationKind::Deadline);
    if (!deadline)
        return;
    const AnnotationArg *ms = deadline->find("ms");
    if (!ms)
        return;
    double budget = 0;
    if (const auto *i = std::get_if<int64_t>(&ms->value))
        budget = static_cast<double>(*i);
    else if (const auto *d = std::get_if<double>(&ms->value))
        budget = std::trunc(*d);
    if (budget > 0)
        state_.deadlines.registerDeadline(name, budget, method.loc.line);
}

void Evaluator::initialiseStatics()
{
    for (auto &[name, info] : classes_)
    {
        contexts_.push_back(MethodContext{nullptr, &info, nullptr, false, false});
        for (const auto &field : info.decl->fields)
        {
            if (!field->modifiers.isStatic)
                continue;
            Value value = runtime::defaultValueFor(field->type.name, field->type.isArray);
            if (field->init)
            {
                try
                {
                    value = coerce(eval(*field->init), field->type, field->loc.line);
                }
                catch (const RuntimeError &e)
                {
                    reportRuntimeError(e);
                }
            }
            info.statics[field->name] = std::move(value);
        }
        contexts_.pop_back();
    }
}

const MethodDecl *Evaluator::findMain(ClassInfo *&owner)
{
    owner = nullptr;
    for (const auto &method : program_.methods)
    {
        if (method->name == "main")
            return method.get();
    }
    for (const auto &cls : program_.classes)
    {
        for (const auto &method : cls->methods)
        {
            if (!method->isConstructor && method->name == "main")
            {
                owner = findClass(cls->name);
                return method.get();
            }
        }
    }
    return nullptr;
}

void Evaluator::run()
{
    try
    {
        loadDeclarations();
        initialiseStatics();

        if (!program_.statements.empty())
        {
            executeSequence(program_.statements);
        }
        else
        {
            ClassInfo *owner = nullptr;
            if (const MethodDecl *main = findMain(owner))
            {
                std::vector<Value> args;
                if (!main->params.empty())
                    args.push_back(Value::makeArray(makeArray("String", 0)));
                try
                {
                    invoke(*main, owner, nullptr, std::move(args), main->loc.line);
                }
                catch (const RuntimeError &e)
                {
                    reportRuntimeError(e);
                }
            }
            else
            {
                for (const auto &method : program_.methods)
                {
                    if (!method->params.empty())
                        continue;
                    try
                    {
                        invoke(*method, nullptr, nullptr, {}, method->loc.line);
                    }
                    catch (const RuntimeError &e)
                    {
                        reportRuntimeError(e);
                    }
                }
            }
        }
    }
    catch (const ExecutionHalted &)
    {
        halted_ = true;
    }

    contexts_.clear();
    if (state_.config.finalCollection)
        state_.collectGarbage();
}

//===----------------------------------------------------------------------===//
// Runtime services
//===----------------------------------------------------------------------===//

bool Evaluator::handleViolations(std::vector<SafetyViolation> violations)
{
    for (auto &v : violations)
    {
        if (v.severity == ViolationSeverity::Error && safetyCheckActive())
            v.severity = ViolationSeverity::Critical;

        std::ostringstream line;
        line << "SAFETY VIOLATION [" << toString(v.severity) << "]: " << v.message << " (Line "
             << v.line << ")\n";
        state_.append(line.str());
        state_.diagnostics.report({v.severity == ViolationSeverity::Warning
                                       ? support::Severity::Warning
                                       : support::Severity::Error,
                                   v.message,
                                   {v.line, 0},
                                   runtime_codes::kSafetyViolation});
        state_.safetyViolations.push_back(v);

        if (v.severity == ViolationSeverity::Critical)
        {
            state_.append("SYSTEM HALT: Critical safety violation detected\n");
            throw ExecutionHalted(v.message);
        }
    }
    return !violations.empty();
}

void Evaluator::reportRuntimeError(const RuntimeError &error)
{
    state_.append("Runtime error (line " + std::to_string(error.line()) + "): " + error.what() +
                  "\n");
    state_.diagnostics.report({support::Severity::Error,
                               error.what(),
                               {error.line(), 0},
                               runtime_codes::kRuntimeError});
}

void Evaluator::reportDeadline(const DeadlineViolation &violation)
{
    const std::string message = violation.methodName + " took " +
                                formatElapsed(violation.actualMs) + "ms (expected " +
                                formatBudget(violation.expectedMs) + "ms)";
    state_.append("DEADLINE VIOLATION: " + message + "\n");
    state_.diagnostics.report({support::Severity::Warning,
                               message,
                               {violation.line, 0},
                               runtime_codes::kDeadlineViolation});
}

runtime::ObjectId Evaluator::allocate(const Value &value, uint32_t line)
{
    const size_t size = value.sizeBytes();
    if (state_.heap.wouldOverflow(size))
        state_.collectGarbage();
    handleViolations(
        state_.safety.checkAllocation(size, state_.heap.used(), state_.heap.budget(), line));
    return state_.heap.allocate(value);
}

void Evaluator::chargeContainerStore(uint64_t identity, std::ptrdiff_t delta, uint32_t line)
{
    if (delta > 0)
    {
        const auto growth = static_cast<size_t>(delta);
        size_t charge = state_.heap.growthCharge(identity, growth);
        if (charge > 0 && state_.heap.wouldOverflow(charge))
        {
            state_.collectGarbage();
            charge = state_.heap.growthCharge(identity, growth);
        }
        if (charge > 0)
            handleViolations(state_.safety.checkAllocation(
                charge, state_.heap.used(), state_.heap.budget(), line));
    }
    state_.heap.resize(identity, delta);
}

Value Evaluator::coerce(const Value &value, const TypeRef &type, uint32_t line) const
{
    auto mismatch = [&]() -> RuntimeError
    {
        return RuntimeError(line,
                            "Type mismatch: cannot assign " + runtime::typeNameOf(value) + " to " +
                                type.str());
    };

    if (value.isVoid())
        throw RuntimeError(line, "Cannot use the result of a void method as a value");
    if (type.name == "void" && !type.isArray)
        throw RuntimeError(line, "Cannot declare a value of type void");

    if (type.isArray)
    {
        if (value.isNull())
            return value;
        if (value.isArray() && value.asArray()->elementType == type.name)
            return value;
        throw mismatch();
    }
    if (type.name == "int")
    {
        if (value.isInt())
            return value;
        throw mismatch();
    }
    if (type.name == "double")
    {
        if (value.isNumeric())
            return Value::makeDouble(value.asDouble());
        throw mismatch();
    }
    if (type.name == "boolean")
    {
        if (value.isBool())
            return value;
        throw mismatch();
    }
    if (type.name == "String")
    {
        if (value.isString() || value.isNull())
            return value;
        throw mismatch();
    }
    if (value.isNull())
        return value;
    if (value.isObject() && value.asObject()->className == type.name)
        return value;
    throw mismatch();
}

void Evaluator::declareVariable(const std::string &name,
                                const TypeRef &type,
                                const Value &value,
                                uint32_t line)
{
    Value coerced = coerce(value, type, line);
    const runtime::ObjectId id = allocate(coerced, line);
    state_.env.declare(name, runtime::Binding{std::move(coerced), id, type.name, type.isArray});
}

Evaluator::ClassInfo *Evaluator::findClass(const std::string &name)
{
    auto it = classes_.find(name);
    return it == classes_.end() ? nullptr : &it->second;
}

const Evaluator::MethodContext *Evaluator::context() const
{
    return contexts_.empty() ? nullptr : &contexts_.back();
}

bool Evaluator::safetyCheckActive() const
{
    return std::any_of(contexts_.begin(),
                       contexts_.end(),
                       [](const MethodContext &c) { return c.safetyCheck; });
}

runtime::ArrayRef Evaluator::makeArray(const std::string &elementType, size_t length)
{
    auto array = std::make_shared<runtime::ArrayObject>();
    array->elementType = elementType;
    array->elements.assign(length, runtime::defaultElementFor(elementType));
    array->identity = state_.nextIdentity++;
    return array;
}

} // namespace pulse::vm
