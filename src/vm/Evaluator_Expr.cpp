//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Evaluator_Expr.cpp
// Purpose: Expression evaluation: operators, names, member and index access,
//          and stores through assignable targets.
// Key invariants: Integer arithmetic wraps to 32 bits; every division,
//                 index and receiver access is checked by the safety verifier
//                 before it happens.
//
//===----------------------------------------------------------------------===//

#include "vm/Evaluator.hpp"

#include <cmath>

using namespace pulse::frontend;
using pulse::runtime::Value;

namespace pulse::vm
{

namespace
{

/// @brief Truncate a 64-bit intermediate to 32-bit two's complement.
Value wrapInt(int64_t v)
{
    return Value::makeInt(static_cast<int32_t>(v));
}

} // namespace

Value Evaluator::eval(const Expr &expr)
{
    switch (expr.kind)
    {
        case ExprKind::IntLiteral:
            return wrapInt(static_cast<const IntLiteralExpr &>(expr).value);
        case ExprKind::NumberLiteral:
            return Value::makeDouble(static_cast<const NumberLiteralExpr &>(expr).value);
        case ExprKind::StringLiteral:
            return Value::makeString(static_cast<const StringLiteralExpr &>(expr).value);
        case ExprKind::BoolLiteral:
            return Value::makeBool(static_cast<const BoolLiteralExpr &>(expr).value);
        case ExprKind::NullLiteral:
            return Value::makeNull();
        case ExprKind::Ident:
            return evalIdent(static_cast<const IdentExpr &>(expr));
        case ExprKind::This:
        {
            const MethodContext *ctx = context();
            if (!ctx || !ctx->self)
                throw RuntimeError(expr.loc.line, "'this' used outside an instance method");
            return Value::makeObject(ctx->self);
        }
        case ExprKind::Binary:
            return evalBinary(static_cast<const BinaryExpr &>(expr));
        case ExprKind::Unary:
            return evalUnary(static_cast<const UnaryExpr &>(expr));
        case ExprKind::Assign:
            return evalAssign(static_cast<const AssignExpr &>(expr));
        case ExprKind::Conditional:
        {
            const auto &cond = static_cast<const ConditionalExpr &>(expr);
            return evalCondition(*cond.condition) ? eval(*cond.thenExpr) : eval(*cond.elseExpr);
        }
        case ExprKind::Call:
            return evalCall(static_cast<const CallExpr &>(expr));
        case ExprKind::Member:
            return evalMember(static_cast<const MemberExpr &>(expr));
        case ExprKind::Index:
            return evalIndex(static_cast<const IndexExpr &>(expr));
        case ExprKind::New:
            return evalNew(static_cast<const NewExpr &>(expr));
        case ExprKind::NewArray:
            return evalNewArray(static_cast<const NewArrayExpr &>(expr));
    }
    throw RuntimeError(expr.loc.line, "Unsupported expression");
}

//===----------------------------------------------------------------------===//
// Operators
//===----------------------------------------------------------------------===//

Value Evaluator::evalBinary(const BinaryExpr &expr)
{
    const uint32_t line = expr.loc.line;

    if (expr.op == BinaryOp::And || expr.op == BinaryOp::Or)
    {
        const Value lhs = eval(*expr.left);
        if (!lhs.isBool())
            throw RuntimeError(line,
                               std::string("Operator ") + binaryOpToString(expr.op) +
                                   " requires boolean operands");
        if (expr.op == BinaryOp::And ? !lhs.asBool() : lhs.asBool())
            return lhs;
        const Value rhs = eval(*expr.right);
        if (!rhs.isBool())
            throw RuntimeError(line,
                               std::string("Operator ") + binaryOpToString(expr.op) +
                                   " requires boolean operands");
        return rhs;
    }

    const Value lhs = eval(*expr.left);
    const Value rhs = eval(*expr.right);

    switch (expr.op)
    {
        case BinaryOp::Add:
            if (lhs.isString() || rhs.isString())
            {
                if (lhs.isVoid() || rhs.isVoid())
                    throw RuntimeError(line, "Cannot concatenate a void value");
                return Value::makeString(lhs.toString() + rhs.toString());
            }
            return evalArithmetic(expr.op, lhs, rhs, line);
        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
            return evalArithmetic(expr.op, lhs, rhs, line);
        case BinaryOp::Eq:
            return Value::makeBool(lhs.equals(rhs));
        case BinaryOp::Ne:
            return Value::makeBool(!lhs.equals(rhs));
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return evalComparison(expr.op, lhs, rhs, line);
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    throw RuntimeError(line, "Unsupported operator");
}

Value Evaluator::evalArithmetic(BinaryOp op, const Value &lhs, const Value &rhs, uint32_t line)
{
    if (!lhs.isNumeric() || !rhs.isNumeric())
        throw RuntimeError(line,
                           std::string("Operator ") + binaryOpToString(op) +
                               " cannot be applied to " + runtime::typeNameOf(lhs) + " and " +
                               runtime::typeNameOf(rhs));

    const bool intMath = lhs.isInt() && rhs.isInt();

    if (op == BinaryOp::Div || op == BinaryOp::Mod)
    {
        if (handleViolations(state_.safety.checkDivision(lhs, rhs, line)))
            return intMath ? Value::makeInt(0) : Value::makeDouble(0.0);
    }

    if (intMath)
    {
        const int64_t a = lhs.asInt();
        const int64_t b = rhs.asInt();
        switch (op)
        {
            case BinaryOp::Add:
                return wrapInt(a + b);
            case BinaryOp::Sub:
                return wrapInt(a - b);
            case BinaryOp::Mul:
                return wrapInt(a * b);
            case BinaryOp::Div:
                return wrapInt(a / b);
            case BinaryOp::Mod:
                return wrapInt(a % b);
            default:
                break;
        }
    }
    else
    {
        const double a = lhs.asDouble();
        const double b = rhs.asDouble();
        switch (op)
        {
            case BinaryOp::Add:
                return Value::makeDouble(a + b);
            case BinaryOp::Sub:
                return Value::makeDouble(a - b);
            case BinaryOp::Mul:
                return Value::makeDouble(a * b);
            case BinaryOp::Div:
                return Value::makeDouble(a / b);
            case BinaryOp::Mod:
                return Value::makeDouble(std::fmod(a, b));
            default:
                break;
        }
    }
    throw RuntimeError(line, "Unsupported arithmetic operator");
}

Value Evaluator::evalComparison(BinaryOp op, const Value &lhs, const Value &rhs, uint32_t line)
{
    if (!lhs.isNumeric() || !rhs.isNumeric())
        throw RuntimeError(line,
                           std::string("Operator ") + binaryOpToString(op) +
                               " cannot be applied to " + runtime::typeNameOf(lhs) + " and " +
                               runtime::typeNameOf(rhs));
    const double a = lhs.asDouble();
    const double b = rhs.asDouble();
    switch (op)
    {
        case BinaryOp::Lt:
            return Value::makeBool(a < b);
        case BinaryOp::Le:
            return Value::makeBool(a <= b);
        case BinaryOp::Gt:
            return Value::makeBool(a > b);
        case BinaryOp::Ge:
            return Value::makeBool(a >= b);
        default:
            break;
    }
    throw RuntimeError(line, "Unsupported comparison operator");
}

Value Evaluator::evalUnary(const UnaryExpr &expr)
{
    const uint32_t line = expr.loc.line;
    switch (expr.op)
    {
        case UnaryOp::Neg:
        {
            const Value v = eval(*expr.operand);
            if (v.isInt())
                return wrapInt(-static_cast<int64_t>(v.asInt()));
            if (v.isDouble())
                return Value::makeDouble(-v.asDouble());
            throw RuntimeError(line, "Operator - cannot be applied to " + runtime::typeNameOf(v));
        }
        case UnaryOp::Not:
        {
            const Value v = eval(*expr.operand);
            if (!v.isBool())
                throw RuntimeError(line,
                                   "Operator ! cannot be applied to " + runtime::typeNameOf(v));
            return Value::makeBool(!v.asBool());
        }
        case UnaryOp::PreInc:
        case UnaryOp::PreDec:
        case UnaryOp::PostInc:
        case UnaryOp::PostDec:
        {
            const Place place = resolvePlace(*expr.operand, line);
            if (place.kind == Place::Kind::Refused)
                return place.fallback;
            const Value old = load(place, line);
            const int delta = expr.op == UnaryOp::PreInc || expr.op == UnaryOp::PostInc ? 1 : -1;
            Value updated;
            if (old.isInt())
                updated = wrapInt(static_cast<int64_t>(old.asInt()) + delta);
            else if (old.isDouble())
                updated = Value::makeDouble(old.asDouble() + delta);
            else
                throw RuntimeError(line,
                                   std::string(delta > 0 ? "++" : "--") +
                                       " cannot be applied to " + runtime::typeNameOf(old));
            storeTo(place, updated, line);
            return expr.op == UnaryOp::PreInc || expr.op == UnaryOp::PreDec ? updated : old;
        }
    }
    throw RuntimeError(line, "Unsupported unary operator");
}

//===----------------------------------------------------------------------===//
// Names and access
//===----------------------------------------------------------------------===//

bool Evaluator::isValueName(const std::string &name) const
{
    if (state_.env.lookup(name))
        return true;
    const MethodContext *ctx = context();
    if (!ctx)
        return false;
    if (ctx->self && ctx->self->fields.count(name) != 0)
        return true;
    return ctx->cls && ctx->cls->statics.count(name) != 0;
}

Evaluator::ClassInfo *Evaluator::classReference(const Expr &expr)
{
    if (expr.kind != ExprKind::Ident)
        return nullptr;
    const auto &name = static_cast<const IdentExpr &>(expr).name;
    if (isValueName(name))
        return nullptr;
    return findClass(name);
}

Value Evaluator::evalIdent(const IdentExpr &expr)
{
    const std::string &name = expr.name;
    const MethodContext *ctx = context();
    if (ctx && ctx->cls)
    {
        if (state_.env.isLocal(name))
            return state_.env.lookup(name)->value;
        if (ctx->self && ctx->self->fields.count(name) != 0)
            return readField(ctx->self, ctx->cls, name, expr.loc.line);
        if (ctx->cls->statics.count(name) != 0)
            return readStatic(*ctx->cls, name);
    }
    if (const runtime::Binding *binding = state_.env.lookup(name))
        return binding->value;
    throw RuntimeError(expr.loc.line, "Undefined variable: " + name);
}

Value Evaluator::readField(const runtime::ObjectRef &object,
                           ClassInfo *cls,
                           const std::string &name,
                           uint32_t line)
{
    if (cls)
    {
        auto decl = cls->fieldDecls.find(name);
        if (decl != cls->fieldDecls.end() && decl->second->findAnnotation(AnnotationKind::Sensor))
            return sensorReading(*decl->second);
    }
    auto it = object->fields.find(name);
    if (it == object->fields.end())
    {
        if (cls && cls->statics.count(name) != 0)
            return readStatic(*cls, name);
        throw RuntimeError(line, "Unknown field: " + object->className + "." + name);
    }
    return it->second;
}

Value Evaluator::readStatic(ClassInfo &cls, const std::string &name)
{
    auto decl = cls.fieldDecls.find(name);
    if (decl != cls.fieldDecls.end() && decl->second->findAnnotation(AnnotationKind::Sensor))
        return sensorReading(*decl->second);
    return cls.statics.at(name);
}

Value Evaluator::evalMember(const MemberExpr &expr)
{
    const uint32_t line = expr.loc.line;

    if (ClassInfo *cls = classReference(*expr.object))
    {
        if (cls->statics.count(expr.member) == 0)
            throw RuntimeError(line, "Unknown static field: " + cls->decl->name + "." + expr.member);
        return readStatic(*cls, expr.member);
    }

    const Value receiver = eval(*expr.object);
    if (receiver.isNull())
    {
        handleViolations(state_.safety.checkNullAccess(receiver, line));
        return Value::makeNull();
    }
    if (receiver.isArray() && expr.member == "length")
        return Value::makeInt(static_cast<int32_t>(receiver.asArray()->elements.size()));
    if (receiver.isObject())
    {
        const auto &object = receiver.asObject();
        return readField(object, findClass(object->className), expr.member, line);
    }
    throw RuntimeError(line,
                       "Cannot access member '" + expr.member + "' of " +
                           runtime::typeNameOf(receiver));
}

Value Evaluator::evalIndex(const IndexExpr &expr)
{
    const uint32_t line = expr.loc.line;
    const Value base = eval(*expr.base);
    const Value index = eval(*expr.index);
    if (base.isNull())
    {
        handleViolations(state_.safety.checkNullAccess(base, line));
        return Value::makeNull();
    }
    if (!base.isArray())
        throw RuntimeError(line, "Cannot index into " + runtime::typeNameOf(base));
    if (!index.isInt())
        throw RuntimeError(line, "Array index must be int, got " + runtime::typeNameOf(index));

    const auto &array = base.asArray();
    if (handleViolations(
            state_.safety.checkArrayAccess(array->elements.size(), index.asInt(), line)))
        return runtime::defaultElementFor(array->elementType);
    return array->elements[static_cast<size_t>(index.asInt())];
}

Value Evaluator::evalNewArray(const NewArrayExpr &expr)
{
    const uint32_t line = expr.loc.line;
    const Value length = eval(*expr.length);
    if (!length.isInt())
        throw RuntimeError(line, "Array length must be int, got " + runtime::typeNameOf(length));
    if (length.asInt() < 0)
        throw RuntimeError(line, "Negative array size: " + std::to_string(length.asInt()));

    const std::string &elementType = expr.elementType.name;
    if (elementType != "int" && elementType != "double" && elementType != "boolean" &&
        elementType != "String" && !findClass(elementType))
        throw RuntimeError(line, "Unknown class: " + elementType);

    const size_t requested =
        static_cast<size_t>(length.asInt()) * runtime::elementSize(elementType);
    if (state_.heap.wouldOverflow(requested))
        state_.collectGarbage();
    handleViolations(state_.safety.checkAllocation(
        requested, state_.heap.used(), state_.heap.budget(), line));

    return Value::makeArray(makeArray(elementType, static_cast<size_t>(length.asInt())));
}

//===----------------------------------------------------------------------===//
// Stores
//===----------------------------------------------------------------------===//

Value Evaluator::evalAssign(const AssignExpr &expr)
{
    const Value value = eval(*expr.value);
    store(*expr.target, value, expr.loc.line);
    return value;
}

void Evaluator::assignName(const std::string &name, const Value &value, uint32_t line)
{
    auto assignBinding = [&](runtime::Binding &binding)
    {
        Value coerced = coerce(value, TypeRef{binding.typeName, binding.isArray}, line);
        const runtime::ObjectId id = allocate(coerced, line);
        binding.value = std::move(coerced);
        binding.object = id;
    };

    const MethodContext *ctx = context();
    if (ctx && ctx->cls)
    {
        if (state_.env.isLocal(name))
        {
            assignBinding(*state_.env.lookup(name));
            return;
        }
        if (ctx->self && ctx->self->fields.count(name) != 0)
        {
            Place place;
            place.kind = Place::Kind::Field;
            place.field = name;
            place.object = ctx->self;
            place.cls = ctx->cls;
            storeTo(place, value, line);
            return;
        }
        if (ctx->cls->statics.count(name) != 0)
        {
            const FieldDecl *decl = ctx->cls->fieldDecls.at(name);
            ctx->cls->statics[name] = coerce(value, decl->type, line);
            return;
        }
    }
    if (runtime::Binding *binding = state_.env.lookup(name))
    {
        assignBinding(*binding);
        return;
    }
    throw RuntimeError(line, "Undefined variable: " + name);
}

void Evaluator::store(const Expr &target, const Value &value, uint32_t line)
{
    storeTo(resolvePlace(target, line), value, line);
}

Evaluator::Place Evaluator::resolvePlace(const Expr &target, uint32_t line)
{
    Place place;
    switch (target.kind)
    {
        case ExprKind::Ident:
            place.kind = Place::Kind::Name;
            place.ident = &static_cast<const IdentExpr &>(target);
            return place;
        case ExprKind::Member:
        {
            const auto &member = static_cast<const MemberExpr &>(target);
            place.field = member.member;
            if (ClassInfo *cls = classReference(*member.object))
            {
                if (cls->statics.count(member.member) == 0)
                    throw RuntimeError(line,
                                       "Unknown static field: " + cls->decl->name + "." +
                                           member.member);
                place.kind = Place::Kind::Static;
                place.cls = cls;
                return place;
            }
            const Value receiver = eval(*member.object);
            if (receiver.isNull())
            {
                handleViolations(state_.safety.checkNullAccess(receiver, line));
                place.fallback = Value::makeNull();
                return place;
            }
            if (!receiver.isObject())
                throw RuntimeError(line,
                                   "Cannot assign member '" + member.member + "' of " +
                                       runtime::typeNameOf(receiver));
            const auto &object = receiver.asObject();
            ClassInfo *cls = findClass(object->className);
            if (cls && object->fields.count(member.member) != 0)
            {
                place.kind = Place::Kind::Field;
                place.object = object;
                place.cls = cls;
                return place;
            }
            if (cls && cls->statics.count(member.member) != 0)
            {
                place.kind = Place::Kind::Static;
                place.cls = cls;
                return place;
            }
            throw RuntimeError(line, "Unknown field: " + object->className + "." + member.member);
        }
        case ExprKind::Index:
        {
            const auto &index = static_cast<const IndexExpr &>(target);
            const Value base = eval(*index.base);
            const Value position = eval(*index.index);
            if (base.isNull())
            {
                handleViolations(state_.safety.checkNullAccess(base, line));
                place.fallback = Value::makeNull();
                return place;
            }
            if (!base.isArray())
                throw RuntimeError(line, "Cannot index into " + runtime::typeNameOf(base));
            if (!position.isInt())
                throw RuntimeError(line,
                                   "Array index must be int, got " +
                                       runtime::typeNameOf(position));
            const auto &array = base.asArray();
            if (handleViolations(state_.safety.checkArrayAccess(
                    array->elements.size(), position.asInt(), line)))
            {
                place.fallback = runtime::defaultElementFor(array->elementType);
                return place;
            }
            place.kind = Place::Kind::Element;
            place.array = array;
            place.index = static_cast<size_t>(position.asInt());
            return place;
        }
        default:
            break;
    }
    throw RuntimeError(line, "Invalid assignment target");
}

Value Evaluator::load(const Place &place, uint32_t line)
{
    switch (place.kind)
    {
        case Place::Kind::Name:
            return evalIdent(*place.ident);
        case Place::Kind::Field:
            return readField(place.object, place.cls, place.field, line);
        case Place::Kind::Static:
            return readStatic(*place.cls, place.field);
        case Place::Kind::Element:
            return place.array->elements[place.index];
        case Place::Kind::Refused:
            break;
    }
    return place.fallback;
}

void Evaluator::storeTo(const Place &place, const Value &value, uint32_t line)
{
    switch (place.kind)
    {
        case Place::Kind::Name:
            assignName(place.ident->name, value, line);
            return;
        case Place::Kind::Field:
        {
            Value coerced = coerce(value, place.cls->fieldDecls.at(place.field)->type, line);
            auto &object = *place.object;
            chargeContainerStore(
                object.identity, runtime::fieldStoreDelta(object, place.field, coerced), line);
            object.fields[place.field] = std::move(coerced);
            ++object.version;
            return;
        }
        case Place::Kind::Static:
            place.cls->statics[place.field] =
                coerce(value, place.cls->fieldDecls.at(place.field)->type, line);
            return;
        case Place::Kind::Element:
        {
            Value coerced = coerce(value, TypeRef{place.array->elementType, false}, line);
            auto &array = *place.array;
            Value &slot = array.elements[place.index];
            chargeContainerStore(array.identity, runtime::elementStoreDelta(slot, coerced), line);
            slot = std::move(coerced);
            ++array.version;
            return;
        }
        case Place::Kind::Refused:
            return;
    }
}

} // namespace pulse::vm
