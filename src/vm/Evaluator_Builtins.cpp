//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Evaluator_Builtins.cpp
// Purpose: Built-in receivers (System.out, Math, System, Thread, String),
//          String instance methods and simulated sensor readings.
// Key invariants: Built-in names only resolve when no variable or class of
//                 the same name is visible.
//
//===----------------------------------------------------------------------===//

#include "vm/Evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>

using namespace pulse::frontend;
using pulse::runtime::Value;

namespace pulse::vm
{

namespace
{

/// @brief Saturating conversion used by Math.floor/ceil/round.
int32_t clampToInt(double v)
{
    if (std::isnan(v))
        return 0;
    if (v >= static_cast<double>(std::numeric_limits<int32_t>::max()))
        return std::numeric_limits<int32_t>::max();
    if (v <= static_cast<double>(std::numeric_limits<int32_t>::min()))
        return std::numeric_limits<int32_t>::min();
    return static_cast<int32_t>(v);
}

void expectArity(const std::string &name,
                 const std::vector<Value> &args,
                 size_t arity,
                 uint32_t line)
{
    if (args.size() != arity)
        throw RuntimeError(line,
                           name + " expects " + std::to_string(arity) + " argument(s), got " +
                               std::to_string(args.size()));
}

void expectNumeric(const std::string &name, const std::vector<Value> &args, uint32_t line)
{
    for (const auto &arg : args)
    {
        if (!arg.isNumeric())
            throw RuntimeError(line,
                               name + " expects numeric arguments, got " +
                                   runtime::typeNameOf(arg));
    }
}

} // namespace

bool Evaluator::isBuiltinReceiver(const Expr &object, std::string &name)
{
    if (object.kind == ExprKind::Ident)
    {
        const std::string &ident = static_cast<const IdentExpr &>(object).name;
        if (ident != "Math" && ident != "System" && ident != "Thread" && ident != "String")
            return false;
        if (isValueName(ident) || findClass(ident))
            return false;
        name = ident;
        return true;
    }
    if (object.kind == ExprKind::Member)
    {
        const auto &member = static_cast<const MemberExpr &>(object);
        std::string outer;
        if (member.member == "out" && isBuiltinReceiver(*member.object, outer) && outer == "System")
        {
            name = "System.out";
            return true;
        }
    }
    return false;
}

Value Evaluator::callBuiltin(const std::string &receiver,
                             const std::string &method,
                             std::vector<Value> args,
                             uint32_t line)
{
    const std::string qualified = receiver + "." + method;

    if (receiver == "System.out")
        return callPrint(method, args, line);
    if (receiver == "Math")
        return callMath(method, args, line);

    if (qualified == "System.currentTimeMillis")
    {
        expectArity(qualified, args, 0, line);
        return Value::makeDouble(std::floor(runtime::wallClockMs()));
    }
    if (qualified == "System.nanoTime")
    {
        expectArity(qualified, args, 0, line);
        using namespace std::chrono;
        return Value::makeDouble(static_cast<double>(
            duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count()));
    }
    if (qualified == "Thread.sleep")
    {
        expectArity(qualified, args, 1, line);
        expectNumeric(qualified, args, line);
        const double ms = args[0].asDouble();
        if (ms < 0)
            throw RuntimeError(line, "Thread.sleep: timeout value is negative");
        state_.sleep(ms);
        return Value::makeVoid();
    }
    if (qualified == "String.valueOf")
    {
        expectArity(qualified, args, 1, line);
        if (args[0].isVoid())
            throw RuntimeError(line, "Cannot convert a void value to String");
        return Value::makeString(args[0].toString());
    }
    throw RuntimeError(line, "Unknown method: " + qualified);
}

Value Evaluator::callPrint(const std::string &method, const std::vector<Value> &args, uint32_t line)
{
    if (method != "println" && method != "print")
        throw RuntimeError(line, "Unknown method: System.out." + method);
    if (args.size() > 1)
        throw RuntimeError(line, "System.out." + method + " expects at most 1 argument");

    const bool newline = method == "println";
    if (args.empty())
    {
        if (newline)
            state_.append("\n");
        return Value::makeVoid();
    }
    const Value &arg = args.front();
    if (arg.isVoid())
        throw RuntimeError(line, "Cannot print the result of a void method");
    if (arg.isNull())
        return Value::makeVoid();
    state_.append(newline ? arg.toString() + "\n" : arg.toString());
    return Value::makeVoid();
}

Value Evaluator::callMath(const std::string &method, const std::vector<Value> &args, uint32_t line)
{
    const std::string name = "Math." + method;

    if (method == "random")
    {
        expectArity(name, args, 0, line);
        return Value::makeDouble(state_.random());
    }
    if (method == "floor" || method == "ceil" || method == "round")
    {
        expectArity(name, args, 1, line);
        expectNumeric(name, args, line);
        if (args[0].isInt())
            return args[0];
        const double v = args[0].asDouble();
        if (method == "floor")
            return Value::makeInt(clampToInt(std::floor(v)));
        if (method == "ceil")
            return Value::makeInt(clampToInt(std::ceil(v)));
        return Value::makeInt(clampToInt(std::floor(v + 0.5)));
    }
    if (method == "abs")
    {
        expectArity(name, args, 1, line);
        expectNumeric(name, args, line);
        if (args[0].isInt())
            return Value::makeInt(
                static_cast<int32_t>(std::abs(static_cast<int64_t>(args[0].asInt()))));
        return Value::makeDouble(std::fabs(args[0].asDouble()));
    }
    if (method == "max" || method == "min")
    {
        expectArity(name, args, 2, line);
        expectNumeric(name, args, line);
        const bool isMax = method == "max";
        if (args[0].isInt() && args[1].isInt())
            return Value::makeInt(isMax ? std::max(args[0].asInt(), args[1].asInt())
                                        : std::min(args[0].asInt(), args[1].asInt()));
        return Value::makeDouble(isMax ? std::max(args[0].asDouble(), args[1].asDouble())
                                       : std::min(args[0].asDouble(), args[1].asDouble()));
    }
    if (method == "sqrt")
    {
        expectArity(name, args, 1, line);
        expectNumeric(name, args, line);
        return Value::makeDouble(std::sqrt(args[0].asDouble()));
    }
    if (method == "pow")
    {
        expectArity(name, args, 2, line);
        expectNumeric(name, args, line);
        return Value::makeDouble(std::pow(args[0].asDouble(), args[1].asDouble()));
    }
    if (method == "divide")
    {
        expectArity(name, args, 2, line);
        expectNumeric(name, args, line);
        if (handleViolations(state_.safety.checkDivision(args[0], args[1], line)))
            return Value::makeDouble(0.0);
        return Value::makeDouble(args[0].asDouble() / args[1].asDouble());
    }
    throw RuntimeError(line, "Unknown method: " + name);
}

Value Evaluator::callStringMethod(const std::string &text,
                                  const std::string &method,
                                  const std::vector<Value> &args,
                                  uint32_t line)
{
    const std::string name = "String." + method;

    if (method == "length")
    {
        expectArity(name, args, 0, line);
        return Value::makeInt(static_cast<int32_t>(text.size()));
    }
    if (method == "charAt")
    {
        expectArity(name, args, 1, line);
        if (!args[0].isInt())
            throw RuntimeError(line, "String.charAt expects an int index");
        if (handleViolations(state_.safety.checkArrayAccess(text.size(), args[0].asInt(), line)))
            return Value::makeString("");
        return Value::makeString(std::string(1, text[static_cast<size_t>(args[0].asInt())]));
    }
    if (method == "equals")
    {
        expectArity(name, args, 1, line);
        return Value::makeBool(args[0].isString() && args[0].asString() == text);
    }
    if (method == "isEmpty")
    {
        expectArity(name, args, 0, line);
        return Value::makeBool(text.empty());
    }
    if (method == "toUpperCase" || method == "toLowerCase")
    {
        expectArity(name, args, 0, line);
        std::string converted = text;
        const bool upper = method == "toUpperCase";
        std::transform(converted.begin(),
                       converted.end(),
                       converted.begin(),
                       [upper](unsigned char c)
                       { return static_cast<char>(upper ? std::toupper(c) : std::tolower(c)); });
        return Value::makeString(std::move(converted));
    }
    throw RuntimeError(line, "Unknown method: " + name);
}

Value Evaluator::sensorReading(const FieldDecl &field)
{
    const Annotation *sensor = field.findAnnotation(AnnotationKind::Sensor);
    const std::string type = sensor ? sensor->stringArg("type").value_or("") : std::string();
    const auto [low, high] = sensorRange(type);
    const double reading = low + state_.random() * (high - low);
    if (field.type.name == "int" && !field.type.isArray)
        return Value::makeInt(clampToInt(std::floor(reading)));
    return Value::makeDouble(reading);
}

} // namespace pulse::vm
