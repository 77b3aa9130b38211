//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Value.cpp
// Purpose: Construction, sizing and display of runtime values.
// Key invariants: An array's size counts its slots plus the payload of its
//                 string elements.
//
//===----------------------------------------------------------------------===//

#include "runtime/Value.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace pulse::runtime
{

const char *valueKindToString(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::String:
            return "String";
        case ValueKind::Boolean:
            return "boolean";
        case ValueKind::Null:
            return "null";
        case ValueKind::Void:
            return "void";
        case ValueKind::Array:
            return "array";
        case ValueKind::Object:
            return "object";
    }
    return "unknown";
}

Value Value::makeInt(int32_t v)
{
    return Value(Storage(std::in_place_type<int32_t>, v));
}

Value Value::makeDouble(double v)
{
    return Value(Storage(std::in_place_type<double>, v));
}

Value Value::makeString(std::string v)
{
    return Value(Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::makeBool(bool v)
{
    return Value(Storage(std::in_place_type<bool>, v));
}

Value Value::makeNull()
{
    return Value(Storage(std::in_place_type<NullTag>));
}

Value Value::makeVoid()
{
    return Value();
}

Value Value::makeArray(ArrayRef array)
{
    if (!array)
        return makeNull();
    return Value(Storage(std::in_place_type<ArrayRef>, std::move(array)));
}

Value Value::makeObject(ObjectRef object)
{
    if (!object)
        return makeNull();
    return Value(Storage(std::in_place_type<ObjectRef>, std::move(object)));
}

ValueKind Value::kind() const
{
    switch (data_.index())
    {
        case 0:
            return ValueKind::Void;
        case 1:
            return ValueKind::Int;
        case 2:
            return ValueKind::Double;
        case 3:
            return ValueKind::String;
        case 4:
            return ValueKind::Boolean;
        case 5:
            return ValueKind::Null;
        case 6:
            return ValueKind::Array;
        default:
            return ValueKind::Object;
    }
}

int32_t Value::asInt() const
{
    return std::get<int32_t>(data_);
}

double Value::asDouble() const
{
    if (const auto *i = std::get_if<int32_t>(&data_))
        return static_cast<double>(*i);
    return std::get<double>(data_);
}

const std::string &Value::asString() const
{
    return std::get<std::string>(data_);
}

bool Value::asBool() const
{
    return std::get<bool>(data_);
}

const ArrayRef &Value::asArray() const
{
    return std::get<ArrayRef>(data_);
}

const ObjectRef &Value::asObject() const
{
    return std::get<ObjectRef>(data_);
}

size_t elementSize(const std::string &elementType)
{
    if (elementType == "int")
        return 4;
    if (elementType == "double")
        return 8;
    if (elementType == "boolean")
        return 1;
    return 8;
}

namespace
{
/// @brief Bytes an array element adds beyond its slot.
size_t elementPayload(const Value &v)
{
    return v.isString() ? 2 * v.asString().size() : 0;
}

size_t objectSize(size_t fieldBytes)
{
    return fieldBytes < 8 ? 8 : fieldBytes;
}
} // namespace

size_t nestedSize(const Value &value)
{
    if (value.isArray() || value.isObject())
        return 8;
    return value.sizeBytes();
}

std::ptrdiff_t elementStoreDelta(const Value &before, const Value &after)
{
    return static_cast<std::ptrdiff_t>(elementPayload(after)) -
           static_cast<std::ptrdiff_t>(elementPayload(before));
}

std::ptrdiff_t fieldStoreDelta(const ObjectInstance &object,
                               const std::string &name,
                               const Value &after)
{
    size_t fieldBytes = 0;
    for (const auto &[fieldName, field] : object.fields)
        fieldBytes += nestedSize(field);
    size_t updated = fieldBytes + nestedSize(after);
    auto it = object.fields.find(name);
    if (it != object.fields.end())
        updated -= nestedSize(it->second);
    return static_cast<std::ptrdiff_t>(objectSize(updated)) -
           static_cast<std::ptrdiff_t>(objectSize(fieldBytes));
}

size_t Value::sizeBytes() const
{
    switch (kind())
    {
        case ValueKind::Int:
            return 4;
        case ValueKind::Double:
            return 8;
        case ValueKind::String:
            return 2 * asString().size();
        case ValueKind::Boolean:
            return 1;
        case ValueKind::Null:
        case ValueKind::Void:
            return 0;
        case ValueKind::Array:
        {
            const auto &arr = *asArray();
            size_t total = arr.elements.size() * elementSize(arr.elementType);
            for (const auto &e : arr.elements)
                total += elementPayload(e);
            return total;
        }
        case ValueKind::Object:
        {
            size_t total = 0;
            for (const auto &[name, field] : asObject()->fields)
                total += nestedSize(field);
            return objectSize(total);
        }
    }
    return 8;
}

std::string formatDouble(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value > 0 ? "Infinity" : "-Infinity";

    if (value == std::floor(value) && std::fabs(value) < 1e15)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f", value);
        return buf;
    }

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc())
        return "NaN";
    return std::string(buf, ptr);
}

std::string Value::toString() const
{
    switch (kind())
    {
        case ValueKind::Int:
            return std::to_string(asInt());
        case ValueKind::Double:
            return formatDouble(std::get<double>(data_));
        case ValueKind::String:
            return asString();
        case ValueKind::Boolean:
            return asBool() ? "true" : "false";
        case ValueKind::Null:
            return "null";
        case ValueKind::Void:
            return "";
        case ValueKind::Array:
        {
            std::string out = "[";
            const auto &elements = asArray()->elements;
            for (size_t i = 0; i < elements.size(); ++i)
            {
                if (i)
                    out += ", ";
                const Value &e = elements[i];
                // Nested containers print by identity to keep cycles finite.
                if (e.isArray())
                    out += e.asArray()->elementType + "[]@" + std::to_string(e.asArray()->identity);
                else if (e.isObject())
                    out += e.asObject()->className + "@" + std::to_string(e.asObject()->identity);
                else
                    out += e.toString();
            }
            out += "]";
            return out;
        }
        case ValueKind::Object:
            return asObject()->className + "@" + std::to_string(asObject()->identity);
    }
    return "";
}

bool Value::equals(const Value &other) const
{
    if (isNumeric() && other.isNumeric())
    {
        if (isInt() && other.isInt())
            return asInt() == other.asInt();
        return asDouble() == other.asDouble();
    }
    if (kind() != other.kind())
        return false;
    switch (kind())
    {
        case ValueKind::String:
            return asString() == other.asString();
        case ValueKind::Boolean:
            return asBool() == other.asBool();
        case ValueKind::Null:
        case ValueKind::Void:
            return true;
        case ValueKind::Array:
            return asArray() == other.asArray();
        case ValueKind::Object:
            return asObject() == other.asObject();
        default:
            return false;
    }
}

std::string typeNameOf(const Value &value)
{
    if (value.isArray())
        return value.asArray()->elementType + "[]";
    if (value.isObject())
        return value.asObject()->className;
    return valueKindToString(value.kind());
}

Value defaultValueFor(const std::string &typeName, bool isArray)
{
    if (isArray)
        return Value::makeNull();
    if (typeName == "int")
        return Value::makeInt(0);
    if (typeName == "double")
        return Value::makeDouble(0.0);
    if (typeName == "boolean")
        return Value::makeBool(false);
    if (typeName == "String")
        return Value::makeString("");
    if (typeName == "void")
        return Value::makeVoid();
    return Value::makeNull();
}

Value defaultElementFor(const std::string &elementType)
{
    if (elementType == "String")
        return Value::makeNull();
    return defaultValueFor(elementType, false);
}

} // namespace pulse::runtime
