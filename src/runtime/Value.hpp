//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/Value.hpp
// Purpose: Tagged runtime value manipulated by the evaluator.
// Key invariants: The variant alternative always matches kind(); scalar values
//                 are immutable, arrays and objects are shared references.
// Ownership/Lifetime: Values own scalars by value and share array/object
//                     payloads through std::shared_ptr.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pulse::runtime
{

/// @brief Closed set of runtime value kinds.
enum class ValueKind
{
    Int,     ///< 32-bit two's complement integer
    Double,  ///< IEEE double
    String,  ///< Immutable text
    Boolean, ///< true/false
    Null,    ///< The null reference
    Void,    ///< Result of a void call; never stored by user code
    Array,   ///< Shared one-dimensional array
    Object,  ///< Shared class instance
};

/// @brief Name of @p kind as used in runtime error messages.
const char *valueKindToString(ValueKind kind);

struct ArrayObject;
struct ObjectInstance;
using ArrayRef = std::shared_ptr<ArrayObject>;
using ObjectRef = std::shared_ptr<ObjectInstance>;

/// @brief Runtime value.
class Value
{
  public:
    /// @brief Default-constructed values are Void.
    Value() = default;

    static Value makeInt(int32_t v);
    static Value makeDouble(double v);
    static Value makeString(std::string v);
    static Value makeBool(bool v);
    static Value makeNull();
    static Value makeVoid();
    static Value makeArray(ArrayRef array);
    static Value makeObject(ObjectRef object);

    [[nodiscard]] ValueKind kind() const;

    [[nodiscard]] bool isInt() const
    {
        return kind() == ValueKind::Int;
    }

    [[nodiscard]] bool isDouble() const
    {
        return kind() == ValueKind::Double;
    }

    [[nodiscard]] bool isNumeric() const
    {
        return isInt() || isDouble();
    }

    [[nodiscard]] bool isString() const
    {
        return kind() == ValueKind::String;
    }

    [[nodiscard]] bool isBool() const
    {
        return kind() == ValueKind::Boolean;
    }

    [[nodiscard]] bool isNull() const
    {
        return kind() == ValueKind::Null;
    }

    [[nodiscard]] bool isVoid() const
    {
        return kind() == ValueKind::Void;
    }

    [[nodiscard]] bool isArray() const
    {
        return kind() == ValueKind::Array;
    }

    [[nodiscard]] bool isObject() const
    {
        return kind() == ValueKind::Object;
    }

    /// @brief Integer payload; requires isInt().
    int32_t asInt() const;

    /// @brief Numeric payload widened to double; requires isNumeric().
    double asDouble() const;

    /// @brief String payload; requires isString().
    const std::string &asString() const;

    /// @brief Boolean payload; requires isBool().
    bool asBool() const;

    /// @brief Array payload; requires isArray().
    const ArrayRef &asArray() const;

    /// @brief Object payload; requires isObject().
    const ObjectRef &asObject() const;

    /// @brief Nominal size used for heap accounting.
    /// @details int 4, double 8, boolean 1, string 2 per character, null and
    ///          void 0, array length times element size, object sum of its
    ///          field sizes with a minimum of 8. References nested inside an
    ///          array or object count 8 bytes.
    [[nodiscard]] size_t sizeBytes() const;

    /// @brief Display form used by `System.out.println` and concatenation.
    [[nodiscard]] std::string toString() const;

    /// @brief Value equality for `==`: numbers numerically, strings by
    ///        content, references by identity.
    [[nodiscard]] bool equals(const Value &other) const;

  private:
    struct NullTag
    {
    };

    struct VoidTag
    {
    };

    using Storage =
        std::variant<VoidTag, int32_t, double, std::string, bool, NullTag, ArrayRef, ObjectRef>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_{};
};

/// @brief Shared array payload.
struct ArrayObject
{
    std::string elementType; ///< "int", "double", "boolean", "String" or a class name
    std::vector<Value> elements;
    uint64_t identity = 0; ///< Per-run display identity
    uint64_t version = 0;  ///< Bumped by every element store
};

/// @brief Shared class instance payload.
struct ObjectInstance
{
    std::string className;
    std::map<std::string, Value> fields;
    uint64_t identity = 0; ///< Per-run display identity
    uint64_t version = 0;  ///< Bumped by every field store
};

/// @brief Nominal size of one element of an array of @p elementType.
size_t elementSize(const std::string &elementType);

/// @brief Bytes @p value adds to the object holding it in a field.
/// @details Arrays and objects count as an 8 byte reference; strings count
///          their payload.
size_t nestedSize(const Value &value);

/// @brief Change in an array's size when an element @p before becomes @p after.
std::ptrdiff_t elementStoreDelta(const Value &before, const Value &after);

/// @brief Change in @p object's size when field @p name becomes @p after.
std::ptrdiff_t fieldStoreDelta(const ObjectInstance &object,
                               const std::string &name,
                               const Value &after);

/// @brief Declared-type style name of @p value: `int`, `String`, `double[]`,
///        the class name of an object, or `null`.
std::string typeNameOf(const Value &value);

/// @brief Default value for a variable or field declared with @p typeName.
/// @details int 0, double 0.0, boolean false, String "" and null for arrays
///          and class types.
Value defaultValueFor(const std::string &typeName, bool isArray);

/// @brief Default value for a freshly allocated array element.
/// @details Like defaultValueFor() except that String elements start as null.
Value defaultElementFor(const std::string &elementType);

/// @brief Java-style rendering of a double (`3.0`, `0.1`, `NaN`, `Infinity`).
std::string formatDouble(double value);

} // namespace pulse::runtime
