#pragma once

/**
 * @file types.hpp
 * @brief Type catalog: closed set of type kinds seen by local-variable typing
 *
 * A Type is an immutable value. Kinds form a closed std::variant, so every
 * consumer handles them with std::visit instead of a visitor registry.
 */

#include "typmin/common.hpp"

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace typmin::types {

/// Well-known class names of the trivial top types
constexpr std::string_view kObjectClass = "java.lang.Object";
constexpr std::string_view kSerializableClass = "java.io.Serializable";
constexpr std::string_view kCloneableClass = "java.lang.Cloneable";

/**
 * Primitive kinds. The unsigned kinds only have a finalized-code
 * name under the .NET front-end profile.
 */
enum class PrimKind {
    kBoolean,
    kByte,
    kChar,
    kShort,
    kInt,
    kLong,
    kFloat,
    kDouble,
    kVoid,
    kUByte,
    kUShort,
    kUInt,
    kULong,
};

/**
 * Internal integer placeholders produced by constant typing. They narrow
 * the value range of an integer constant and never reach emitted code.
 */
enum class IntegerRange {
    kZeroToOne,    ///< [0..1]
    kZeroTo127,    ///< [0..127]
    kZeroTo32767,  ///< [0..32767]
};

/// Front-end profile used for finalized-code type names
enum class Profile {
    kJava,
    kDotNet,
};

class Type;

struct PrimType
{
    PrimKind kind;

    [[nodiscard]] bool operator==(const PrimType&) const = default;
};

struct RefType
{
    std::string class_name;

    [[nodiscard]] bool operator==(const RefType&) const = default;
};

struct ArrayType
{
    std::shared_ptr<const Type> element;

    [[nodiscard]] bool operator==(const ArrayType& other) const;
};

struct NullType
{
    [[nodiscard]] bool operator==(const NullType&) const = default;
};

struct BottomType
{
    [[nodiscard]] bool operator==(const BottomType&) const = default;
};

struct IntegerPlaceholder
{
    IntegerRange range;

    [[nodiscard]] bool operator==(const IntegerPlaceholder&) const = default;
};

class Type
{
public:
    using Kind = std::variant<PrimType, RefType, ArrayType, NullType, BottomType, IntegerPlaceholder>;

    [[nodiscard]] static Type primitive(PrimKind kind);
    [[nodiscard]] static Type ref(std::string class_name);
    [[nodiscard]] static Type array_of(Type element);
    [[nodiscard]] static Type null();
    [[nodiscard]] static Type bottom();
    [[nodiscard]] static Type integer(IntegerRange range);

    [[nodiscard]] const Kind& kind() const { return m_kind; }

    template <typename T>
    [[nodiscard]] bool is() const
    {
        return std::holds_alternative<T>(m_kind);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const
    {
        return std::get_if<T>(&m_kind);
    }

    /// True if this is a reference type named @p class_name
    [[nodiscard]] bool is_class(std::string_view class_name) const;

    /// Element type of an array, nullptr for every other kind
    [[nodiscard]] const Type* element_type() const;

    /**
     * Whether the type may appear in emitted code. Internal placeholders
     * (bottom, integer ranges, arrays of those) may not.
     */
    [[nodiscard]] bool is_allowed_in_final_code() const;

    /**
     * Replacement used by finalization. Defined for every type; returns the
     * type itself when it is already allowed in final code.
     */
    [[nodiscard]] Type default_final_type() const;

    /// Textual form, accepted back by parse_type()
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const Type& other) const = default;

private:
    explicit Type(Kind kind)
        : m_kind(std::move(kind))
    {}

    Kind m_kind;
};

/**
 * Parse the textual form of a type.
 *
 * Accepts primitive names ("int", "ushort", ...), "null_type", "bottom_type",
 * the placeholders "[0..1]", "[0..127]", "[0..32767]", class names and any of
 * these followed by one or more "[]".
 */
[[nodiscard]] typmin::Result<Type> parse_type(std::string_view text);

[[nodiscard]] typmin::Result<Profile> parse_profile(std::string_view text);

[[nodiscard]] std::string_view profile_name(Profile profile);

/**
 * Name of a finalized type in emitted code for the given front-end profile.
 *
 * Fails with code "Unsupported" for kinds the profile has no name for and
 * for types that are not allowed in final code.
 */
[[nodiscard]] typmin::Result<std::string> type_as_string(const Type& type, Profile profile);

/// {Object, Serializable, Cloneable}: the types every array is assignable to
[[nodiscard]] const std::array<Type, 3>& object_like_types();

}  // namespace typmin::types
