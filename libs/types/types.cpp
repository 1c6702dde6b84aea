/**
 * @file types.cpp
 * @brief Type catalog: construction, finalization defaults, textual forms
 */

#include "typmin/types.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <ranges>
#include <utility>

namespace typmin::types {

namespace {

struct PrimInfo
{
    PrimKind kind;
    std::string_view name;
    std::string_view java_name;    ///< Empty when the Java profile has no such type
    std::string_view dotnet_name;
};

constexpr std::array<PrimInfo, 13> kPrimTable{{
    {  .kind = PrimKind::kBoolean,  .name = "boolean",  .java_name = "boolean", .dotnet_name = "System.Boolean"},
    {     .kind = PrimKind::kByte,     .name = "byte",     .java_name = "byte",   .dotnet_name = "System.SByte"},
    {     .kind = PrimKind::kChar,     .name = "char",     .java_name = "char",    .dotnet_name = "System.Char"},
    {    .kind = PrimKind::kShort,    .name = "short",    .java_name = "short",   .dotnet_name = "System.Int16"},
    {      .kind = PrimKind::kInt,      .name = "int",      .java_name = "int",   .dotnet_name = "System.Int32"},
    {     .kind = PrimKind::kLong,     .name = "long",     .java_name = "long",   .dotnet_name = "System.Int64"},
    {    .kind = PrimKind::kFloat,    .name = "float",    .java_name = "float",  .dotnet_name = "System.Single"},
    {   .kind = PrimKind::kDouble,   .name = "double",   .java_name = "double",  .dotnet_name = "System.Double"},
    {     .kind = PrimKind::kVoid,     .name = "void",     .java_name = "void",    .dotnet_name = "System.Void"},
    {    .kind = PrimKind::kUByte,    .name = "ubyte",         .java_name = "",    .dotnet_name = "System.Byte"},
    {   .kind = PrimKind::kUShort,   .name = "ushort",         .java_name = "",  .dotnet_name = "System.UInt16"},
    {     .kind = PrimKind::kUInt,     .name = "uint",         .java_name = "",  .dotnet_name = "System.UInt32"},
    {    .kind = PrimKind::kULong,    .name = "ulong",         .java_name = "",  .dotnet_name = "System.UInt64"},
}};

constexpr std::string_view kNullTypeName = "null_type";
constexpr std::string_view kBottomTypeName = "bottom_type";
constexpr std::string_view kArraySuffix = "[]";

[[nodiscard]] const PrimInfo& prim_info(PrimKind kind)
{
    const auto it = std::ranges::find(kPrimTable, kind, &PrimInfo::kind);
    return *it;
}

[[nodiscard]] std::string_view range_name(IntegerRange range)
{
    switch (range) {
        case IntegerRange::kZeroToOne:
            return "[0..1]";
        case IntegerRange::kZeroTo127:
            return "[0..127]";
        case IntegerRange::kZeroTo32767:
            return "[0..32767]";
    }
    return "[0..?]";
}

[[nodiscard]] PrimKind range_default(IntegerRange range)
{
    switch (range) {
        case IntegerRange::kZeroToOne:
            return PrimKind::kBoolean;
        case IntegerRange::kZeroTo127:
            return PrimKind::kByte;
        case IntegerRange::kZeroTo32767:
            return PrimKind::kShort;
    }
    return PrimKind::kInt;
}

[[nodiscard]] std::optional<Type> parse_base_type(std::string_view text)
{
    if (const auto it = std::ranges::find(kPrimTable, text, &PrimInfo::name);
        it != kPrimTable.end()) {
        return Type::primitive(it->kind);
    }
    for (auto range :
         {IntegerRange::kZeroToOne, IntegerRange::kZeroTo127, IntegerRange::kZeroTo32767}) {
        if (text == range_name(range)) {
            return Type::integer(range);
        }
    }
    if (text == kNullTypeName) {
        return Type::null();
    }
    if (text == kBottomTypeName) {
        return Type::bottom();
    }
    return std::nullopt;
}

[[nodiscard]] bool is_class_name_char(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.'
           || c == '_' || c == '$' || c == '/' || c == '`' || c == '+';
}

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

}  // namespace

bool ArrayType::operator==(const ArrayType& other) const
{
    if (element == other.element) {
        return true;
    }
    if (!element || !other.element) {
        return false;
    }
    return *element == *other.element;
}

Type Type::primitive(PrimKind kind)
{
    return Type(PrimType{.kind = kind});
}

Type Type::ref(std::string class_name)
{
    return Type(RefType{.class_name = std::move(class_name)});
}

Type Type::array_of(Type element)
{
    return Type(ArrayType{.element = std::make_shared<const Type>(std::move(element))});
}

Type Type::null()
{
    return Type(NullType{});
}

Type Type::bottom()
{
    return Type(BottomType{});
}

Type Type::integer(IntegerRange range)
{
    return Type(IntegerPlaceholder{.range = range});
}

bool Type::is_class(std::string_view class_name) const
{
    const auto* ref_type = get_if<RefType>();
    return ref_type != nullptr && ref_type->class_name == class_name;
}

const Type* Type::element_type() const
{
    const auto* array = get_if<ArrayType>();
    return array != nullptr ? array->element.get() : nullptr;
}

bool Type::is_allowed_in_final_code() const
{
    return std::visit(Overloaded{
                          [](const ArrayType& array) {
                              return array.element->is_allowed_in_final_code();
                          },
                          [](const BottomType&) { return false; },
                          [](const IntegerPlaceholder&) { return false; },
                          [](const auto&) { return true; },
                      },
                      m_kind);
}

Type Type::default_final_type() const
{
    return std::visit(Overloaded{
                          [](const ArrayType& array) {
                              return Type::array_of(array.element->default_final_type());
                          },
                          [](const BottomType&) { return Type::ref(std::string(kObjectClass)); },
                          [](const IntegerPlaceholder& placeholder) {
                              return Type::primitive(range_default(placeholder.range));
                          },
                          [this](const auto&) { return *this; },
                      },
                      m_kind);
}

std::string Type::to_string() const
{
    return std::visit(Overloaded{
                          [](const PrimType& prim) { return std::string(prim_info(prim.kind).name); },
                          [](const RefType& ref_type) { return ref_type.class_name; },
                          [](const ArrayType& array) {
                              return array.element->to_string() + std::string(kArraySuffix);
                          },
                          [](const NullType&) { return std::string(kNullTypeName); },
                          [](const BottomType&) { return std::string(kBottomTypeName); },
                          [](const IntegerPlaceholder& placeholder) {
                              return std::string(range_name(placeholder.range));
                          },
                      },
                      m_kind);
}

typmin::Result<Type> parse_type(std::string_view text)
{
    std::size_t dimensions = 0;
    std::string_view base = text;
    while (base.ends_with(kArraySuffix)) {
        base.remove_suffix(kArraySuffix.size());
        ++dimensions;
    }
    if (base.empty()) {
        return std::unexpected(
            Error::make("InvalidType", std::format("Empty type name in '{}'", text)));
    }

    std::optional<Type> parsed = parse_base_type(base);
    if (!parsed) {
        if (!std::ranges::all_of(base, is_class_name_char)) {
            return std::unexpected(
                Error::make("InvalidType", std::format("Malformed type name: '{}'", text)));
        }
        parsed = Type::ref(std::string(base));
    }

    Type result = std::move(*parsed);
    for (std::size_t i = 0; i < dimensions; ++i) {
        result = Type::array_of(std::move(result));
    }
    return result;
}

typmin::Result<Profile> parse_profile(std::string_view text)
{
    if (text == "java") {
        return Profile::kJava;
    }
    if (text == "dotnet") {
        return Profile::kDotNet;
    }
    return std::unexpected(Error::make("InvalidArgument",
                                       std::format("Unknown front-end profile: '{}'", text)));
}

std::string_view profile_name(Profile profile)
{
    return profile == Profile::kDotNet ? "dotnet" : "java";
}

typmin::Result<std::string> type_as_string(const Type& type, Profile profile)
{
    if (!type.is_allowed_in_final_code()) {
        return std::unexpected(Error::make(
            "Unsupported",
            std::format("Type '{}' has no name in finalized code", type.to_string())));
    }

    if (const auto* prim = type.get_if<PrimType>()) {
        const PrimInfo& info = prim_info(prim->kind);
        const std::string_view name = profile == Profile::kJava ? info.java_name : info.dotnet_name;
        if (name.empty()) {
            return std::unexpected(Error::make("Unsupported",
                                               std::format("Type '{}' is not supported by the {} "
                                                           "profile",
                                                           info.name,
                                                           profile_name(profile))));
        }
        return std::string(name);
    }
    if (const auto* element = type.element_type()) {
        auto element_name = type_as_string(*element, profile);
        if (!element_name) {
            return std::unexpected(element_name.error());
        }
        return *element_name + std::string(kArraySuffix);
    }
    if (type.is<NullType>()) {
        return std::string("null");
    }
    return type.to_string();
}

const std::array<Type, 3>& object_like_types()
{
    static const std::array<Type, 3> kTypes{
        Type::ref(std::string(kObjectClass)),
        Type::ref(std::string(kSerializableClass)),
        Type::ref(std::string(kCloneableClass)),
    };
    return kTypes;
}

}  // namespace typmin::types
