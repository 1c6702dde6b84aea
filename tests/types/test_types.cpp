#include "typmin/types.hpp"

#include <string>

#include <gtest/gtest.h>

namespace typmin::types::test {

namespace {

Type parse_or_fail(std::string_view text)
{
    auto parsed = parse_type(text);
    EXPECT_TRUE(parsed.has_value()) << (parsed ? "" : parsed.error().message);
    return parsed.value_or(Type::bottom());
}

}  // namespace

TEST(TypesTest, ParsesPrimitiveNames)
{
    EXPECT_EQ(parse_or_fail("int"), Type::primitive(PrimKind::kInt));
    EXPECT_EQ(parse_or_fail("boolean"), Type::primitive(PrimKind::kBoolean));
    EXPECT_EQ(parse_or_fail("ushort"), Type::primitive(PrimKind::kUShort));
}

TEST(TypesTest, ParsesInternalTypes)
{
    EXPECT_EQ(parse_or_fail("null_type"), Type::null());
    EXPECT_EQ(parse_or_fail("bottom_type"), Type::bottom());
    EXPECT_EQ(parse_or_fail("[0..1]"), Type::integer(IntegerRange::kZeroToOne));
    EXPECT_EQ(parse_or_fail("[0..127]"), Type::integer(IntegerRange::kZeroTo127));
    EXPECT_EQ(parse_or_fail("[0..32767]"), Type::integer(IntegerRange::kZeroTo32767));
}

TEST(TypesTest, ParsesClassAndArrayTypes)
{
    EXPECT_EQ(parse_or_fail("java.lang.String"), Type::ref("java.lang.String"));
    EXPECT_EQ(parse_or_fail("int[][]"),
              Type::array_of(Type::array_of(Type::primitive(PrimKind::kInt))));

    const Type strings = parse_or_fail("java.lang.String[]");
    ASSERT_NE(strings.element_type(), nullptr);
    EXPECT_TRUE(strings.element_type()->is_class("java.lang.String"));
}

TEST(TypesTest, RejectsMalformedNames)
{
    auto empty = parse_type("[]");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, "InvalidType");

    auto spaced = parse_type("java lang");
    ASSERT_FALSE(spaced);
    EXPECT_EQ(spaced.error().code, "InvalidType");
}

TEST(TypesTest, TextualFormIsParsedBack)
{
    for (const char* text :
         {"int", "ulong", "java.util.List", "byte[]", "[0..127][]", "null_type", "bottom_type"}) {
        EXPECT_EQ(parse_or_fail(text).to_string(), text);
    }
}

TEST(TypesTest, ArrayEqualityComparesElements)
{
    const Type a = Type::array_of(Type::ref("A"));
    const Type b = Type::array_of(Type::ref("A"));
    const Type c = Type::array_of(Type::ref("B"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, Type::ref("A"));
}

TEST(TypesTest, PlaceholdersAreNotAllowedInFinalCode)
{
    EXPECT_FALSE(Type::bottom().is_allowed_in_final_code());
    EXPECT_FALSE(Type::integer(IntegerRange::kZeroToOne).is_allowed_in_final_code());
    EXPECT_FALSE(Type::array_of(Type::integer(IntegerRange::kZeroTo127)).is_allowed_in_final_code());

    EXPECT_TRUE(Type::primitive(PrimKind::kInt).is_allowed_in_final_code());
    EXPECT_TRUE(Type::ref("java.lang.String").is_allowed_in_final_code());
    EXPECT_TRUE(Type::null().is_allowed_in_final_code());
}

TEST(TypesTest, DefaultFinalTypes)
{
    EXPECT_EQ(Type::integer(IntegerRange::kZeroToOne).default_final_type(),
              Type::primitive(PrimKind::kBoolean));
    EXPECT_EQ(Type::integer(IntegerRange::kZeroTo127).default_final_type(),
              Type::primitive(PrimKind::kByte));
    EXPECT_EQ(Type::integer(IntegerRange::kZeroTo32767).default_final_type(),
              Type::primitive(PrimKind::kShort));
    EXPECT_EQ(Type::bottom().default_final_type(), Type::ref(std::string(kObjectClass)));
    EXPECT_EQ(Type::array_of(Type::integer(IntegerRange::kZeroToOne)).default_final_type(),
              Type::array_of(Type::primitive(PrimKind::kBoolean)));

    const Type allowed = Type::ref("java.lang.String");
    EXPECT_EQ(allowed.default_final_type(), allowed);
}

TEST(TypesTest, DefaultFinalTypeIsAlwaysAllowed)
{
    for (const char* text : {"bottom_type", "[0..1]", "[0..127]", "[0..32767]", "[0..1][][]",
                             "bottom_type[]", "int", "null_type", "Foo[]"}) {
        EXPECT_TRUE(parse_or_fail(text).default_final_type().is_allowed_in_final_code()) << text;
    }
}

TEST(TypesTest, JavaProfileNames)
{
    auto name = type_as_string(Type::primitive(PrimKind::kByte), Profile::kJava);
    ASSERT_TRUE(name.has_value()) << name.error().message;
    EXPECT_EQ(*name, "byte");

    auto array_name = type_as_string(parse_or_fail("java.lang.String[][]"), Profile::kJava);
    ASSERT_TRUE(array_name.has_value()) << array_name.error().message;
    EXPECT_EQ(*array_name, "java.lang.String[][]");

    auto null_name = type_as_string(Type::null(), Profile::kJava);
    ASSERT_TRUE(null_name.has_value()) << null_name.error().message;
    EXPECT_EQ(*null_name, "null");
}

TEST(TypesTest, DotNetProfileNames)
{
    auto sbyte = type_as_string(Type::primitive(PrimKind::kByte), Profile::kDotNet);
    ASSERT_TRUE(sbyte.has_value()) << sbyte.error().message;
    EXPECT_EQ(*sbyte, "System.SByte");

    auto ushorts = type_as_string(Type::array_of(Type::primitive(PrimKind::kUShort)),
                                  Profile::kDotNet);
    ASSERT_TRUE(ushorts.has_value()) << ushorts.error().message;
    EXPECT_EQ(*ushorts, "System.UInt16[]");
}

TEST(TypesTest, UnsignedKindsAreUnsupportedUnderJava)
{
    auto name = type_as_string(Type::primitive(PrimKind::kUShort), Profile::kJava);
    ASSERT_FALSE(name);
    EXPECT_EQ(name.error().code, "Unsupported");

    auto nested = type_as_string(Type::array_of(Type::primitive(PrimKind::kULong)), Profile::kJava);
    ASSERT_FALSE(nested);
    EXPECT_EQ(nested.error().code, "Unsupported");
}

TEST(TypesTest, PlaceholdersHaveNoFinalName)
{
    auto name = type_as_string(Type::integer(IntegerRange::kZeroTo127), Profile::kJava);
    ASSERT_FALSE(name);
    EXPECT_EQ(name.error().code, "Unsupported");
}

TEST(TypesTest, ProfileNamesRoundTrip)
{
    for (Profile profile : {Profile::kJava, Profile::kDotNet}) {
        auto parsed = parse_profile(profile_name(profile));
        ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
        EXPECT_EQ(*parsed, profile);
    }
    EXPECT_FALSE(parse_profile("python"));
}

TEST(TypesTest, ObjectLikeTypes)
{
    const auto& tops = object_like_types();
    EXPECT_TRUE(tops[0].is_class(kObjectClass));
    EXPECT_TRUE(tops[1].is_class(kSerializableClass));
    EXPECT_TRUE(tops[2].is_class(kCloneableClass));
}

}  // namespace typmin::types::test
