#include "typmin/hierarchy.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace typmin::hierarchy::test {

namespace {

using types::IntegerRange;
using types::PrimKind;
using types::Type;

ClassDecl make_class(std::string name,
                     std::optional<std::string> super_class = std::nullopt,
                     std::vector<std::string> interfaces = {})
{
    return ClassDecl{.name = std::move(name),
                     .super_class = std::move(super_class),
                     .interfaces = std::move(interfaces),
                     .is_interface = false};
}

ClassHierarchy make_number_hierarchy()
{
    auto hierarchy = ClassHierarchy::build({
        make_class("java.lang.Number", std::nullopt, {"java.io.Serializable"}),
        make_class("java.lang.Integer", "java.lang.Number", {"java.lang.Comparable"}),
        make_class("java.lang.Long", "java.lang.Number"),
        ClassDecl{.name = "java.lang.Comparable",
                  .super_class = std::nullopt,
                  .interfaces = {},
                  .is_interface = true},
    });
    EXPECT_TRUE(hierarchy.has_value()) << hierarchy.error().message;
    return std::move(*hierarchy);
}

}  // namespace

TEST(ClassHierarchyTest, TransitiveSubclassing)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_TRUE(hierarchy.is_subclass("java.lang.Number", "java.lang.Integer"));
    EXPECT_TRUE(hierarchy.is_subclass("java.io.Serializable", "java.lang.Integer"));
    EXPECT_TRUE(hierarchy.is_subclass("java.lang.Comparable", "java.lang.Integer"));
    EXPECT_TRUE(hierarchy.is_subclass("java.lang.Object", "java.lang.Integer"));
    EXPECT_FALSE(hierarchy.is_subclass("java.lang.Integer", "java.lang.Number"));
    EXPECT_FALSE(hierarchy.is_subclass("java.lang.Long", "java.lang.Integer"));
    EXPECT_FALSE(hierarchy.is_subclass("java.lang.Comparable", "java.lang.Long"));
}

TEST(ClassHierarchyTest, ImplicitClassesAreAdded)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_TRUE(hierarchy.contains("java.lang.Object"));
    EXPECT_TRUE(hierarchy.contains("java.lang.Cloneable"));
    EXPECT_TRUE(hierarchy.contains("java.io.Serializable"));
    EXPECT_EQ(hierarchy.size(), 7U);
}

TEST(ClassHierarchyTest, UnknownClassesOnlyHaveObjectAbove)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_TRUE(hierarchy.ancestor(Type::ref("java.lang.Object"), Type::ref("com.example.Unknown")));
    EXPECT_FALSE(hierarchy.ancestor(Type::ref("java.lang.Number"), Type::ref("com.example.Unknown")));
}

TEST(ClassHierarchyTest, RejectsDuplicateDeclarations)
{
    auto hierarchy = ClassHierarchy::build({make_class("A"), make_class("A")});
    ASSERT_FALSE(hierarchy);
    EXPECT_EQ(hierarchy.error().code, "DuplicateClass");
}

TEST(ClassHierarchyTest, RejectsCycles)
{
    auto hierarchy = ClassHierarchy::build({make_class("A", "B"), make_class("B", "C"),
                                            make_class("C", "A")});
    ASSERT_FALSE(hierarchy);
    EXPECT_EQ(hierarchy.error().code, "CyclicHierarchy");
}

TEST(ClassHierarchyTest, RejectsUnnamedClass)
{
    auto hierarchy = ClassHierarchy::build({make_class("")});
    ASSERT_FALSE(hierarchy);
    EXPECT_EQ(hierarchy.error().code, "InvalidClass");
}

TEST(ClassHierarchyTest, AncestorIsReflexive)
{
    const auto hierarchy = make_number_hierarchy();
    for (const Type& type : {Type::ref("java.lang.Integer"), Type::primitive(PrimKind::kInt),
                             Type::null(), Type::bottom(), Type::integer(IntegerRange::kZeroToOne),
                             Type::array_of(Type::primitive(PrimKind::kChar))}) {
        EXPECT_TRUE(hierarchy.ancestor(type, type)) << type.to_string();
        EXPECT_TRUE(hierarchy.types_equal(type, type)) << type.to_string();
    }
}

TEST(ClassHierarchyTest, BottomIsBelowEverything)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_TRUE(hierarchy.ancestor(Type::primitive(PrimKind::kLong), Type::bottom()));
    EXPECT_TRUE(hierarchy.ancestor(Type::ref("java.lang.Integer"), Type::bottom()));
    EXPECT_TRUE(hierarchy.ancestor(Type::null(), Type::bottom()));
    EXPECT_FALSE(hierarchy.ancestor(Type::bottom(), Type::primitive(PrimKind::kInt)));
}

TEST(ClassHierarchyTest, NullIsBelowReferencesOnly)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_TRUE(hierarchy.ancestor(Type::ref("java.lang.Integer"), Type::null()));
    EXPECT_TRUE(hierarchy.ancestor(Type::array_of(Type::primitive(PrimKind::kInt)), Type::null()));
    EXPECT_FALSE(hierarchy.ancestor(Type::primitive(PrimKind::kInt), Type::null()));
    EXPECT_FALSE(hierarchy.ancestor(Type::null(), Type::ref("java.lang.Integer")));
}

TEST(ClassHierarchyTest, IntegralLattice)
{
    const auto hierarchy = make_number_hierarchy();
    const Type z1 = Type::integer(IntegerRange::kZeroToOne);
    const Type z127 = Type::integer(IntegerRange::kZeroTo127);
    const Type z32767 = Type::integer(IntegerRange::kZeroTo32767);
    const Type boolean = Type::primitive(PrimKind::kBoolean);
    const Type byte = Type::primitive(PrimKind::kByte);
    const Type character = Type::primitive(PrimKind::kChar);
    const Type shorty = Type::primitive(PrimKind::kShort);
    const Type integer = Type::primitive(PrimKind::kInt);

    EXPECT_TRUE(hierarchy.ancestor(z127, z1));
    EXPECT_TRUE(hierarchy.ancestor(z32767, z127));
    EXPECT_TRUE(hierarchy.ancestor(boolean, z1));
    EXPECT_FALSE(hierarchy.ancestor(boolean, z127));
    EXPECT_TRUE(hierarchy.ancestor(byte, z127));
    EXPECT_FALSE(hierarchy.ancestor(byte, z32767));
    EXPECT_TRUE(hierarchy.ancestor(character, z32767));
    EXPECT_FALSE(hierarchy.ancestor(character, byte));
    EXPECT_TRUE(hierarchy.ancestor(shorty, byte));
    EXPECT_FALSE(hierarchy.ancestor(shorty, character));
    EXPECT_TRUE(hierarchy.ancestor(integer, character));
    EXPECT_TRUE(hierarchy.ancestor(integer, boolean));
    EXPECT_TRUE(hierarchy.ancestor(integer, z1));
    EXPECT_FALSE(hierarchy.ancestor(z1, integer));
    EXPECT_FALSE(hierarchy.ancestor(Type::primitive(PrimKind::kLong), integer));
}

TEST(ClassHierarchyTest, ArraysAreCovariantInReferenceElements)
{
    const auto hierarchy = make_number_hierarchy();
    const Type numbers = Type::array_of(Type::ref("java.lang.Number"));
    const Type integers = Type::array_of(Type::ref("java.lang.Integer"));

    EXPECT_TRUE(hierarchy.ancestor(numbers, integers));
    EXPECT_FALSE(hierarchy.ancestor(integers, numbers));
    EXPECT_TRUE(hierarchy.ancestor(Type::array_of(Type::ref("java.lang.Object")),
                                   Type::array_of(integers)));
}

TEST(ClassHierarchyTest, PrimitiveArraysAreInvariant)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_FALSE(hierarchy.ancestor(Type::array_of(Type::primitive(PrimKind::kInt)),
                                    Type::array_of(Type::primitive(PrimKind::kChar))));
    EXPECT_FALSE(hierarchy.ancestor(Type::array_of(Type::ref("java.lang.Object")),
                                    Type::array_of(Type::primitive(PrimKind::kInt))));
}

TEST(ClassHierarchyTest, ObjectLikeTypesAreAboveArrays)
{
    const auto hierarchy = make_number_hierarchy();
    const Type ints = Type::array_of(Type::primitive(PrimKind::kInt));

    for (const Type& top : types::object_like_types()) {
        EXPECT_TRUE(hierarchy.ancestor(top, ints)) << top.to_string();
    }
    EXPECT_FALSE(hierarchy.ancestor(Type::ref("java.lang.Number"), ints));
    EXPECT_FALSE(hierarchy.ancestor(ints, Type::ref("java.lang.Object")));
}

TEST(ClassHierarchyTest, PrimitivesAndReferencesAreUnrelated)
{
    const auto hierarchy = make_number_hierarchy();

    EXPECT_FALSE(hierarchy.ancestor(Type::ref("java.lang.Object"), Type::primitive(PrimKind::kInt)));
    EXPECT_FALSE(hierarchy.ancestor(Type::primitive(PrimKind::kInt), Type::ref("java.lang.Integer")));
}

}  // namespace typmin::hierarchy::test
