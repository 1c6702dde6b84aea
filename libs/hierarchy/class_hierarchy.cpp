/**
 * @file class_hierarchy.cpp
 * @brief Class-table hierarchy oracle with the bytecode primitive lattice
 */

#include "typmin/hierarchy.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <utility>

namespace typmin::hierarchy {

namespace {

using types::IntegerPlaceholder;
using types::IntegerRange;
using types::PrimKind;
using types::PrimType;
using types::Type;

enum class VisitState {
    kUnvisited,
    kInProgress,
    kDone,
};

struct ClosureBuilder
{
    const std::map<std::string, std::vector<std::string>>& direct_supers;
    std::unordered_map<std::string, std::unordered_set<std::string>>& closure;
    std::unordered_map<std::string, VisitState> state{};

    typmin::VoidResult visit(const std::string& name)
    {
        auto& current = state[name];
        if (current == VisitState::kDone) {
            return {};
        }
        if (current == VisitState::kInProgress) {
            return std::unexpected(Error::make(
                "CyclicHierarchy", std::format("Class '{}' inherits from itself", name)));
        }
        current = VisitState::kInProgress;

        std::unordered_set<std::string> supertypes{name};
        for (const auto& super_name : direct_supers.at(name)) {
            if (auto result = visit(super_name); !result) {
                return result;
            }
            const auto& inherited = closure.at(super_name);
            supertypes.insert(inherited.begin(), inherited.end());
        }
        closure.emplace(name, std::move(supertypes));
        state[name] = VisitState::kDone;
        return {};
    }
};

/// Placeholders and the integral primitives, ranked for the lattice table
enum class IntegralKind {
    kZeroToOne,
    kZeroTo127,
    kZeroTo32767,
    kBoolean,
    kByte,
    kChar,
    kShort,
    kInt,
};

[[nodiscard]] std::optional<IntegralKind> integral_kind(const Type& type)
{
    if (const auto* placeholder = type.get_if<IntegerPlaceholder>()) {
        switch (placeholder->range) {
            case IntegerRange::kZeroToOne:
                return IntegralKind::kZeroToOne;
            case IntegerRange::kZeroTo127:
                return IntegralKind::kZeroTo127;
            case IntegerRange::kZeroTo32767:
                return IntegralKind::kZeroTo32767;
        }
        return std::nullopt;
    }
    if (const auto* prim = type.get_if<PrimType>()) {
        switch (prim->kind) {
            case PrimKind::kBoolean:
                return IntegralKind::kBoolean;
            case PrimKind::kByte:
                return IntegralKind::kByte;
            case PrimKind::kChar:
                return IntegralKind::kChar;
            case PrimKind::kShort:
                return IntegralKind::kShort;
            case PrimKind::kInt:
                return IntegralKind::kInt;
            default:
                return std::nullopt;
        }
    }
    return std::nullopt;
}

/**
 * Strict ordering of the integral lattice. Each entry lists the kinds an
 * ancestor is strictly above.
 */
[[nodiscard]] bool integral_ancestor(IntegralKind ancestor, IntegralKind child)
{
    using enum IntegralKind;
    switch (ancestor) {
        case kZeroToOne:
            return false;
        case kBoolean:
        case kZeroTo127:
            return child == kZeroToOne;
        case kByte:
        case kZeroTo32767:
            return child == kZeroToOne || child == kZeroTo127;
        case kChar:
            return child == kZeroToOne || child == kZeroTo127 || child == kZeroTo32767;
        case kShort:
            return child == kZeroToOne || child == kZeroTo127 || child == kZeroTo32767
                   || child == kByte;
        case kInt:
            return child != kInt;
    }
    return false;
}

[[nodiscard]] bool is_reference_like(const Type& type)
{
    return type.is<types::RefType>() || type.is<types::ArrayType>();
}

}  // namespace

typmin::Result<ClassHierarchy> ClassHierarchy::build(const std::vector<ClassDecl>& classes)
{
    const std::string object_name(types::kObjectClass);
    std::map<std::string, std::vector<std::string>> direct_supers;

    for (const auto& decl : classes) {
        if (decl.name.empty()) {
            return std::unexpected(Error::make("InvalidClass", "Class declaration without a name"));
        }
        std::vector<std::string> supers;
        if (decl.super_class.has_value()) {
            supers.push_back(*decl.super_class);
        } else if (decl.name != object_name) {
            supers.push_back(object_name);
        }
        supers.insert(supers.end(), decl.interfaces.begin(), decl.interfaces.end());
        if (!direct_supers.emplace(decl.name, std::move(supers)).second) {
            return std::unexpected(Error::make(
                "DuplicateClass", std::format("Class '{}' is declared more than once", decl.name)));
        }
    }

    // Well-known roots and names referenced without a declaration
    std::vector<std::string> implicit{object_name,
                                      std::string(types::kSerializableClass),
                                      std::string(types::kCloneableClass)};
    for (const auto& [name, supers] : direct_supers) {
        implicit.insert(implicit.end(), supers.begin(), supers.end());
    }
    for (const auto& name : implicit) {
        if (direct_supers.contains(name)) {
            continue;
        }
        std::vector<std::string> supers;
        if (name != object_name) {
            supers.push_back(object_name);
        }
        direct_supers.emplace(name, std::move(supers));
    }

    ClassHierarchy hierarchy;
    ClosureBuilder builder{.direct_supers = direct_supers, .closure = hierarchy.m_supertypes};
    for (const auto& [name, supers] : direct_supers) {
        if (auto result = builder.visit(name); !result) {
            return std::unexpected(result.error());
        }
    }
    return hierarchy;
}

bool ClassHierarchy::contains(std::string_view class_name) const
{
    return m_supertypes.contains(std::string(class_name));
}

bool ClassHierarchy::is_subclass(std::string_view ancestor, std::string_view child) const
{
    if (ancestor == child || ancestor == types::kObjectClass) {
        return true;
    }
    auto it = m_supertypes.find(std::string(child));
    if (it == m_supertypes.end()) {
        return false;
    }
    return it->second.contains(std::string(ancestor));
}

bool ClassHierarchy::types_equal(const Type& a, const Type& b) const
{
    return a == b;
}

bool ClassHierarchy::ancestor(const Type& ancestor, const Type& child) const
{
    if (types_equal(ancestor, child)) {
        return true;
    }
    if (child.is<types::BottomType>()) {
        return true;
    }
    if (ancestor.is<types::BottomType>() || ancestor.is<types::NullType>()) {
        return false;
    }
    if (child.is<types::NullType>()) {
        return is_reference_like(ancestor);
    }

    const auto ancestor_integral = integral_kind(ancestor);
    const auto child_integral = integral_kind(child);
    if (ancestor_integral && child_integral) {
        return integral_ancestor(*ancestor_integral, *child_integral);
    }

    const auto* ancestor_ref = ancestor.get_if<types::RefType>();
    if (ancestor_ref != nullptr) {
        if (const auto* child_ref = child.get_if<types::RefType>()) {
            return is_subclass(ancestor_ref->class_name, child_ref->class_name);
        }
        if (child.is<types::ArrayType>()) {
            return std::ranges::any_of(types::object_like_types(),
                                       [&ancestor](const Type& top) { return top == ancestor; });
        }
        return false;
    }

    const Type* ancestor_element = ancestor.element_type();
    const Type* child_element = child.element_type();
    if (ancestor_element != nullptr && child_element != nullptr) {
        // Primitive element types only match exactly, which types_equal covered
        if (!is_reference_like(*ancestor_element)) {
            return false;
        }
        return this->ancestor(*ancestor_element, *child_element);
    }
    return false;
}

}  // namespace typmin::hierarchy
