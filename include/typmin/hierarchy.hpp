#pragma once

/**
 * @file hierarchy.hpp
 * @brief Hierarchy oracle: subtype and equality queries over the type lattice
 */

#include "typmin/common.hpp"
#include "typmin/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace typmin::hierarchy {

/**
 * @brief Read-only oracle consumed by typing minimization.
 *
 * Implementations must be safe to call concurrently from several threads
 * without external synchronization.
 */
class Hierarchy
{
public:
    virtual ~Hierarchy() = default;

    /// True iff @p ancestor is a supertype of, or the same type as, @p child
    [[nodiscard]] virtual bool ancestor(const types::Type& ancestor,
                                        const types::Type& child) const = 0;

    /// Type-denotation equality, independent of representation
    [[nodiscard]] virtual bool types_equal(const types::Type& a, const types::Type& b) const = 0;
};

struct ClassDecl
{
    std::string name;
    std::optional<std::string> super_class;  ///< java.lang.Object when absent
    std::vector<std::string> interfaces;
    bool is_interface = false;
};

/**
 * @brief Hierarchy backed by a declared class table and the bytecode
 * primitive lattice.
 *
 * Reference types are ordered by the transitive closure of the declared
 * superclass and interface edges, with java.lang.Object above every class.
 * Arrays are covariant in reference elements and sit below Object,
 * Serializable and Cloneable. bottom_type is below everything, null_type
 * below every reference and array type, and the integer placeholders nest
 * below the primitives that can hold their value range.
 */
class ClassHierarchy final : public Hierarchy
{
public:
    /**
     * Build the hierarchy from class declarations.
     *
     * Fails on duplicate declarations and on cyclic inheritance. Names used
     * as a superclass or interface without a declaration of their own are
     * added implicitly as direct subclasses of java.lang.Object.
     */
    [[nodiscard]] static typmin::Result<ClassHierarchy> build(const std::vector<ClassDecl>& classes);

    [[nodiscard]] bool ancestor(const types::Type& ancestor,
                                const types::Type& child) const override;

    [[nodiscard]] bool types_equal(const types::Type& a, const types::Type& b) const override;

    /// Reference-type subtyping between two class names
    [[nodiscard]] bool is_subclass(std::string_view ancestor, std::string_view child) const;

    [[nodiscard]] bool contains(std::string_view class_name) const;

    [[nodiscard]] std::size_t size() const { return m_supertypes.size(); }

private:
    ClassHierarchy() = default;

    /// class name -> every supertype name, the class itself included
    std::unordered_map<std::string, std::unordered_set<std::string>> m_supertypes;
};

}  // namespace typmin::hierarchy
