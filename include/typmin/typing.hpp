#pragma once

/**
 * @file typing.hpp
 * @brief Locals and typings: one candidate type assignment per method body
 */

#include "typmin/types.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace typmin::typing {

/**
 * @brief Opaque local variable of one method body, identified by name.
 */
class Local
{
public:
    explicit Local(std::string name)
        : m_name(std::move(name))
    {}

    [[nodiscard]] const std::string& name() const { return m_name; }

    [[nodiscard]] auto operator<=>(const Local&) const = default;

private:
    std::string m_name;
};

/**
 * @brief Complete candidate assignment of types to a method's locals.
 *
 * Every typing of one candidate list covers the same set of locals.
 * Iteration order is the order of local names, which keeps output stable.
 */
class Typing
{
public:
    /// Unconstrained typing: every local starts at bottom_type
    explicit Typing(std::span<const Local> locals);

    [[nodiscard]] const types::Type& get(const Local& local) const;

    /// nullptr if the typing does not cover @p local
    [[nodiscard]] const types::Type* find(const Local& local) const;

    void set(const Local& local, types::Type type);

    [[nodiscard]] std::vector<Local> locals() const;

    [[nodiscard]] std::size_t size() const { return m_types.size(); }

    [[nodiscard]] const std::map<Local, types::Type>& entries() const { return m_types; }

    /// "{x=int, y=java.lang.Object}"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const Typing&) const = default;

private:
    std::map<Local, types::Type> m_types;
};

/// Local -> distinct types it holds anywhere in a candidate list, in first-seen order
using FlatTyping = std::map<Local, std::vector<types::Type>>;

[[nodiscard]] FlatTyping flatten(std::span<const Typing> typings);

}  // namespace typmin::typing

template <>
struct std::hash<typmin::typing::Local>
{
    [[nodiscard]] std::size_t operator()(const typmin::typing::Local& local) const noexcept
    {
        return std::hash<std::string>{}(local.name());
    }
};
