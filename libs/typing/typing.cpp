/**
 * @file typing.cpp
 * @brief Typing map and flattened view of a candidate list
 */

#include "typmin/typing.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace typmin::typing {

Typing::Typing(std::span<const Local> locals)
{
    for (const auto& local : locals) {
        m_types.insert_or_assign(local, types::Type::bottom());
    }
}

const types::Type& Typing::get(const Local& local) const
{
    const auto* type = find(local);
    if (type == nullptr) {
        throw std::out_of_range(std::format("Typing has no local '{}'", local.name()));
    }
    return *type;
}

const types::Type* Typing::find(const Local& local) const
{
    auto it = m_types.find(local);
    return it != m_types.end() ? &it->second : nullptr;
}

void Typing::set(const Local& local, types::Type type)
{
    m_types.insert_or_assign(local, std::move(type));
}

std::vector<Local> Typing::locals() const
{
    std::vector<Local> result;
    result.reserve(m_types.size());
    for (const auto& [local, type] : m_types) {
        result.push_back(local);
    }
    return result;
}

std::string Typing::to_string() const
{
    std::string result = "{";
    bool first = true;
    for (const auto& [local, type] : m_types) {
        if (!first) {
            result += ", ";
        }
        first = false;
        result += std::format("{}={}", local.name(), type.to_string());
    }
    result += "}";
    return result;
}

FlatTyping flatten(std::span<const Typing> typings)
{
    FlatTyping flat;
    for (const auto& typing : typings) {
        for (const auto& [local, type] : typing.entries()) {
            auto& seen = flat[local];
            if (std::ranges::find(seen, type) == seen.end()) {
                seen.push_back(type);
            }
        }
    }
    return flat;
}

}  // namespace typmin::typing
