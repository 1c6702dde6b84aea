/**
 * @file typing_strategy.cpp
 * @brief Default typing strategy
 */

#include "typmin/typing_strategy.hpp"

#include "typmin/finalizer.hpp"

namespace typmin::typing {

DefaultTypingStrategy::DefaultTypingStrategy(MinimizeConfig config)
    : m_config(config)
{}

Typing DefaultTypingStrategy::create_typing(std::span<const Local> locals) const
{
    return Typing(locals);
}

Typing DefaultTypingStrategy::create_typing(const Typing& existing) const
{
    return Typing(existing);
}

MinimizeStats DefaultTypingStrategy::minimize(std::vector<Typing>& typings,
                                              const hierarchy::Hierarchy& hierarchy) const
{
    return Minimizer(hierarchy, m_config).minimize(typings);
}

void DefaultTypingStrategy::finalize_types(Typing& typing) const
{
    ::typmin::typing::finalize_types(typing);
}

}  // namespace typmin::typing
