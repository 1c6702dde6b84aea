#pragma once

/**
 * @file typing_strategy.hpp
 * @brief Entry points used by local-variable type inference
 */

#include "typmin/hierarchy.hpp"
#include "typmin/minimizer.hpp"
#include "typmin/typing.hpp"

#include <span>
#include <vector>

namespace typmin::typing {

/**
 * @brief How the type inference creates, prunes and finalizes typings.
 */
class TypingStrategy
{
public:
    virtual ~TypingStrategy() = default;

    /// Fresh typing with every local unconstrained
    [[nodiscard]] virtual Typing create_typing(std::span<const Local> locals) const = 0;

    /// Independent copy of @p existing
    [[nodiscard]] virtual Typing create_typing(const Typing& existing) const = 0;

    virtual MinimizeStats minimize(std::vector<Typing>& typings,
                                   const hierarchy::Hierarchy& hierarchy) const = 0;

    virtual void finalize_types(Typing& typing) const = 0;
};

class DefaultTypingStrategy final : public TypingStrategy
{
public:
    explicit DefaultTypingStrategy(MinimizeConfig config = MinimizeConfig{});

    [[nodiscard]] Typing create_typing(std::span<const Local> locals) const override;
    [[nodiscard]] Typing create_typing(const Typing& existing) const override;

    MinimizeStats minimize(std::vector<Typing>& typings,
                           const hierarchy::Hierarchy& hierarchy) const override;

    void finalize_types(Typing& typing) const override;

    [[nodiscard]] const MinimizeConfig& config() const { return m_config; }

private:
    MinimizeConfig m_config;
};

}  // namespace typmin::typing
