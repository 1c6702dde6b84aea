#pragma once

/**
 * @file minimizer.hpp
 * @brief Typing comparison and reduction of a candidate list to its most
 *        specific typings
 */

#include "typmin/hierarchy.hpp"
#include "typmin/typing.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace typmin::typing {

/**
 * Generality of typing a relative to typing b over the compared locals.
 */
enum class TypingOrder : int {
    kIncomparable = -2,  ///< Some local holds unrelated types in a and b
    kLessGeneral = -1,   ///< b is a supertype-or-equal of a everywhere, strictly somewhere
    kEqualOrMixed = 0,   ///< a and b agree on every compared local
    kMoreGeneral = 1,    ///< a is a supertype-or-equal of b everywhere, strictly somewhere
    kConflicting = 2,    ///< a is more general at one local, b at another
};

[[nodiscard]] std::string_view typing_order_name(TypingOrder order);

using LocalSet = std::unordered_set<Local>;

/**
 * Compare two typings over the same locals, skipping @p ignore.
 *
 * Returns kIncomparable as soon as one local holds unrelated types and
 * kConflicting as soon as two locals disagree on the direction.
 */
[[nodiscard]] TypingOrder compare(const Typing& a,
                                  const Typing& b,
                                  const hierarchy::Hierarchy& hierarchy,
                                  const LocalSet& ignore);

/**
 * Locals whose types across every candidate are exactly
 * {Object, Serializable, Cloneable}. They never discriminate between
 * candidates and are left out of comparisons.
 */
[[nodiscard]] LocalSet find_object_like_locals(std::span<const Typing> typings);

struct MinimizeConfig
{
    /// When false, minimize() leaves the candidate list untouched
    bool enabled = true;
    /// Candidate lists larger than this use the parallel strategy
    std::size_t parallel_threshold = 1000;
    /// Drop later candidates that tie with an earlier one on every compared local
    bool strict_dedup = false;
};

enum class MinimizeStrategy {
    kSkipped,
    kSequential,
    kParallel,
};

[[nodiscard]] std::string_view strategy_name(MinimizeStrategy strategy);

struct MinimizeStats
{
    std::size_t input_count = 0;
    std::size_t removed_count = 0;
    MinimizeStrategy strategy = MinimizeStrategy::kSkipped;
    std::vector<Local> object_like_locals;

    [[nodiscard]] std::size_t survivor_count() const { return input_count - removed_count; }
};

/**
 * @brief Prunes a candidate list to the typings no other candidate is more
 * specific than.
 *
 * Both strategies keep the same set of survivors; only the sequential one
 * preserves the input order of survivors.
 */
class Minimizer
{
public:
    Minimizer(const hierarchy::Hierarchy& hierarchy, MinimizeConfig config = MinimizeConfig{});

    /// Select a strategy by candidate count and prune @p typings in place
    MinimizeStats minimize(std::vector<Typing>& typings) const;

    MinimizeStats minimize_sequential(std::vector<Typing>& typings) const;

    MinimizeStats minimize_parallel(std::vector<Typing>& typings) const;

    [[nodiscard]] const MinimizeConfig& config() const { return m_config; }

private:
    /// Whether the candidate at i should be dropped in favour of j, or j in favour of i
    enum class Action {
        kKeep,
        kDropOuter,
        kDropInner,
    };

    [[nodiscard]] Action decide(const Typing& outer,
                                const Typing& inner,
                                const LocalSet& ignore) const;

    const hierarchy::Hierarchy& m_hierarchy;
    MinimizeConfig m_config;
};

}  // namespace typmin::typing
