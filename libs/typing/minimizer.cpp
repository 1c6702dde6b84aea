/**
 * @file minimizer.cpp
 * @brief Sequential and parallel minimization of candidate typings
 *
 * Both strategies mark dropped candidates with a per-slot tombstone and
 * compact the list in one sequential pass at the end, so indices stay
 * stable while candidates are compared.
 */

#include "typmin/minimizer.hpp"

#include <algorithm>
#include <atomic>
#include <execution>
#include <numeric>
#include <utility>

namespace typmin::typing {

namespace {

[[nodiscard]] std::vector<Local> sorted_locals(const LocalSet& locals)
{
    std::vector<Local> result(locals.begin(), locals.end());
    std::ranges::sort(result);
    return result;
}

/// Remove every tombstoned slot, keeping survivors in order. Returns the removed count.
std::size_t compact(std::vector<Typing>& typings, const std::vector<bool>& tombstones)
{
    std::vector<Typing> survivors;
    survivors.reserve(typings.size());
    for (std::size_t i = 0; i < typings.size(); ++i) {
        if (!tombstones[i]) {
            survivors.push_back(std::move(typings[i]));
        }
    }
    const std::size_t removed = typings.size() - survivors.size();
    typings = std::move(survivors);
    return removed;
}

}  // namespace

std::string_view strategy_name(MinimizeStrategy strategy)
{
    switch (strategy) {
        case MinimizeStrategy::kSkipped:
            return "skipped";
        case MinimizeStrategy::kSequential:
            return "sequential";
        case MinimizeStrategy::kParallel:
            return "parallel";
    }
    return "unknown";
}

Minimizer::Minimizer(const hierarchy::Hierarchy& hierarchy, MinimizeConfig config)
    : m_hierarchy(hierarchy)
    , m_config(config)
{}

Minimizer::Action Minimizer::decide(const Typing& outer,
                                    const Typing& inner,
                                    const LocalSet& ignore) const
{
    switch (compare(outer, inner, m_hierarchy, ignore)) {
        case TypingOrder::kMoreGeneral:
            // The outer typing would leave locals at needlessly broad supertypes
            return Action::kDropOuter;
        case TypingOrder::kLessGeneral:
            return Action::kDropInner;
        case TypingOrder::kEqualOrMixed:
            return m_config.strict_dedup ? Action::kDropInner : Action::kKeep;
        case TypingOrder::kIncomparable:
        case TypingOrder::kConflicting:
            return Action::kKeep;
    }
    return Action::kKeep;
}

MinimizeStats Minimizer::minimize(std::vector<Typing>& typings) const
{
    if (!m_config.enabled) {
        return MinimizeStats{.input_count = typings.size(),
                             .removed_count = 0,
                             .strategy = MinimizeStrategy::kSkipped,
                             .object_like_locals = {}};
    }
    if (typings.size() > m_config.parallel_threshold) {
        return minimize_parallel(typings);
    }
    return minimize_sequential(typings);
}

MinimizeStats Minimizer::minimize_sequential(std::vector<Typing>& typings) const
{
    const LocalSet ignore = find_object_like_locals(typings);
    MinimizeStats stats{.input_count = typings.size(),
                        .removed_count = 0,
                        .strategy = MinimizeStrategy::kSequential,
                        .object_like_locals = sorted_locals(ignore)};

    const std::size_t count = typings.size();
    std::vector<bool> tombstones(count, false);
    for (std::size_t i = 0; i < count; ++i) {
        if (tombstones[i]) {
            continue;
        }
        for (std::size_t j = i + 1; j < count; ++j) {
            if (tombstones[j]) {
                continue;
            }
            const Action action = decide(typings[i], typings[j], ignore);
            if (action == Action::kDropOuter) {
                // i is dominated; it has nothing left to prune
                tombstones[i] = true;
                break;
            }
            if (action == Action::kDropInner) {
                tombstones[j] = true;
            }
        }
    }

    stats.removed_count = compact(typings, tombstones);
    return stats;
}

MinimizeStats Minimizer::minimize_parallel(std::vector<Typing>& typings) const
{
    const LocalSet ignore = find_object_like_locals(typings);
    MinimizeStats stats{.input_count = typings.size(),
                        .removed_count = 0,
                        .strategy = MinimizeStrategy::kParallel,
                        .object_like_locals = sorted_locals(ignore)};

    const std::size_t count = typings.size();
    // A stale read of a tombstone only costs a redundant comparison; slots are
    // never cleared once set.
    std::vector<std::atomic<bool>> tombstones(count);
    std::vector<std::size_t> indices(count);
    std::iota(indices.begin(), indices.end(), std::size_t{0});

    const std::vector<Typing>& candidates = typings;
    std::for_each(std::execution::par,
                  indices.begin(),
                  indices.end(),
                  [this, &candidates, &tombstones, &ignore, count](std::size_t i) {
                      if (tombstones[i].load(std::memory_order_relaxed)) {
                          return;
                      }
                      for (std::size_t j = i + 1; j < count; ++j) {
                          if (tombstones[j].load(std::memory_order_relaxed)) {
                              continue;
                          }
                          const Action action = decide(candidates[i], candidates[j], ignore);
                          if (action == Action::kDropOuter) {
                              tombstones[i].store(true, std::memory_order_relaxed);
                              return;
                          }
                          if (action == Action::kDropInner) {
                              tombstones[j].store(true, std::memory_order_relaxed);
                          }
                      }
                  });

    std::vector<bool> dropped(count, false);
    for (std::size_t i = 0; i < count; ++i) {
        dropped[i] = tombstones[i].load(std::memory_order_relaxed);
    }
    stats.removed_count = compact(typings, dropped);
    return stats;
}

}  // namespace typmin::typing
