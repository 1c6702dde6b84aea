/**
 * @file comparator.cpp
 * @brief Generality ordering between typings and object-like local detection
 */

#include "typmin/minimizer.hpp"

#include <algorithm>

namespace typmin::typing {

std::string_view typing_order_name(TypingOrder order)
{
    switch (order) {
        case TypingOrder::kIncomparable:
            return "incomparable";
        case TypingOrder::kLessGeneral:
            return "less_general";
        case TypingOrder::kEqualOrMixed:
            return "equal";
        case TypingOrder::kMoreGeneral:
            return "more_general";
        case TypingOrder::kConflicting:
            return "conflicting";
    }
    return "unknown";
}

TypingOrder compare(const Typing& a,
                    const Typing& b,
                    const hierarchy::Hierarchy& hierarchy,
                    const LocalSet& ignore)
{
    TypingOrder running = TypingOrder::kEqualOrMixed;
    for (const auto& [local, type_a] : a.entries()) {
        if (ignore.contains(local)) {
            continue;
        }
        const types::Type& type_b = b.get(local);

        TypingOrder local_order = TypingOrder::kEqualOrMixed;
        if (hierarchy.types_equal(type_a, type_b)) {
            local_order = TypingOrder::kEqualOrMixed;
        } else if (hierarchy.ancestor(type_a, type_b)) {
            local_order = TypingOrder::kMoreGeneral;
            if (running == TypingOrder::kLessGeneral) {
                return TypingOrder::kConflicting;
            }
        } else if (hierarchy.ancestor(type_b, type_a)) {
            local_order = TypingOrder::kLessGeneral;
            if (running == TypingOrder::kMoreGeneral) {
                return TypingOrder::kConflicting;
            }
        } else {
            return TypingOrder::kIncomparable;
        }

        if (running == TypingOrder::kEqualOrMixed) {
            running = local_order;
        }
    }
    return running;
}

LocalSet find_object_like_locals(std::span<const Typing> typings)
{
    const auto& object_like = types::object_like_types();

    LocalSet result;
    for (const auto& [local, seen] : flatten(typings)) {
        if (seen.size() != object_like.size()) {
            continue;
        }
        const bool all_object_like = std::ranges::all_of(seen, [&object_like](const auto& type) {
            return std::ranges::find(object_like, type) != object_like.end();
        });
        if (all_object_like) {
            result.insert(local);
        }
    }
    return result;
}

}  // namespace typmin::typing
