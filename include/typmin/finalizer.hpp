#pragma once

/**
 * @file finalizer.hpp
 * @brief Replace internal placeholder types before code emission
 */

#include "typmin/typing.hpp"

#include <cstddef>

namespace typmin::typing {

/**
 * Rewrite @p typing in place so every local holds a type allowed in final
 * code, substituting each type's default final type where needed.
 *
 * @return Number of locals whose type was replaced
 */
std::size_t finalize_types(Typing& typing);

}  // namespace typmin::typing
