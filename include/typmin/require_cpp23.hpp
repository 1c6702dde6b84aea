#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for typmin
 *
 * This header verifies at compile time that the standard library provides
 * all C++23 features required by typmin. It is included by the CLI entry
 * point so an insufficient toolchain fails with a clear message.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "typmin requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: Console output in the CLI

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "typmin requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Error handling (Result / VoidResult)

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "typmin requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: Indexed iteration over candidates and CLI arguments

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "typmin requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::to_underlying (__cpp_lib_to_underlying)
// =============================================================================
// Required for: TypingOrder to integer conversion

#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "typmin requires std::to_underlying (__cpp_lib_to_underlying >= 202102L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// Parallel algorithms (__cpp_lib_parallel_algorithm)
// =============================================================================
// Required for: Parallel minimization (std::execution::par)

#if !defined(__cpp_lib_parallel_algorithm) || __cpp_lib_parallel_algorithm < 201'603L
    #error "typmin requires parallel algorithms (__cpp_lib_parallel_algorithm >= 201603L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "typmin requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "typmin requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define TYPMIN_CPP23_FEATURES_VERIFIED 1
