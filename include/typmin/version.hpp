#pragma once

/**
 * @file version.hpp
 * @brief typmin version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace typmin {

/// typmin version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the JSON documents read and written by the CLI
constexpr const char* kProblemSchemaVersion = "typing_problem.v1";
constexpr const char* kResultSchemaVersion = "typing_result.v1";

}  // namespace typmin
