#pragma once

/**
 * @file json_io.hpp
 * @brief Reading JSON documents and writing them in a stable compact form
 */

#include "typmin/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace typmin::json_io {

[[nodiscard]] typmin::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Serialize without whitespace. Object keys come out sorted because
 * nlohmann::json keeps objects in a std::map, so equal documents always
 * produce equal bytes.
 */
[[nodiscard]] typmin::Result<std::string> to_compact_string(const nlohmann::json& j);

/// Write @p payload compactly followed by a newline, creating parent directories
[[nodiscard]] typmin::VoidResult write_json_file(const std::filesystem::path& path,
                                                 const nlohmann::json& payload);

}  // namespace typmin::json_io
