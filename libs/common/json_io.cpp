/**
 * @file json_io.cpp
 * @brief JSON file reading and compact serialization
 */

#include "typmin/json_io.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace typmin::json_io {

typmin::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Failed to parse JSON file: {}: {}", path.string(), ex.what())));
    }
    return payload;
}

typmin::Result<std::string> to_compact_string(const nlohmann::json& j)
{
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(Error::make("SerializationFailed", ex.what()));
    }
}

typmin::VoidResult write_json_file(const std::filesystem::path& path, const nlohmann::json& payload)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError",
                std::format("Failed to create directory {}: {}", path.parent_path().string(),
                            ec.message())));
        }
    }

    auto text = to_compact_string(payload);
    if (!text) {
        return std::unexpected(text.error());
    }

    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *text << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace typmin::json_io
