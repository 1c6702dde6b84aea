/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "typmin/schema_validate.hpp"

#include "typmin/json_io.hpp"

#include <format>
#include <string_view>
#include <utility>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validation_results.hpp>
#include <valijson/validator.hpp>

namespace typmin::schema {

namespace {

constexpr std::string_view kDefsRefPrefix = "#/$defs/";

/// Rewrite "$defs" into "definitions" so draft-7 parsing resolves local references
void map_defs_to_definitions(nlohmann::json& node)
{
    if (node.is_array()) {
        for (auto& child : node) {
            map_defs_to_definitions(child);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }

    if (auto defs = node.find("$defs"); defs != node.end() && !node.contains("definitions")) {
        node["definitions"] = *defs;
        node.erase("$defs");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto& child = it.value();
        if (it.key() == "$ref" && child.is_string()) {
            auto ref = child.get<std::string>();
            if (ref.starts_with(kDefsRefPrefix)) {
                child = "#/definitions/" + ref.substr(kDefsRefPrefix.size());
            }
            continue;
        }
        map_defs_to_definitions(child);
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::vector<std::string> lines;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        lines.push_back(std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description));
    }

    std::string text;
    for (const auto& line : lines) {
        if (!text.empty()) {
            text += '\n';
        }
        text += line;
    }
    return text;
}

}  // namespace

SchemaValidator::SchemaValidator(std::unique_ptr<valijson::Schema> schema, std::string name)
    : m_schema(std::move(schema))
    , m_name(std::move(name))
{}

SchemaValidator::SchemaValidator(SchemaValidator&& other) noexcept = default;
SchemaValidator& SchemaValidator::operator=(SchemaValidator&& other) noexcept = default;
SchemaValidator::~SchemaValidator() = default;

typmin::Result<SchemaValidator> SchemaValidator::load(const std::filesystem::path& schema_path)
{
    auto schema_json = json_io::read_json_file(schema_path);
    if (!schema_json) {
        return std::unexpected(Error::make("SchemaFileOpenFailed", schema_json.error().message));
    }
    map_defs_to_definitions(*schema_json);

    auto schema = std::make_unique<valijson::Schema>();
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter adapter(*schema_json);
        parser.populateSchema(adapter, *schema);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaBuildFailed",
            std::format("Failed to build schema {}: {}", schema_path.string(), ex.what())));
    }
    return SchemaValidator(std::move(schema), schema_path.stem().string());
}

typmin::VoidResult SchemaValidator::validate(const nlohmann::json& document) const
{
    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(document);
    if (validator.validate(*m_schema, target, &results)) {
        return {};
    }

    std::string details = describe_errors(results);
    if (details.empty()) {
        details = "document does not match schema";
    }
    return std::unexpected(Error::make("SchemaValidationFailed",
                                       std::format("{}: {}", m_name, details)));
}

typmin::VoidResult validate_json(const nlohmann::json& document,
                                 const std::filesystem::path& schema_path)
{
    auto validator = SchemaValidator::load(schema_path);
    if (!validator) {
        return std::unexpected(validator.error());
    }
    return validator->validate(document);
}

}  // namespace typmin::schema
