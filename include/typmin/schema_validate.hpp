#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of problem and result documents
 */

#include "typmin/common.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace valijson {
class Schema;
}  // namespace valijson

namespace typmin::schema {

/**
 * @brief Compiled JSON Schema, reusable across documents.
 */
class SchemaValidator
{
public:
    /**
     * Parse and compile a schema file. "$defs" and "#/$defs/" references are
     * accepted and mapped onto the draft-7 "definitions" keyword.
     */
    [[nodiscard]] static typmin::Result<SchemaValidator> load(const std::filesystem::path& schema_path);

    SchemaValidator(SchemaValidator&& other) noexcept;
    SchemaValidator& operator=(SchemaValidator&& other) noexcept;
    SchemaValidator(const SchemaValidator&) = delete;
    SchemaValidator& operator=(const SchemaValidator&) = delete;
    ~SchemaValidator();

    /// Empty on success; "SchemaValidationFailed" listing every violation otherwise
    [[nodiscard]] typmin::VoidResult validate(const nlohmann::json& document) const;

    [[nodiscard]] const std::string& name() const { return m_name; }

private:
    SchemaValidator(std::unique_ptr<valijson::Schema> schema, std::string name);

    std::unique_ptr<valijson::Schema> m_schema;
    std::string m_name;
};

/// One-shot helper: load @p schema_path and validate @p document against it
[[nodiscard]] typmin::VoidResult validate_json(const nlohmann::json& document,
                                               const std::filesystem::path& schema_path);

}  // namespace typmin::schema
