/**
 * @file problem.cpp
 * @brief Decoding of typing problems and encoding of minimization reports
 */

#include "typmin/problem.hpp"

#include "typmin/version.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <string_view>
#include <utility>

namespace typmin::problem {

namespace {

struct JsonFieldContext
{
    const nlohmann::json* obj = nullptr;
    std::string_view key;
    std::string_view context;
};

[[nodiscard]] typmin::Error missing_field(const JsonFieldContext& input)
{
    return Error::make("MissingField",
                       std::format("Missing required field '{}' in {}", input.key, input.context));
}

[[nodiscard]] typmin::Error wrong_type(const JsonFieldContext& input, std::string_view expected)
{
    return Error::make(
        "InvalidFieldType",
        std::format("Expected {} field '{}' in {}", expected, input.key, input.context));
}

[[nodiscard]] typmin::Result<std::string> require_string(const JsonFieldContext& input)
{
    const nlohmann::json& obj = *input.obj;
    if (!obj.contains(input.key)) {
        return std::unexpected(missing_field(input));
    }
    if (!obj.at(input.key).is_string()) {
        return std::unexpected(wrong_type(input, "string"));
    }
    return obj.at(input.key).get<std::string>();
}

[[nodiscard]] typmin::Result<const nlohmann::json*> require_array(const JsonFieldContext& input)
{
    const nlohmann::json& obj = *input.obj;
    if (!obj.contains(input.key)) {
        return std::unexpected(missing_field(input));
    }
    if (!obj.at(input.key).is_array()) {
        return std::unexpected(wrong_type(input, "array"));
    }
    return &obj.at(input.key);
}

/// Optional field: nullopt when absent, error when present with another type
[[nodiscard]] typmin::Result<std::optional<std::string>>
optional_string(const JsonFieldContext& input)
{
    if (!input.obj->contains(input.key)) {
        return std::optional<std::string>{};
    }
    auto value = require_string(input);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::optional<std::string>{std::move(*value)};
}

[[nodiscard]] typmin::Result<std::vector<std::string>> string_array(const nlohmann::json& array,
                                                                     std::string_view context)
{
    std::vector<std::string> values;
    values.reserve(array.size());
    for (const auto& item : array) {
        if (!item.is_string()) {
            return std::unexpected(Error::make(
                "InvalidFieldType", std::format("Expected only strings in {}", context)));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

[[nodiscard]] typmin::Result<hierarchy::ClassDecl> parse_class(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("InvalidFieldType", "Expected object entries in 'classes'"));
    }
    hierarchy::ClassDecl decl;
    auto name = require_string({.obj = &j, .key = "name", .context = "class declaration"});
    if (!name) {
        return std::unexpected(name.error());
    }
    decl.name = std::move(*name);

    const std::string context = std::format("class '{}'", decl.name);
    auto super_class = optional_string({.obj = &j, .key = "super", .context = context});
    if (!super_class) {
        return std::unexpected(super_class.error());
    }
    decl.super_class = std::move(*super_class);

    if (j.contains("interfaces")) {
        auto array = require_array({.obj = &j, .key = "interfaces", .context = context});
        if (!array) {
            return std::unexpected(array.error());
        }
        auto interfaces = string_array(**array, context);
        if (!interfaces) {
            return std::unexpected(interfaces.error());
        }
        decl.interfaces = std::move(*interfaces);
    }
    if (j.contains("interface")) {
        if (!j.at("interface").is_boolean()) {
            return std::unexpected(
                wrong_type({.obj = &j, .key = "interface", .context = context}, "boolean"));
        }
        decl.is_interface = j.at("interface").get<bool>();
    }
    return decl;
}

[[nodiscard]] typmin::Result<typing::MinimizeConfig> parse_config(const nlohmann::json& j)
{
    typing::MinimizeConfig config;
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "'config' must be an object"));
    }
    if (j.contains("minimize")) {
        if (!j.at("minimize").is_boolean()) {
            return std::unexpected(
                wrong_type({.obj = &j, .key = "minimize", .context = "config"}, "boolean"));
        }
        config.enabled = j.at("minimize").get<bool>();
    }
    if (j.contains("parallel_threshold")) {
        if (!j.at("parallel_threshold").is_number_unsigned()) {
            return std::unexpected(wrong_type(
                {.obj = &j, .key = "parallel_threshold", .context = "config"}, "unsigned integer"));
        }
        config.parallel_threshold = j.at("parallel_threshold").get<std::size_t>();
    }
    if (j.contains("strict_dedup")) {
        if (!j.at("strict_dedup").is_boolean()) {
            return std::unexpected(
                wrong_type({.obj = &j, .key = "strict_dedup", .context = "config"}, "boolean"));
        }
        config.strict_dedup = j.at("strict_dedup").get<bool>();
    }
    return config;
}

}  // namespace

typmin::Result<typing::Typing> typing_from_json(const nlohmann::json& j,
                                                std::span<const typing::Local> locals)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "A typing must be a JSON object"));
    }

    typing::Typing result(locals);
    for (const auto& local : locals) {
        auto it = j.find(local.name());
        if (it == j.end()) {
            return std::unexpected(Error::make(
                "MissingLocal", std::format("Typing does not assign local '{}'", local.name())));
        }
        if (!it->is_string()) {
            return std::unexpected(Error::make(
                "InvalidFieldType", std::format("Type of local '{}' must be a string", local.name())));
        }
        auto type = types::parse_type(it->get<std::string>());
        if (!type) {
            return std::unexpected(Error::make(
                type.error().code, std::format("local '{}': {}", local.name(), type.error().message)));
        }
        result.set(local, std::move(*type));
    }
    if (j.size() != locals.size()) {
        for (const auto& [key, value] : j.items()) {
            const bool declared = std::ranges::any_of(
                locals, [&key](const typing::Local& local) { return local.name() == key; });
            if (!declared) {
                return std::unexpected(Error::make(
                    "UnknownLocal", std::format("Typing assigns undeclared local '{}'", key)));
            }
        }
    }
    return result;
}

nlohmann::json typing_to_json(const typing::Typing& typing)
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [local, type] : typing.entries()) {
        j[local.name()] = type.to_string();
    }
    return j;
}

typmin::Result<TypingProblem> parse_problem(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "Problem must be a JSON object"));
    }
    auto schema_version = require_string({.obj = &j, .key = "schema_version", .context = "problem"});
    if (!schema_version) {
        return std::unexpected(schema_version.error());
    }
    if (*schema_version != kProblemSchemaVersion) {
        return std::unexpected(Error::make(
            "UnsupportedSchemaVersion",
            std::format("Expected schema_version '{}', got '{}'", kProblemSchemaVersion,
                        *schema_version)));
    }

    TypingProblem problem;

    auto method = optional_string({.obj = &j, .key = "method", .context = "problem"});
    if (!method) {
        return std::unexpected(method.error());
    }
    problem.method = method->value_or("");

    auto profile = optional_string({.obj = &j, .key = "profile", .context = "problem"});
    if (!profile) {
        return std::unexpected(profile.error());
    }
    if (profile->has_value()) {
        auto parsed = types::parse_profile(**profile);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        problem.profile = *parsed;
    }

    if (j.contains("classes")) {
        auto classes = require_array({.obj = &j, .key = "classes", .context = "problem"});
        if (!classes) {
            return std::unexpected(classes.error());
        }
        for (const auto& entry : **classes) {
            auto decl = parse_class(entry);
            if (!decl) {
                return std::unexpected(decl.error());
            }
            problem.classes.push_back(std::move(*decl));
        }
    }

    auto locals = require_array({.obj = &j, .key = "locals", .context = "problem"});
    if (!locals) {
        return std::unexpected(locals.error());
    }
    auto local_names = string_array(**locals, "'locals'");
    if (!local_names) {
        return std::unexpected(local_names.error());
    }
    std::set<std::string> seen;
    for (auto& name : *local_names) {
        if (!seen.insert(name).second) {
            return std::unexpected(
                Error::make("DuplicateLocal", std::format("Local '{}' is declared twice", name)));
        }
        problem.locals.emplace_back(std::move(name));
    }

    auto candidates = require_array({.obj = &j, .key = "candidates", .context = "problem"});
    if (!candidates) {
        return std::unexpected(candidates.error());
    }
    problem.candidates.reserve((*candidates)->size());
    for (const auto& [index, entry] : (*candidates)->items()) {
        auto typing = typing_from_json(entry, problem.locals);
        if (!typing) {
            return std::unexpected(Error::make(
                typing.error().code, std::format("candidate {}: {}", index, typing.error().message)));
        }
        problem.candidates.push_back(std::move(*typing));
    }

    if (j.contains("config")) {
        auto config = parse_config(j.at("config"));
        if (!config) {
            return std::unexpected(config.error());
        }
        problem.config = *config;
    }
    return problem;
}

typmin::Result<std::map<std::string, std::string>> final_type_names(const typing::Typing& typing,
                                                                     types::Profile profile)
{
    std::map<std::string, std::string> names;
    for (const auto& [local, type] : typing.entries()) {
        auto name = types::type_as_string(type, profile);
        if (!name) {
            return std::unexpected(Error::make(
                name.error().code, std::format("local '{}': {}", local.name(), name.error().message)));
        }
        names.emplace(local.name(), std::move(*name));
    }
    return names;
}

nlohmann::json report_to_json(const MinimizeReport& report)
{
    nlohmann::json object_like = nlohmann::json::array();
    for (const auto& local : report.stats.object_like_locals) {
        object_like.push_back(local.name());
    }

    nlohmann::json typings = nlohmann::json::array();
    for (const auto& typing : report.typings) {
        typings.push_back(typing_to_json(typing));
    }

    nlohmann::json j = {
        {"schema_version", kResultSchemaVersion},
        {"tool", {{"name", "typmin"}, {"version", kVersion}, {"build_id", kBuildId}}},
        {"method", report.method},
        {"profile", std::string(types::profile_name(report.profile))},
        {"stats",
         {{"input", report.stats.input_count},
          {"removed", report.stats.removed_count},
          {"survivors", report.stats.survivor_count()},
          {"strategy", std::string(typing::strategy_name(report.stats.strategy))},
          {"object_like_locals", std::move(object_like)}}},
        {"typings", std::move(typings)},
    };
    if (report.final_typing.has_value()) {
        j["final_typing"] = typing_to_json(*report.final_typing);
    }
    if (report.final_names.has_value()) {
        j["final_names"] = *report.final_names;
    }
    return j;
}

}  // namespace typmin::problem
