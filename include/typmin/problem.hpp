#pragma once

/**
 * @file problem.hpp
 * @brief JSON model of a typing problem (typing_problem.v1) and of a
 *        minimization result (typing_result.v1)
 */

#include "typmin/common.hpp"
#include "typmin/hierarchy.hpp"
#include "typmin/minimizer.hpp"
#include "typmin/typing.hpp"
#include "typmin/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace typmin::problem {

/**
 * @brief Candidate typings of one method body together with the class table
 * they are typed against.
 */
struct TypingProblem
{
    std::string method;  ///< Informational method signature
    types::Profile profile = types::Profile::kJava;
    std::vector<hierarchy::ClassDecl> classes;
    std::vector<typing::Local> locals;
    std::vector<typing::Typing> candidates;
    typing::MinimizeConfig config;
};

struct MinimizeReport
{
    std::string method;
    types::Profile profile = types::Profile::kJava;
    typing::MinimizeStats stats;
    std::vector<typing::Typing> typings;
    std::optional<typing::Typing> final_typing;
    std::optional<std::map<std::string, std::string>> final_names;
};

/**
 * Decode a typing_problem.v1 document.
 *
 * Every candidate must assign a type to exactly the declared locals.
 */
[[nodiscard]] typmin::Result<TypingProblem> parse_problem(const nlohmann::json& j);

/// {"local": "type", ...}
[[nodiscard]] nlohmann::json typing_to_json(const typing::Typing& typing);

[[nodiscard]] typmin::Result<typing::Typing> typing_from_json(const nlohmann::json& j,
                                                              std::span<const typing::Local> locals);

/**
 * Emitted-code name of every local of a finalized typing.
 *
 * Fails with "Unsupported" when a type has no name under @p profile.
 */
[[nodiscard]] typmin::Result<std::map<std::string, std::string>>
final_type_names(const typing::Typing& typing, types::Profile profile);

[[nodiscard]] nlohmann::json report_to_json(const MinimizeReport& report);

}  // namespace typmin::problem
