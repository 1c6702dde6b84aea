#include "typmin/problem.hpp"
#include "typmin/schema_validate.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace typmin::schema::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(TYPMIN_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_valid_problem_json()
{
    return nlohmann::json{
        {"schema_version",                                                 "typing_problem.v1"},
        {       "profile",                                                            "dotnet"},
        {       "classes",
         nlohmann::json::array({{{"name", "A"}, {"super", "B"}, {"interfaces", nlohmann::json::array()}},
         {{"name", "I"}, {"interface", true}}})                                               },
        {        "locals",                                        nlohmann::json::array({"x"})},
        {    "candidates", nlohmann::json::array({{{"x", "A"}}, {{"x", "B[]"}}})            },
        {        "config", {{"minimize", true}, {"parallel_threshold", 16}}                   }
    };
}

nlohmann::json make_valid_result_json()
{
    const std::vector<typing::Local> locals{typing::Local("x")};
    typing::Typing typing(locals);
    typing.set(typing::Local("x"), types::Type::ref("A"));

    problem::MinimizeReport report{.method = "A.m()V",
                                   .profile = types::Profile::kJava,
                                   .stats = {.input_count = 2,
                                             .removed_count = 1,
                                             .strategy = typing::MinimizeStrategy::kSequential,
                                             .object_like_locals = {}},
                                   .typings = {typing},
                                   .final_typing = typing,
                                   .final_names = std::map<std::string, std::string>{{"x", "A"}}};
    return problem::report_to_json(report);
}

struct SchemaCase
{
    std::string schema_file;
    nlohmann::json valid_json;
};

std::vector<SchemaCase> make_cases()
{
    return {
        {.schema_file = "typing_problem.v1.schema.json", .valid_json = make_valid_problem_json()},
        { .schema_file = "typing_result.v1.schema.json",  .valid_json = make_valid_result_json()},
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidSchemaSamplesPass)
{
    for (const auto& schema_case : make_cases()) {
        auto result = validate_json(schema_case.valid_json, schema_path(schema_case.schema_file));
        EXPECT_TRUE(result) << schema_case.schema_file << ": " << result.error().message;
    }
}

TEST(SchemaValidateTest, InvalidSchemaSamplesFail)
{
    for (const auto& schema_case : make_cases()) {
        auto invalid = schema_case.valid_json;
        invalid.erase("schema_version");

        auto result = validate_json(invalid, schema_path(schema_case.schema_file));
        ASSERT_FALSE(result) << schema_case.schema_file;
        EXPECT_EQ(result.error().code, "SchemaValidationFailed");
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, ProblemRejectsUnknownProfile)
{
    auto problem = make_valid_problem_json();
    problem["profile"] = "wasm";

    auto result = validate_json(problem, schema_path("typing_problem.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("typing_problem.v1.schema"), std::string::npos);
}

TEST(SchemaValidateTest, ProblemRejectsNonStringType)
{
    auto problem = make_valid_problem_json();
    problem["candidates"][0]["x"] = 42;

    EXPECT_FALSE(validate_json(problem, schema_path("typing_problem.v1.schema.json")));
}

TEST(SchemaValidateTest, ResultRejectsUnknownStrategy)
{
    auto result_json = make_valid_result_json();
    result_json["stats"]["strategy"] = "greedy";

    EXPECT_FALSE(validate_json(result_json, schema_path("typing_result.v1.schema.json")));
}

TEST(SchemaValidateTest, LoadedValidatorIsReusable)
{
    auto validator = SchemaValidator::load(schema_path("typing_problem.v1.schema.json"));
    ASSERT_TRUE(validator.has_value()) << validator.error().message;
    EXPECT_EQ(validator->name(), "typing_problem.v1.schema");

    EXPECT_TRUE(validator->validate(make_valid_problem_json()));
    EXPECT_FALSE(validator->validate(nlohmann::json::array()));
    EXPECT_TRUE(validator->validate(make_valid_problem_json()));
}

TEST(SchemaValidateTest, MissingSchemaFile)
{
    auto result = validate_json(make_valid_problem_json(), schema_path("absent.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace typmin::schema::test
