/**
 * @file main.cpp
 * @brief typmin CLI entry point
 *
 * Commands:
 *   minimize  - Prune candidate typings to the most specific ones
 *   compare   - Print the generality ordering of two candidates
 *   finalize  - Legalize one candidate for emitted code
 *   version   - Show version information
 */

#include "typmin/require_cpp23.hpp"

#include "typmin/common.hpp"
#include "typmin/finalizer.hpp"
#include "typmin/hierarchy.hpp"
#include "typmin/json_io.hpp"
#include "typmin/minimizer.hpp"
#include "typmin/problem.hpp"
#include "typmin/schema_validate.hpp"
#include "typmin/typing.hpp"
#include "typmin/typing_strategy.hpp"
#include "typmin/version.hpp"

#include <charconv>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kProblemSchemaFile = "typing_problem.v1.schema.json";
constexpr std::string_view kResultSchemaFile = "typing_result.v1.schema.json";

void print_version()
{
    std::println("typmin {} ({})", typmin::kVersion, typmin::kBuildId);
    std::println("  problem schema: {}", typmin::kProblemSchemaVersion);
    std::println("  result schema:  {}", typmin::kResultSchemaVersion);
}

void print_help()
{
    std::print(R"(typmin - Local-variable type minimization

Usage: typmin <command> [options]

Commands:
  minimize    Prune candidate typings to the most specific ones
  compare     Print the generality ordering of two candidates
  finalize    Legalize one candidate for emitted code
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'typmin <command> --help' for command-specific options.
)");
}

void print_minimize_help()
{
    std::print(R"(Usage: typmin minimize [options]

Prune the candidate typings of a typing problem

Options:
  --input FILE, -i            Path to typing_problem.v1 JSON (required)
  --output FILE, -o           Output file (default: typing_result.json)
  --schema-dir DIR            Path to schema directory (default: ./schemas)
  --no-minimize               Pass candidates through unchanged
  --parallel-threshold N      Use the parallel strategy above N candidates
  --strict-dedup              Also drop candidates that duplicate an earlier one
  --profile java|dotnet       Front-end profile for finalized type names
  --finalize                  Finalize the first surviving typing
  --verbose                   Print survivors and object-like locals
  --help, -h                  Show this help

Output:
  <output> (typing_result.v1)
)");
}

void print_compare_help()
{
    std::print(R"(Usage: typmin compare [options]

Print the generality ordering of two candidates of a typing problem

Options:
  --input FILE, -i            Path to typing_problem.v1 JSON (required)
  --first N                   Index of the first candidate (default: 0)
  --second N                  Index of the second candidate (default: 1)
  --schema-dir DIR            Path to schema directory (default: ./schemas)
  --help, -h                  Show this help
)");
}

void print_finalize_help()
{
    std::print(R"(Usage: typmin finalize [options]

Replace internal types of one candidate by their emitted-code defaults

Options:
  --input FILE, -i            Path to typing_problem.v1 JSON (required)
  --index N                   Index of the candidate (default: 0)
  --profile java|dotnet       Front-end profile for finalized type names
  --schema-dir DIR            Path to schema directory (default: ./schemas)
  --help, -h                  Show this help
)");
}

struct MinimizeOptions
{
    std::string input;
    std::string output;
    std::string schema_dir;
    std::optional<std::string> profile;
    std::optional<std::size_t> parallel_threshold;
    bool no_minimize;
    bool strict_dedup;
    bool finalize;
    bool verbose;
    bool show_help;
};

struct CompareOptions
{
    std::string input;
    std::size_t first;
    std::size_t second;
    std::string schema_dir;
    bool show_help;
};

struct FinalizeOptions
{
    std::string input;
    std::size_t index;
    std::optional<std::string> profile;
    std::string schema_dir;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> typmin::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            typmin::Error::make("MissingArgument",
                                std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] typmin::Result<std::size_t> parse_count_value(std::string_view value,
                                                            std::string_view option)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(typmin::Error::make(
            "InvalidArgument",
            std::string("Invalid ") + std::string(option) + " value: " + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] auto read_count_option(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> typmin::Result<std::size_t>
{
    auto value = read_option_value(args, index, option);
    if (!value) {
        return std::unexpected(value.error());
    }
    return parse_count_value(*value, option);
}

[[nodiscard]] auto set_minimize_option(std::string_view arg,
                                       // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                       std::span<char*> args,
                                       std::size_t idx,
                                       MinimizeOptions& options,
                                       bool& skip_next) -> typmin::Result<bool>
{
    if (arg == "--input" || arg == "-i" || arg == "--output" || arg == "-o"
        || arg == "--schema-dir" || arg == "--profile") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--input" || arg == "-i") {
            options.input = std::move(*value);
        } else if (arg == "--output" || arg == "-o") {
            options.output = std::move(*value);
        } else if (arg == "--schema-dir") {
            options.schema_dir = std::move(*value);
        } else {
            options.profile = std::move(*value);
        }
        skip_next = true;
        return true;
    }
    if (arg == "--parallel-threshold") {
        auto value = read_count_option(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.parallel_threshold = *value;
        skip_next = true;
        return true;
    }
    if (arg == "--no-minimize") {
        options.no_minimize = true;
        return true;
    }
    if (arg == "--strict-dedup") {
        options.strict_dedup = true;
        return true;
    }
    if (arg == "--finalize") {
        options.finalize = true;
        return true;
    }
    if (arg == "--verbose") {
        options.verbose = true;
        return true;
    }
    return false;
}

[[nodiscard]] typmin::Result<MinimizeOptions> parse_minimize_args(std::span<char*> args)
{
    MinimizeOptions options{.input = std::string{},
                            .output = "typing_result.json",
                            .schema_dir = "schemas",
                            .profile = std::nullopt,
                            .parallel_threshold = std::nullopt,
                            .no_minimize = false,
                            .strict_dedup = false,
                            .finalize = false,
                            .verbose = false,
                            .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_minimize_option(arg, args, static_cast<std::size_t>(i), options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(typmin::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] typmin::Result<CompareOptions> parse_compare_args(std::span<char*> args)
{
    CompareOptions options{.input = std::string{},
                           .first = 0,
                           .second = 1,
                           .schema_dir = "schemas",
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--input" || arg == "-i" || arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            (arg == "--schema-dir" ? options.schema_dir : options.input) = std::move(*value);
            skip_next = true;
            continue;
        }
        if (arg == "--first" || arg == "--second") {
            auto value = read_count_option(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            (arg == "--first" ? options.first : options.second) = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(typmin::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] typmin::Result<FinalizeOptions> parse_finalize_args(std::span<char*> args)
{
    FinalizeOptions options{.input = std::string{},
                            .index = 0,
                            .profile = std::nullopt,
                            .schema_dir = "schemas",
                            .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--input" || arg == "-i" || arg == "--schema-dir" || arg == "--profile") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--profile") {
                options.profile = std::move(*value);
            } else {
                (arg == "--schema-dir" ? options.schema_dir : options.input) = std::move(*value);
            }
            skip_next = true;
            continue;
        }
        if (arg == "--index") {
            auto value = read_count_option(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.index = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(typmin::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

/// Read, schema-check and decode a typing problem
[[nodiscard]] typmin::Result<typmin::problem::TypingProblem>
load_problem(const std::string& input, const std::string& schema_dir)
{
    auto document = typmin::json_io::read_json_file(input);
    if (!document) {
        return std::unexpected(document.error());
    }
    const auto schema_path = std::filesystem::path(schema_dir) / kProblemSchemaFile;
    if (auto validation = typmin::schema::validate_json(*document, schema_path); !validation) {
        return std::unexpected(validation.error());
    }
    return typmin::problem::parse_problem(*document);
}

[[nodiscard]] typmin::Result<typmin::types::Profile>
resolve_profile(const std::optional<std::string>& flag, typmin::types::Profile fallback)
{
    if (!flag.has_value()) {
        return fallback;
    }
    return typmin::types::parse_profile(*flag);
}

[[nodiscard]] int run_minimize(const MinimizeOptions& options)
{
    auto problem = load_problem(options.input, options.schema_dir);
    if (!problem) {
        std::println(stderr, "Error: {}", problem.error().message);
        return 1;
    }
    auto profile = resolve_profile(options.profile, problem->profile);
    if (!profile) {
        std::println(stderr, "Error: {}", profile.error().message);
        return 1;
    }
    auto hierarchy = typmin::hierarchy::ClassHierarchy::build(problem->classes);
    if (!hierarchy) {
        std::println(stderr, "Error: {}", hierarchy.error().message);
        return 1;
    }

    typmin::typing::MinimizeConfig config = problem->config;
    if (options.no_minimize) {
        config.enabled = false;
    }
    if (options.parallel_threshold.has_value()) {
        config.parallel_threshold = *options.parallel_threshold;
    }
    if (options.strict_dedup) {
        config.strict_dedup = true;
    }

    const typmin::typing::DefaultTypingStrategy strategy(config);
    typmin::problem::MinimizeReport report{.method = problem->method,
                                           .profile = *profile,
                                           .stats = {},
                                           .typings = std::move(problem->candidates),
                                           .final_typing = std::nullopt,
                                           .final_names = std::nullopt};
    if (options.verbose) {
        for (const auto& [local, seen] : typmin::typing::flatten(report.typings)) {
            std::string joined;
            for (const auto& type : seen) {
                joined += joined.empty() ? type.to_string() : ", " + type.to_string();
            }
            std::println("  {}: {{{}}}", local.name(), joined);
        }
    }
    report.stats = strategy.minimize(report.typings, *hierarchy);

    std::println("[minimize] {} of {} typings removed ({})",
                 report.stats.removed_count,
                 report.stats.input_count,
                 typmin::typing::strategy_name(report.stats.strategy));
    if (options.verbose) {
        for (const auto& local : report.stats.object_like_locals) {
            std::println("  object-like: {}", local.name());
        }
        for (const auto& [index, typing] : std::views::enumerate(report.typings)) {
            std::println("  survivor {}: {}", index, typing.to_string());
        }
    }

    if (options.finalize) {
        if (report.typings.empty()) {
            std::println(stderr, "Error: no typing left to finalize");
            return 1;
        }
        typmin::typing::Typing chosen = strategy.create_typing(report.typings.front());
        strategy.finalize_types(chosen);
        auto names = typmin::problem::final_type_names(chosen, *profile);
        if (!names) {
            std::println(stderr, "Error: finalization failed: {}", names.error().message);
            return 1;
        }
        report.final_typing = std::move(chosen);
        report.final_names = std::move(*names);
    }

    const nlohmann::json result = typmin::problem::report_to_json(report);
    const auto result_schema = std::filesystem::path(options.schema_dir) / kResultSchemaFile;
    if (auto validation = typmin::schema::validate_json(result, result_schema); !validation) {
        std::println(stderr, "Error: result schema validation failed: {}",
                     validation.error().message);
        return 1;
    }
    if (auto write = typmin::json_io::write_json_file(options.output, result); !write) {
        std::println(stderr, "Error: {}", write.error().message);
        return 1;
    }

    std::println("  input: {}", options.input);
    std::println("  output: {}", options.output);
    std::println("  survivors: {}", report.stats.survivor_count());
    return 0;
}

[[nodiscard]] int run_compare(const CompareOptions& options)
{
    auto problem = load_problem(options.input, options.schema_dir);
    if (!problem) {
        std::println(stderr, "Error: {}", problem.error().message);
        return 1;
    }
    const std::size_t count = problem->candidates.size();
    if (options.first >= count || options.second >= count) {
        std::println(stderr, "Error: candidate index out of range (problem has {} candidates)",
                     count);
        return 1;
    }
    auto hierarchy = typmin::hierarchy::ClassHierarchy::build(problem->classes);
    if (!hierarchy) {
        std::println(stderr, "Error: {}", hierarchy.error().message);
        return 1;
    }

    const auto ignore = typmin::typing::find_object_like_locals(problem->candidates);
    const auto order = typmin::typing::compare(problem->candidates[options.first],
                                               problem->candidates[options.second],
                                               *hierarchy,
                                               ignore);
    std::println("[compare] {} vs {}: {} ({})",
                 options.first,
                 options.second,
                 typmin::typing::typing_order_name(order),
                 std::to_underlying(order));
    return 0;
}

[[nodiscard]] int run_finalize(const FinalizeOptions& options)
{
    auto problem = load_problem(options.input, options.schema_dir);
    if (!problem) {
        std::println(stderr, "Error: {}", problem.error().message);
        return 1;
    }
    if (options.index >= problem->candidates.size()) {
        std::println(stderr, "Error: candidate index out of range (problem has {} candidates)",
                     problem->candidates.size());
        return 1;
    }
    auto profile = resolve_profile(options.profile, problem->profile);
    if (!profile) {
        std::println(stderr, "Error: {}", profile.error().message);
        return 1;
    }

    typmin::typing::Typing& typing = problem->candidates[options.index];
    const std::size_t replaced = typmin::typing::finalize_types(typing);
    auto names = typmin::problem::final_type_names(typing, *profile);
    if (!names) {
        std::println(stderr, "Error: finalization failed: {}", names.error().message);
        return 1;
    }

    std::println("[finalize] candidate {}: {} locals replaced", options.index, replaced);
    for (const auto& [local, name] : *names) {
        std::println("  {}: {}", local, name);
    }
    return 0;
}

int cmd_minimize(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_minimize_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_minimize_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_minimize_help();
        return 1;
    }
    return run_minimize(*options);
}

int cmd_compare(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_compare_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_compare_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_compare_help();
        return 1;
    }
    return run_compare(*options);
}

int cmd_finalize(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_finalize_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_finalize_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_finalize_help();
        return 1;
    }
    return run_finalize(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "minimize") {
            return cmd_minimize(sub_argc, sub_argv);
        }
        if (cmd == "compare") {
            return cmd_compare(sub_argc, sub_argv);
        }
        if (cmd == "finalize") {
            return cmd_finalize(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
