#ifndef TETRIS_CLI_COMMON_HPP
#define TETRIS_CLI_COMMON_HPP

#include <common/errors.hpp>
#include <common/logging.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/render_options.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tetris::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

// Render options from the -c file, or the defaults
inline RenderOptions load_render_options(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return RenderOptions{};
    }
    logging::get_logger()->debug("Loading render config: {}", *ctx.config_path);
    try {
        return json::read_json_file(*ctx.config_path).get<RenderOptions>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid render config " + *ctx.config_path + ": " + e.what());
    }
}

// Command function declarations
int command_render(int argc, char** argv);
int command_print(int argc, char** argv);
int command_info(int argc, char** argv);

}  // namespace tetris::cli

#endif // TETRIS_CLI_COMMON_HPP
