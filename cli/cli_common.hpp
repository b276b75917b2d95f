#ifndef LASERCUT_CLI_COMMON_HPP
#define LASERCUT_CLI_COMMON_HPP

#include <process/processing_options.hpp>
#include <serialization/config_json.hpp>
#include <serialization/report_json.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lasercut::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> report_path;
    bool verbose = false;
    bool debug = false;
    bool help = false;

    // Overrides applied on top of the config file
    std::optional<double> thickness;
    std::optional<double> tolerance;
    std::optional<int> threads;
};

namespace detail {

inline std::string require_value(int argc, char** argv, int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(flag + " requires an argument");
    }
    return argv[++i];
}

inline double parse_double(const std::string& text, const std::string& flag) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + text + "'");
    }
}

inline int parse_int(const std::string& text, const std::string& flag) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got '" + text + "'");
    }
}

}  // namespace detail

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            ctx.debug = true;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = detail::require_value(argc, argv, i, "-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = detail::require_value(argc, argv, i, "-c/--config");
        } else if (arg == "--report") {
            ctx.report_path = detail::require_value(argc, argv, i, "--report");
        } else if (arg == "-t" || arg == "--thickness") {
            ctx.thickness = detail::parse_double(detail::require_value(argc, argv, i, arg), arg);
        } else if (arg == "--tolerance") {
            ctx.tolerance = detail::parse_double(detail::require_value(argc, argv, i, arg), arg);
        } else if (arg == "-j" || arg == "--threads") {
            ctx.threads = detail::parse_int(detail::require_value(argc, argv, i, arg), arg);
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
        ++i;
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
    }
    return input + suffix;
}

// Read entire file to string
inline std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Processing options from the config file (if any), then command-line overrides
inline ProcessingOptions build_options(const CommandContext& ctx) {
    ProcessingOptions options;
    if (ctx.config_path) {
        nlohmann::json config = json::read_json_file(*ctx.config_path);
        try {
            options = config.get<ProcessingOptions>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + *ctx.config_path + ": " + e.what());
        }
    }
    if (ctx.thickness) options.thickness = *ctx.thickness;
    if (ctx.tolerance) options.thickness_tolerance = *ctx.tolerance;
    if (ctx.threads) options.num_threads = *ctx.threads;
    if (ctx.debug) options.debug_mode = true;
    options.validate();
    return options;
}

// Command function declarations
int command_convert(int argc, char** argv);
int command_inspect(int argc, char** argv);

}  // namespace lasercut::cli

#endif // LASERCUT_CLI_COMMON_HPP
