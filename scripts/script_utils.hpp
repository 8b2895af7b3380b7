/**
 * @file script_utils.hpp
 * @brief Command-line parsing and helpers for the ean13 tool
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "../include/ean13.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <getopt.h>

namespace ean13 {

// === Exit Codes ===

    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILURE_CORE = 1;
    static constexpr int EXIT_USAGE = 2;

// === Common Utility Functions ===

/**
 * @brief Get current timestamp as formatted string
 * @return std::string Timestamp in format "HH:MM:SS.mmm"
 */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto timer = std::chrono::system_clock::to_time_t(now);
        std::tm bt = *std::localtime(&timer);

        std::ostringstream oss;
        oss << std::put_time(&bt, "%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

// === Command-Line Argument Parsing ===

/**
 * @brief Subcommand enumeration
 */
    enum class Command {
        NONE,
        ENCODE,     // 12 digits -> code and pattern
        DECODE,     // 13 digits or 95 modules -> validated code
        RANDOM,     // constrained generation
        RENDER      // code -> ascii / svg document
    };

/**
 * @brief Program configuration structure
 *
 * Options left unset keep the value from the config file / environment.
 */
    struct ScriptConfig {
        Command command = Command::NONE;
        std::string argument;
        bool help = false;
        bool verbose = false;
        std::optional<std::string> config_file;

        // Random-specific configuration
        std::optional<std::string> prefix;
        std::optional<std::string> exclude_file;
        std::uint64_t count = 1;
        std::optional<std::uint64_t> max_attempts;
        std::optional<std::uint64_t> seed;
        bool write_back = false;

        // Render-specific configuration
        std::optional<RenderFormat> format;
        std::string output_path;
    };

/**
 * @brief Display help message for tool usage
 * @param program_name The name of the program (argv[0])
 */
    inline void display_help(const std::string& program_name) {
        std::cout << "Usage: " << program_name << " [OPTIONS] <command> [ARG]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <12 digits>           Append the check digit, print code and pattern\n";
        std::cout << "  decode <13 digits|pattern>   Validate a code or decode a 95-module pattern\n";
        std::cout << "  random                       Generate codes under prefix/exclusion constraints\n";
        std::cout << "  render <12 or 13 digits>     Draw the symbol\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  -c, --config <file>         JSON config file (see config/ean13_config.json)\n";
        std::cout << "  -v, --verbose               Verbose progress on stderr\n";
        std::cout << "  -h, --help                  Display this help message\n";
        std::cout << "\n";
        std::cout << "Random options:\n";
        std::cout << "  -p, --prefix <P>            Fixed leading digits, 0 to 11 of them\n";
        std::cout << "  -e, --exclude-file <F>      Exclusion file, one 13-digit code per line\n";
        std::cout << "  -n, --count <count>         Number of distinct codes to generate (default: 1)\n";
        std::cout << "  -a, --max-attempts <N>      Candidate budget per code (default: 1000000)\n";
        std::cout << "  -s, --seed <seed>           Random seed for reproducible runs (0 = random)\n";
        std::cout << "  -w, --write-back            Append generated codes to the exclusion file\n";
        std::cout << "\n";
        std::cout << "Render options:\n";
        std::cout << "  -f, --format <format>       Output format: ascii or svg (default: ascii)\n";
        std::cout << "  -o, --output <file>         Write to file instead of stdout\n";
        std::cout << "\n";
        std::cout << "Environment variables EAN13_* override the config file;\n";
        std::cout << "command-line options override both.\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << program_name << " encode 400638133393\n";
        std::cout << "  " << program_name << " decode 4006381333931\n";
        std::cout << "  " << program_name << " random --prefix 400638 --exclude-file printed.txt -w -n 5\n";
        std::cout << "  " << program_name << " render 4006381333931 -f svg -o code.svg\n";
    }

/**
 * @brief Parse a subcommand name
 * @throws std::invalid_argument if the name is unknown
 */
    inline Command command_from_string(const std::string& name) {
        if (name == "encode") return Command::ENCODE;
        if (name == "decode") return Command::DECODE;
        if (name == "random") return Command::RANDOM;
        if (name == "render") return Command::RENDER;
        throw std::invalid_argument("Unknown command: " + name);
    }

/**
 * @brief Parse decimal unsigned integer from string
 * @param value_str String representation of integer
 * @return std::uint64_t Parsed integer value
 * @throws std::invalid_argument if string is not a valid unsigned integer
 */
    inline std::uint64_t parse_uint64(const std::string& value_str) {
        if (value_str.empty() || !std::all_of(value_str.begin(), value_str.end(),
            [](char c) { return c >= '0' && c <= '9'; })) {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }
        try {
            return std::stoull(value_str);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Integer out of range: " + value_str);
        }
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return ScriptConfig Parsed configuration
 * @throws std::invalid_argument if arguments are invalid
 */
    inline ScriptConfig parse_arguments(int argc, char* argv[]) {
        ScriptConfig config;
        int opt;
        bool random_option = false;
        bool render_option = false;

        static const struct option long_options[] = {
            {"help",         no_argument,       nullptr, 'h'},
            {"verbose",      no_argument,       nullptr, 'v'},
            {"config",       required_argument, nullptr, 'c'},
            {"prefix",       required_argument, nullptr, 'p'},
            {"exclude-file", required_argument, nullptr, 'e'},
            {"count",        required_argument, nullptr, 'n'},
            {"max-attempts", required_argument, nullptr, 'a'},
            {"seed",         required_argument, nullptr, 's'},
            {"write-back",   no_argument,       nullptr, 'w'},
            {"format",       required_argument, nullptr, 'f'},
            {"output",       required_argument, nullptr, 'o'},
            {nullptr,        0,                 nullptr, 0}
        };

        // Restart scanning so the parser can run more than once per process
        optind = 0;
        opterr = 0;
        while ((opt = getopt_long(argc, argv, "hvc:p:e:n:a:s:wf:o:", long_options,
            nullptr)) != -1) {
            switch (opt) {
            case 'h':
                config.help = true;
                break;

            case 'v':
                config.verbose = true;
                break;

            case 'c':
                config.config_file = std::string(optarg);
                break;

            case 'p':
                config.prefix = std::string(optarg);
                random_option = true;
                break;

            case 'e':
                config.exclude_file = std::string(optarg);
                random_option = true;
                break;

            case 'n':
                config.count = parse_uint64(optarg);
                if (config.count == 0) {
                    throw std::invalid_argument("Count must be > 0");
                }
                random_option = true;
                break;

            case 'a':
                config.max_attempts = parse_uint64(optarg);
                random_option = true;
                break;

            case 's':
                config.seed = parse_uint64(optarg);
                random_option = true;
                break;

            case 'w':
                config.write_back = true;
                random_option = true;
                break;

            case 'f': {
                bool use_default = false;
                config.format = render_format_from_string(optarg, use_default);
                if (use_default) {
                    throw std::invalid_argument("Invalid format: " + std::string(optarg) +
                        " (use 'ascii' or 'svg')");
                }
                render_option = true;
                break;
            }

            case 'o':
                config.output_path = optarg;
                render_option = true;
                break;

            case '?': {
                // optopt is 0 for an unrecognized long option
                const std::string offending = (optind > 0 && optind <= argc) ?
                    std::string(argv[optind - 1]) : std::string();
                if (optopt == 'c' || optopt == 'p' || optopt == 'e' || optopt == 'n' ||
                    optopt == 'a' || optopt == 's' || optopt == 'f' || optopt == 'o') {
                    throw std::invalid_argument("Option " + offending + " requires an argument");
                }
                if (optopt == 0) {
                    throw std::invalid_argument("Unknown option: " + offending);
                }
                throw std::invalid_argument("Unknown option: -" +
                    std::string(1, static_cast<char>(optopt)));
            }

            default:
                throw std::invalid_argument("Invalid command-line arguments");
            }
        }

        if (config.help) {
            return config;
        }

        // Positional arguments: <command> [ARG]
        if (optind >= argc) {
            throw std::invalid_argument("Missing command");
        }
        config.command = command_from_string(argv[optind++]);

        const bool needs_argument = config.command != Command::RANDOM;
        if (needs_argument) {
            if (optind >= argc) {
                throw std::invalid_argument("Missing argument for command " +
                    std::string(argv[optind - 1]));
            }
            config.argument = argv[optind++];
        }
        if (optind < argc) {
            throw std::invalid_argument("Unexpected argument: " + std::string(argv[optind]));
        }

        if (random_option && config.command != Command::RANDOM) {
            throw std::invalid_argument(
                "Options --prefix --exclude-file -n -a -s -w only apply to 'random'");
        }
        if (render_option && config.command != Command::RENDER) {
            throw std::invalid_argument("Options -f -o only apply to 'render'");
        }
        if (config.write_back && !config.exclude_file) {
            throw std::invalid_argument("Option -w requires --exclude-file <file>");
        }

        return config;
    }

/**
 * @brief Apply command-line overrides on top of the loaded configuration
 */
    inline void apply_overrides(Ean13Config& config, const ScriptConfig& args) {
        if (args.prefix) config.prefix = *args.prefix;
        if (args.exclude_file) config.exclude_file = *args.exclude_file;
        if (args.max_attempts) config.max_attempts = *args.max_attempts;
        if (args.seed) config.seed = *args.seed;
        if (args.format) config.render_format = *args.format;
    }

} // namespace ean13
