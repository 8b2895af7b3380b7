/**
 * @file ean13_tool.cpp
 * @brief Command-line front end: encode, decode, random, render
 * @version 1.0
 * @date 2026-10-19
 *
 * Exit status: 0 on success, 1 on any library or configuration error
 * (the error kind is echoed, e.g. "[InvalidDigitError] ..."), 2 on usage errors.
 *
 * @copyright Copyright (c) 2026
 */

#include "script_utils.hpp"
#include <fstream>
#include <memory>

using namespace ean13;

static bool verbose = false;

static void log_verbose(const std::string& tag, const std::string& message) {
    if (verbose) {
        std::cerr << "[" << tag << "] " << get_timestamp() << " " << message << "\n";
    }
}

// 13 characters are read as digits, anything else as a module pattern
static Ean13Code parse_code_or_pattern(const std::string& argument) {
    if (argument.size() == CODE_LENGTH) {
        return Ean13Code::from_string(argument);
    }
    return Codec::decode(ModulePattern::from_string(argument));
}

static Ean13Code parse_code_or_payload(const std::string& argument) {
    if (argument.size() == PAYLOAD_LENGTH) {
        return Codec::encode(argument);
    }
    return Ean13Code::from_string(argument);
}

static int run_encode(const ScriptConfig& args) {
    const Ean13Code code = Codec::encode(args.argument);
    log_verbose("ENCODE", "check digit " + std::to_string(code.check_digit()));
    std::cout << code.to_string() << "\n";
    std::cout << Codec::to_module_pattern(code).to_string() << "\n";
    return EXIT_OK;
}

static int run_decode(const ScriptConfig& args) {
    const Ean13Code code = parse_code_or_pattern(args.argument);
    log_verbose("DECODE", code.to_display_string());
    std::cout << code.to_string() << "\n";
    return EXIT_OK;
}

static int run_random(const ScriptConfig& args, const Ean13Config& config) {
    Constraint constraint = config.to_constraint();

    std::unique_ptr<FileExclusionSet> file;
    if (!config.exclude_file.empty()) {
        // With write-back a missing file is created on the first append
        file = FileExclusionSet::open(config.exclude_file, args.write_back, args.write_back);
        log_verbose("RANDOM", "loaded " + std::to_string(file->size()) + " excluded codes from " +
            config.exclude_file);
    }

    // Codes of this run go to the file when writing back, otherwise to a scratch set
    MemoryExclusionSet scratch;
    IExclusionStore* store = &scratch;
    if (file && args.write_back) {
        store = file.get();
    } else if (file) {
        constraint.exclusion = file.get();
    }

    ConstraintEngine engine = config.seed != 0 ? ConstraintEngine(config.seed) : ConstraintEngine();
    log_verbose("RANDOM", "prefix \"" + constraint.prefix_string() + "\", " +
        std::to_string(ConstraintEngine::free_space(constraint)) + " candidate payloads");

    const auto codes = engine.generate_batch(constraint, args.count, *store);
    for (const auto& code : codes) {
        std::cout << code.to_string() << "\n";
    }
    log_verbose("RANDOM", "last code: " + engine.last_stats().to_string());
    return EXIT_OK;
}

static int run_render(const ScriptConfig& args, const Ean13Config& config) {
    const Ean13Code code = parse_code_or_payload(args.argument);
    const Symbol symbol = Codec::to_symbol(code);
    const auto renderer = make_renderer(config.render_format);
    const std::string document = renderer->render(symbol, config.to_render_config());

    if (args.output_path.empty()) {
        std::cout << document;
        return EXIT_OK;
    }

    std::ofstream out(args.output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + args.output_path);
    }
    out << document;
    if (!out) {
        throw std::runtime_error("Write failed on " + args.output_path);
    }
    log_verbose("RENDER", to_string(config.render_format) + " written to " + args.output_path);
    return EXIT_OK;
}

int main(int argc, char* argv[]) {
    ScriptConfig args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        std::cerr << "Try '" << argv[0] << " -h' for usage.\n";
        return EXIT_USAGE;
    }

    if (args.help) {
        display_help(argv[0]);
        return EXIT_OK;
    }
    verbose = args.verbose;

    try {
        Ean13Config config = Ean13Config::load(args.config_file);
        apply_overrides(config, args);
        config.validate();
        if (args.config_file) {
            log_verbose("CONFIG", "loaded " + *args.config_file);
        }

        switch (args.command) {
        case Command::ENCODE:
            return run_encode(args);
        case Command::DECODE:
            return run_decode(args);
        case Command::RANDOM:
            return run_random(args, config);
        case Command::RENDER:
            return run_render(args, config);
        default:
            std::cerr << "[ERROR] No command given\n";
            return EXIT_USAGE;
        }
    } catch (const Ean13Exception& e) {
        std::cerr << "[" << e.kind() << "] " << e.what() << "\n";
        return EXIT_FAILURE_CORE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        return EXIT_FAILURE_CORE;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return EXIT_FAILURE_CORE;
    }
}
