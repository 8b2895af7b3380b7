/**
 * @file ean13_config.cpp
 * @brief Configuration structure implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/ean13_config.hpp"

using json = nlohmann::json;

namespace ean13 {

    namespace {

        // Every key understood by apply_config_map(), also read from the environment
        const char* const CONFIG_KEYS[] = {
            "EAN13_MAX_ATTEMPTS",
            "EAN13_SEQUENTIAL_THRESHOLD",
            "EAN13_TIME_BUDGET_MS",
            "EAN13_SEED",
            "EAN13_PREFIX",
            "EAN13_EXCLUDE_FILE",
            "EAN13_RENDER_FORMAT",
            "EAN13_MODULE_WIDTH",
            "EAN13_BAR_HEIGHT",
            "EAN13_GUARD_EXTENSION",
            "EAN13_SHOW_TEXT"
        };

        // JSON numbers only: a negative or fractional value is an error, never wrapped or truncated
        std::uint64_t unsigned_value(const json& section, const std::string& key) {
            const auto& value = section[key];
            if (value.is_number_unsigned()) {
                return value.get<std::uint64_t>();
            }
            if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
                return static_cast<std::uint64_t>(value.get<std::int64_t>());
            }
            throw std::invalid_argument("Invalid value for " + key + ": " + value.dump() +
                " (expected a non-negative integer)");
        }

        std::uint64_t parse_unsigned(const std::string& key, const std::string& value) {
            if (value.empty() || value[0] == '-') {
                throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
            }
            std::size_t pos = 0;
            std::uint64_t parsed = 0;
            try {
                parsed = std::stoull(value, &pos, 10);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
            }
            if (pos != value.size()) {
                throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
            }
            return parsed;
        }

        std::uint32_t parse_uint32(const std::string& key, const std::string& value) {
            const std::uint64_t parsed = parse_unsigned(key, value);
            if (parsed > 0xFFFFFFFFull) {
                throw std::invalid_argument("Value out of range for " + key + ": " + value);
            }
            return static_cast<std::uint32_t>(parsed);
        }

        bool parse_bool(const std::string& key, const std::string& value) {
            std::string lower = value;
            std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
            if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
                return true;
            }
            if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
                return false;
            }
            throw std::invalid_argument("Invalid boolean for " + key + ": '" + value + "'");
        }

    } // namespace

    // === Configuration Validation ===

    void Ean13Config::validate() const {
        if (max_attempts == 0) {
            throw std::invalid_argument("max_attempts must be > 0");
        }

        if (prefix.size() >= PAYLOAD_LENGTH) {
            throw std::invalid_argument("Prefix must have fewer than 12 digits: " + prefix);
        }
        if (!std::all_of(prefix.begin(), prefix.end(),
            [](char c) { return c >= '0' && c <= '9'; })) {
            throw std::invalid_argument("Prefix must contain only digits: " + prefix);
        }

        if (module_width == 0 || module_width > 100) {
            throw std::invalid_argument("module_width must be in [1, 100]");
        }
        if (bar_height == 0 || bar_height > 1000) {
            throw std::invalid_argument("bar_height must be in [1, 1000]");
        }
        if (guard_extension > 1000) {
            throw std::invalid_argument("guard_extension too large (max 1000)");
        }
    }

    // === Factory Methods ===

    Ean13Config Ean13Config::create_default() {
        Ean13Config config;
        config.max_attempts = DEFAULT_MAX_ATTEMPTS;
        config.sequential_threshold = DEFAULT_SEQUENTIAL_THRESHOLD;
        config.time_budget_ms = 0;
        config.seed = 0;
        config.prefix.clear();
        config.exclude_file.clear();
        config.render_format = RenderFormat::ASCII;
        config.module_width = 1;
        config.bar_height = 10;
        config.guard_extension = 5;
        config.show_text = true;
        return config;
    }

    // === Conversions ===

    Constraint Ean13Config::to_constraint() const {
        Constraint constraint;
        constraint.prefix = parse_prefix(prefix);
        constraint.max_attempts = max_attempts;
        constraint.sequential_threshold = sequential_threshold;
        if (time_budget_ms > 0) {
            constraint.time_budget = std::chrono::milliseconds(time_budget_ms);
        }
        return constraint;
    }

    RenderConfig Ean13Config::to_render_config() const {
        RenderConfig render;
        render.module_width = module_width;
        render.bar_height = bar_height;
        render.guard_extension = guard_extension;
        render.show_text = show_text;
        return render;
    }

    json Ean13Config::to_json() const {
        return json{
            {"ean13_config", {
                {"max_attempts", max_attempts},
                {"sequential_threshold", sequential_threshold},
                {"time_budget_ms", time_budget_ms},
                {"seed", seed},
                {"prefix", prefix},
                {"exclude_file", exclude_file},
                {"render_format", to_string(render_format)},
                {"module_width", module_width},
                {"bar_height", bar_height},
                {"guard_extension", guard_extension},
                {"show_text", show_text}
            }}
        };
    }

    // === JSON Parsing ===

    Ean13Config Ean13Config::from_json(const json& j) {
        Ean13Config config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("ean13_config")) {
            const auto& ec = j["ean13_config"];
            try {
                if (ec.contains("max_attempts")) {
                    config_map["EAN13_MAX_ATTEMPTS"] =
                        std::to_string(unsigned_value(ec, "max_attempts"));
                }
                if (ec.contains("sequential_threshold")) {
                    config_map["EAN13_SEQUENTIAL_THRESHOLD"] =
                        std::to_string(unsigned_value(ec, "sequential_threshold"));
                }
                if (ec.contains("time_budget_ms")) {
                    config_map["EAN13_TIME_BUDGET_MS"] =
                        std::to_string(unsigned_value(ec, "time_budget_ms"));
                }
                if (ec.contains("seed")) {
                    config_map["EAN13_SEED"] = std::to_string(unsigned_value(ec, "seed"));
                }
                if (ec.contains("prefix")) {
                    config_map["EAN13_PREFIX"] = ec["prefix"].get<std::string>();
                }
                if (ec.contains("exclude_file")) {
                    config_map["EAN13_EXCLUDE_FILE"] = ec["exclude_file"].get<std::string>();
                }
                if (ec.contains("render_format")) {
                    config_map["EAN13_RENDER_FORMAT"] = ec["render_format"].get<std::string>();
                }
                if (ec.contains("module_width")) {
                    config_map["EAN13_MODULE_WIDTH"] =
                        std::to_string(unsigned_value(ec, "module_width"));
                }
                if (ec.contains("bar_height")) {
                    config_map["EAN13_BAR_HEIGHT"] =
                        std::to_string(unsigned_value(ec, "bar_height"));
                }
                if (ec.contains("guard_extension")) {
                    config_map["EAN13_GUARD_EXTENSION"] =
                        std::to_string(unsigned_value(ec, "guard_extension"));
                }
                if (ec.contains("show_text")) {
                    config_map["EAN13_SHOW_TEXT"] = ec["show_text"].get<bool>() ? "true" : "false";
                }
            } catch (const json::type_error& e) {
                throw std::invalid_argument(std::string("Wrong value type in ean13_config: ") +
                    e.what());
            }
        }

        apply_config_map(config, config_map);
        return config;
    }

    void Ean13Config::apply_config_map(Ean13Config& config,
        const std::map<std::string, std::string>& vars) {
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
            auto it = vars.find(key);
            if (it != vars.end()) {
                return it->second;
            }
            return std::nullopt;
        };

        // Generation
        if (auto val = get_val("EAN13_MAX_ATTEMPTS")) {
            config.max_attempts = parse_unsigned("EAN13_MAX_ATTEMPTS", *val);
        }
        if (auto val = get_val("EAN13_SEQUENTIAL_THRESHOLD")) {
            config.sequential_threshold = parse_unsigned("EAN13_SEQUENTIAL_THRESHOLD", *val);
        }
        if (auto val = get_val("EAN13_TIME_BUDGET_MS")) {
            config.time_budget_ms = parse_uint32("EAN13_TIME_BUDGET_MS", *val);
        }
        if (auto val = get_val("EAN13_SEED")) {
            config.seed = parse_unsigned("EAN13_SEED", *val);
        }
        if (auto val = get_val("EAN13_PREFIX")) {
            config.prefix = *val;
        }
        if (auto val = get_val("EAN13_EXCLUDE_FILE")) {
            config.exclude_file = *val;
        }

        // Rendering
        if (auto val = get_val("EAN13_RENDER_FORMAT")) {
            bool use_default = false;
            config.render_format = render_format_from_string(*val, use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid render format: " + *val);
            }
        }
        if (auto val = get_val("EAN13_MODULE_WIDTH")) {
            config.module_width = parse_uint32("EAN13_MODULE_WIDTH", *val);
        }
        if (auto val = get_val("EAN13_BAR_HEIGHT")) {
            config.bar_height = parse_uint32("EAN13_BAR_HEIGHT", *val);
        }
        if (auto val = get_val("EAN13_GUARD_EXTENSION")) {
            config.guard_extension = parse_uint32("EAN13_GUARD_EXTENSION", *val);
        }
        if (auto val = get_val("EAN13_SHOW_TEXT")) {
            config.show_text = parse_bool("EAN13_SHOW_TEXT", *val);
        }
    }

    // === Load Methods ===

    Ean13Config Ean13Config::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            return from_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
        }
    }

    Ean13Config Ean13Config::load(const std::optional<std::string>& config_file_path) {
        // Start with defaults, then the file if one was given
        Ean13Config config = config_file_path ? from_file(*config_file_path) : create_default();

        // Environment variables have the highest priority
        std::map<std::string, std::string> env_vars;
        for (const char* key : CONFIG_KEYS) {
            if (const char* val = std::getenv(key)) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace ean13
