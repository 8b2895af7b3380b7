/**
 * @file ean13_config.hpp
 * @brief Configuration for generation and rendering
 * @version 1.0
 * @date 2026-10-19
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/ean13_config.json)
 * 2. Environment variables (EAN13_*)
 * 3. Programmatic defaults
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../render/renderer.hpp"
#include "constraint_builder.hpp"

namespace ean13 {

    /**
     * @brief Settings of the ean13 tool
     *
     * Environment Variables:
     *
     * - EAN13_MAX_ATTEMPTS: candidate budget per generated code (default: 1000000)
     *
     * - EAN13_SEQUENTIAL_THRESHOLD: consecutive rejections before the sequential scan (default: 1000)
     *
     * - EAN13_TIME_BUDGET_MS: time budget per generated code, 0 = unbounded (default: 0)
     *
     * - EAN13_SEED: random seed, 0 = seed from std::random_device (default: 0)
     *
     * - EAN13_PREFIX: fixed leading payload digits (default: "")
     *
     * - EAN13_EXCLUDE_FILE: exclusion file path, empty = none (default: "")
     *
     * - EAN13_RENDER_FORMAT: ascii or svg (default: ascii)
     *
     * - EAN13_MODULE_WIDTH: characters / units per module (default: 1)
     *
     * - EAN13_BAR_HEIGHT: bar height in rows / modules (default: 10)
     *
     * - EAN13_GUARD_EXTENSION: extra guard bar length in modules (default: 5)
     *
     * - EAN13_SHOW_TEXT: print the digits under the bars (default: true)
     */
    struct Ean13Config {
        // === Generation ===
        std::uint64_t max_attempts = DEFAULT_MAX_ATTEMPTS;
        std::uint64_t sequential_threshold = DEFAULT_SEQUENTIAL_THRESHOLD;
        std::uint32_t time_budget_ms = 0;
        std::uint64_t seed = 0;
        std::string prefix;
        std::string exclude_file;

        // === Rendering ===
        RenderFormat render_format = RenderFormat::ASCII;
        std::uint32_t module_width = 1;
        std::uint32_t bar_height = 10;
        std::uint32_t guard_extension = 5;
        bool show_text = true;

        /**
         * @brief Validate configuration
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Create default configuration
         */
        static Ean13Config create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., ean13_config.json)
         * @return Ean13Config Defaults overridden by the file
         * @throws std::runtime_error if file cannot be read or parsed
         * @throws std::invalid_argument if a value is malformed
         */
        static Ean13Config from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing "ean13_config"
         * @return Ean13Config Defaults overridden by the object
         * @throws std::invalid_argument if a value is malformed
         */
        static Ean13Config from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         * @return Ean13Config with merged settings
         * @throws std::runtime_error if the given file cannot be read or parsed
         */
        static Ean13Config load(const std::optional<std::string>& config_file_path = std::nullopt);

        /**
         * @brief Generation constraint described by this config, without exclusion set
         * @throws InvalidDigitError (WBAD_PREFIX) if the prefix is invalid
         */
        Constraint to_constraint() const;

        RenderConfig to_render_config() const;

        /**
         * @brief Serialize under "ean13_config", as from_json() reads it
         */
        nlohmann::json to_json() const;

        private:
            /**
             * @brief Apply configuration from key-value map
             * @param config Configuration to update
             * @param vars EAN13_* keys and their string values
             * @throws std::invalid_argument on a malformed value
             */
            static void apply_config_map(Ean13Config& config,
                const std::map<std::string, std::string>& vars);
    };

} // namespace ean13
