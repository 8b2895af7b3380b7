/**
 * @file renderer.hpp
 * @brief Renderer interface and render settings shared by all output formats
 * @version 1.0
 * @date 2026-10-19
 *
 * Renderers turn a Symbol into a printable document. They are pure: the
 * same Symbol and RenderConfig always produce byte-identical output.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "../code/module_pattern.hpp"

namespace ean13 {

    /**
     * @brief Supported output formats
     */
    enum class RenderFormat : std::uint8_t {
        ASCII = 0,
        SVG = 1
    };

    inline std::string to_string(RenderFormat format) {
        switch (format) {
        case RenderFormat::SVG:
            return "svg";
        default:
            return "ascii";
        }
    }

    /**
     * @brief Parse a format name ("ascii" or "svg", case-insensitive)
     * @param name Format name
     * @param use_default Set to true when the name is unknown; ASCII is returned
     * @return RenderFormat Parsed format
     */
    RenderFormat render_format_from_string(const std::string& name, bool& use_default);

    /**
     * @brief Drawing parameters
     *
     * Sizes are in modules. ASCII output repeats each module `module_width`
     * characters and prints `bar_height` rows. SVG output uses `module_width`
     * user units per module and scales the heights by the same factor.
     */
    struct RenderConfig {
        std::size_t module_width = 1;
        std::size_t bar_height = 10;
        std::size_t guard_extension = 5;    // extra guard bar length (SVG only)
        bool show_text = true;

        /**
         * @brief Validate the settings
         * @throws std::invalid_argument if module_width or bar_height is 0
         */
        void validate() const;
    };

    /**
     * @brief Abstract renderer
     */
    class IRenderer {
        public:
            virtual ~IRenderer() = default;

            /**
             * @brief Render one symbol
             * @param symbol Pattern and layout from Codec::to_symbol()
             * @param config Drawing parameters
             * @return std::string The complete document
             * @throws std::invalid_argument if config is invalid
             */
            virtual std::string render(const Symbol& symbol, const RenderConfig& config) const = 0;

            virtual RenderFormat format() const = 0;
    };

    /**
     * @brief Create the renderer for a format
     * @return std::unique_ptr<IRenderer> New renderer (ownership transferred)
     */
    std::unique_ptr<IRenderer> make_renderer(RenderFormat format);

} // namespace ean13
