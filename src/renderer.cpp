/**
 * @file renderer.cpp
 * @brief Render settings validation and renderer factory
 * @version 1.0
 * @date 2026-10-19
 */

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "../include/render/renderer.hpp"
#include "../include/render/ascii_renderer.hpp"
#include "../include/render/svg_renderer.hpp"

namespace ean13 {

    RenderFormat render_format_from_string(const std::string& name, bool& use_default) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        use_default = false;
        if (lower == "ascii" || lower == "text") {
            return RenderFormat::ASCII;
        }
        if (lower == "svg") {
            return RenderFormat::SVG;
        }
        use_default = true;
        return RenderFormat::ASCII;
    }

    void RenderConfig::validate() const {
        if (module_width == 0) {
            throw std::invalid_argument("Module width must be > 0");
        }
        if (bar_height == 0) {
            throw std::invalid_argument("Bar height must be > 0");
        }
    }

    std::unique_ptr<IRenderer> make_renderer(RenderFormat format) {
        switch (format) {
        case RenderFormat::SVG:
            return std::make_unique<SvgRenderer>();
        default:
            return std::make_unique<AsciiRenderer>();
        }
    }

} // namespace ean13
