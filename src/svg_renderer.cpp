/**
 * @file svg_renderer.cpp
 * @brief SVG renderer implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include <algorithm>

#include "../include/render/svg_renderer.hpp"

namespace ean13 {

    namespace {

        // Digit glyphs are one element wide
        std::size_t font_size(const RenderConfig& config) {
            return MODULES_PER_DIGIT * config.module_width;
        }

    } // namespace

    std::string SvgRenderer::render(const Symbol& symbol, const RenderConfig& config) const {
        config.validate();

        const std::size_t width = symbol.total_width() * config.module_width;
        const std::size_t bar_height = config.bar_height * config.module_width;
        std::size_t below = config.guard_extension * config.module_width;
        if (config.show_text) {
            below = std::max(below, font_size(config) + config.module_width);
        }
        const std::size_t height = bar_height + below;

        std::ostringstream out;
        out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        out << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" width=\"" << width
            << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << " " << height
            << "\">\n";
        out << "  <title>EAN-13 " << symbol.code.to_string() << "</title>\n";
        out << "  <rect x=\"0\" y=\"0\" width=\"" << width << "\" height=\"" << height
            << "\" fill=\"white\"/>\n";
        write_bars(out, symbol, config);
        if (config.show_text) {
            write_text(out, symbol, config);
        }
        out << "</svg>\n";
        return out.str();
    }

    void SvgRenderer::write_bars(std::ostringstream& out, const Symbol& symbol,
        const RenderConfig& config) {
        const std::size_t mw = config.module_width;
        const std::size_t digit_height = config.bar_height * mw;
        const std::size_t guard_height = digit_height + config.guard_extension * mw;

        out << "  <g fill=\"black\">\n";
        std::size_t i = 0;
        while (i < symbol.pattern.size()) {
            if (symbol.pattern[i] != Module::BAR) {
                ++i;
                continue;
            }
            // A run ends at a space or where guard and digit modules meet
            const bool guard = symbol.is_guard_module(i);
            std::size_t end = i + 1;
            while (end < symbol.pattern.size() && symbol.pattern[end] == Module::BAR &&
                symbol.is_guard_module(end) == guard) {
                ++end;
            }
            out << "    <rect x=\"" << (symbol.quiet_zone_left + i) * mw << "\" y=\"0\" width=\""
                << (end - i) * mw << "\" height=\"" << (guard ? guard_height : digit_height)
                << "\"/>\n";
            i = end;
        }
        out << "  </g>\n";
    }

    void SvgRenderer::write_text(std::ostringstream& out, const Symbol& symbol,
        const RenderConfig& config) {
        const std::size_t mw = config.module_width;
        const std::size_t size = font_size(config);
        const std::size_t baseline = config.bar_height * mw + size;

        out << "  <g font-family=\"monospace\" font-size=\"" << size
            << "\" text-anchor=\"middle\" fill=\"black\">\n";

        if (symbol.quiet_zone_left >= 4) {
            out << "    <text x=\"" << (symbol.quiet_zone_left - 4) * mw << "\" y=\"" << baseline
                << "\">" << static_cast<int>(symbol.code.first_digit()) << "</text>\n";
        }
        for (const auto& span : symbol.digits) {
            const std::size_t x = (symbol.quiet_zone_left + span.offset) * mw +
                (MODULES_PER_DIGIT * mw) / 2;
            out << "    <text x=\"" << x << "\" y=\"" << baseline << "\">"
                << static_cast<int>(symbol.code[span.digit_index]) << "</text>\n";
        }
        out << "  </g>\n";
    }

} // namespace ean13
