/**
 * @file ascii_renderer.cpp
 * @brief Text renderer implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include "../include/render/ascii_renderer.hpp"

namespace ean13 {

    std::string AsciiRenderer::render(const Symbol& symbol, const RenderConfig& config) const {
        config.validate();

        const std::string row = bar_row(symbol, config.module_width);
        std::string out;
        out.reserve((row.size() + 1) * (config.bar_height + 1));
        for (std::size_t i = 0; i < config.bar_height; ++i) {
            out += row;
            out += '\n';
        }
        if (config.show_text) {
            out += text_row(symbol, config.module_width);
            out += '\n';
        }
        return out;
    }

    std::string AsciiRenderer::bar_row(const Symbol& symbol, std::size_t module_width) {
        std::string row(symbol.quiet_zone_left * module_width, ' ');
        for (std::size_t i = 0; i < symbol.pattern.size(); ++i) {
            row.append(module_width, symbol.pattern[i] == Module::BAR ? '#' : ' ');
        }
        row.append(symbol.quiet_zone_right * module_width, ' ');
        return row;
    }

    std::string AsciiRenderer::text_row(const Symbol& symbol, std::size_t module_width) {
        std::string row(symbol.total_width() * module_width, ' ');
        const auto& code = symbol.code;

        // First digit sits in the left quiet zone, two modules before the start guard
        if (symbol.quiet_zone_left >= 2) {
            row[(symbol.quiet_zone_left - 2) * module_width] =
                static_cast<char>('0' + code.first_digit());
        }

        // Remaining digits are centered under their 7-module element
        for (const auto& span : symbol.digits) {
            const std::size_t column = (symbol.quiet_zone_left + span.offset) * module_width +
                (MODULES_PER_DIGIT * module_width) / 2;
            row[column] = static_cast<char>('0' + code[span.digit_index]);
        }
        return row;
    }

} // namespace ean13
