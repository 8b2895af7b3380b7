/**
 * @file ascii_renderer.hpp
 * @brief Text renderer drawing bars with '#'
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include "renderer.hpp"

namespace ean13 {

    /**
     * @brief Renders a symbol as rows of '#' (bar) and ' ' (space)
     *
     * Every output line, the optional digit line included, is exactly
     * Symbol::total_width() * module_width characters wide and ends with '\n'.
     */
    class AsciiRenderer : public IRenderer {
        public:
            std::string render(const Symbol& symbol, const RenderConfig& config) const override;

            RenderFormat format() const override { return RenderFormat::ASCII; }

        private:
            static std::string bar_row(const Symbol& symbol, std::size_t module_width);

            static std::string text_row(const Symbol& symbol, std::size_t module_width);
    };

} // namespace ean13
