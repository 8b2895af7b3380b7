/**
 * @file svg_renderer.hpp
 * @brief SVG 1.1 renderer
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <sstream>

#include "renderer.hpp"

namespace ean13 {

    /**
     * @brief Renders a symbol as a standalone SVG document
     *
     * One <rect> per run of adjacent bar modules. Guard bars are drawn
     * guard_extension modules longer than digit bars. With show_text the
     * digits are printed under their groups and the first digit left of the
     * start guard.
     */
    class SvgRenderer : public IRenderer {
        public:
            std::string render(const Symbol& symbol, const RenderConfig& config) const override;

            RenderFormat format() const override { return RenderFormat::SVG; }

        private:
            static void write_bars(std::ostringstream& out, const Symbol& symbol,
                const RenderConfig& config);

            static void write_text(std::ostringstream& out, const Symbol& symbol,
                const RenderConfig& config);
    };

} // namespace ean13
