/**
 * @file test_renderer.cpp
 * @brief Unit tests for the ascii and svg renderers
 * @version 1.0
 * @date 2026-10-19
 */

#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "../include/render/renderer.hpp"
#include "../include/render/ascii_renderer.hpp"
#include "../include/render/svg_renderer.hpp"
#include "../include/interface/codec.hpp"

using namespace ean13;

namespace {

    std::vector<std::string> lines_of(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::size_t count_of(const std::string& text, const std::string& needle) {
        std::size_t count = 0;
        for (auto pos = text.find(needle); pos != std::string::npos;
            pos = text.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }

    // Number of maximal runs of bar modules in a pattern
    std::size_t bar_runs(const ModulePattern& pattern) {
        std::size_t runs = 0;
        for (std::size_t i = 0; i < pattern.size(); ++i) {
            if (pattern[i] == Module::BAR && (i == 0 || pattern[i - 1] == Module::SPACE)) {
                ++runs;
            }
        }
        return runs;
    }

} // namespace

TEST_CASE("render_format_from_string - Names", "[render]") {
    bool use_default = false;
    REQUIRE(render_format_from_string("svg", use_default) == RenderFormat::SVG);
    REQUIRE_FALSE(use_default);
    REQUIRE(render_format_from_string("ASCII", use_default) == RenderFormat::ASCII);
    REQUIRE_FALSE(use_default);
    REQUIRE(render_format_from_string("pdf", use_default) == RenderFormat::ASCII);
    REQUIRE(use_default);

    REQUIRE(to_string(RenderFormat::SVG) == "svg");
    REQUIRE(make_renderer(RenderFormat::SVG)->format() == RenderFormat::SVG);
    REQUIRE(make_renderer(RenderFormat::ASCII)->format() == RenderFormat::ASCII);
}

TEST_CASE("AsciiRenderer - Layout", "[render][ascii]") {
    const auto symbol = Codec::to_symbol(Ean13Code::from_string("4006381333931"));
    AsciiRenderer renderer;
    RenderConfig config;

    SECTION("Rows, widths and text line") {
        config.bar_height = 4;
        config.module_width = 2;
        auto lines = lines_of(renderer.render(symbol, config));

        REQUIRE(lines.size() == 5);
        for (const auto& line : lines) {
            REQUIRE(line.size() == (11 + 95 + 7) * 2);
        }
        // Quiet zone then the start guard: bar, space, bar
        REQUIRE(lines[0].substr(0, 22) == std::string(22, ' '));
        REQUIRE(lines[0].substr(22, 6) == "##  ##");
        REQUIRE(lines[0] == lines[3]);

        // Digits appear in order on the text line
        std::string digits;
        for (char c : lines[4]) {
            if (c != ' ') digits.push_back(c);
        }
        REQUIRE(digits == "4006381333931");
    }

    SECTION("Without text") {
        config.show_text = false;
        config.bar_height = 3;
        auto lines = lines_of(renderer.render(symbol, config));
        REQUIRE(lines.size() == 3);
    }

    SECTION("Bar count matches the pattern") {
        config.bar_height = 1;
        config.show_text = false;
        auto row = lines_of(renderer.render(symbol, config))[0];
        std::string modules = row.substr(11, 95);
        for (auto& c : modules) {
            c = c == '#' ? '1' : '0';
        }
        REQUIRE(modules == symbol.pattern.to_string());
    }

    SECTION("Deterministic") {
        REQUIRE(renderer.render(symbol, config) == renderer.render(symbol, config));
    }

    SECTION("Invalid config") {
        config.module_width = 0;
        REQUIRE_THROWS_AS(renderer.render(symbol, config), std::invalid_argument);
    }
}

TEST_CASE("SvgRenderer - Document", "[render][svg]") {
    const auto symbol = Codec::to_symbol(Ean13Code::from_string("5901234123457"));
    SvgRenderer renderer;
    RenderConfig config;
    config.module_width = 2;
    config.bar_height = 50;
    config.guard_extension = 5;

    const std::string svg = renderer.render(symbol, config);

    REQUIRE(svg.rfind("<?xml", 0) == 0);
    REQUIRE(svg.find("version=\"1.1\"") != std::string::npos);
    REQUIRE(svg.find("width=\"226\"") != std::string::npos);
    REQUIRE(svg.find("</svg>") != std::string::npos);

    SECTION("One rect per bar run plus the background") {
        REQUIRE(count_of(svg, "<rect ") == bar_runs(symbol.pattern) + 1);
    }

    SECTION("Guard bars are longer than digit bars") {
        // Six guard bars at 55 modules, the rest at 50
        REQUIRE(count_of(svg, "height=\"110\"/>") == 6);
        REQUIRE(count_of(svg, "height=\"100\"/>") == bar_runs(symbol.pattern) - 6);
    }

    SECTION("Thirteen digits of text") {
        REQUIRE(count_of(svg, "<text ") == 13);
        config.show_text = false;
        REQUIRE(count_of(renderer.render(symbol, config), "<text ") == 0);
    }

    SECTION("Deterministic") {
        REQUIRE(renderer.render(symbol, config) == svg);
    }
}
