/**
 * @file module_pattern.cpp
 * @brief ModulePattern and Symbol implementation
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "../include/code/module_pattern.hpp"
#include "../include/exception/ean13_exception.hpp"

namespace ean13 {

    // === ModulePattern ===

    ModulePattern ModulePattern::from_string(const std::string& text) {
        std::vector<Module> modules;
        modules.reserve(text.size());

        for (std::size_t i = 0; i < text.size(); ++i) {
            switch (text[i]) {
            case '1':
                modules.push_back(Module::BAR);
                break;
            case '0':
                modules.push_back(Module::SPACE);
                break;
            default:
                throw MalformedPatternError(Status::WBAD_MODULE,
                    "ModulePattern::from_string: '" + std::string(1, text[i]) +
                    "' at module " + std::to_string(i));
            }
        }

        return ModulePattern(std::move(modules));
    }

    std::string ModulePattern::to_string() const {
        std::string out;
        out.reserve(modules_.size());
        for (Module m : modules_) {
            out.push_back(to_char(m));
        }
        return out;
    }

    void ModulePattern::append_bits(std::uint8_t bits, std::size_t width) {
        for (std::size_t i = width; i-- > 0;) {
            modules_.push_back(module_from_bit((bits >> i) & 0x01));
        }
    }

    std::uint8_t ModulePattern::read_bits(std::size_t offset, std::size_t width) const {
        std::uint8_t bits = 0;
        for (std::size_t i = 0; i < width; ++i) {
            bits = static_cast<std::uint8_t>((bits << 1) |
                (modules_[offset + i] == Module::BAR ? 1 : 0));
        }
        return bits;
    }

    // === Symbol ===

    bool Symbol::is_guard_module(std::size_t index) const {
        for (const auto& guard : guards) {
            if (index >= guard.offset && index < guard.offset + guard.width) {
                return true;
            }
        }
        return false;
    }

} // namespace ean13
