//
// Created by igor on 16/08/2025.
//

#include "utf8.hh"

#include <cstdint>

namespace pngchunk {

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) noexcept {
        std::size_t i = 0;
        while (i < size) {
            auto lead = static_cast<std::uint8_t>(data[i]);
            if (lead < 0x80) {
                i++;
                continue;
            }

            std::size_t extra;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                extra = 1;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                extra = 2;
                if (lead == 0xE0) {
                    lo = 0xA0;  // overlong
                } else if (lead == 0xED) {
                    hi = 0x9F;  // surrogates
                }
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                extra = 3;
                if (lead == 0xF0) {
                    lo = 0x90;  // overlong
                } else if (lead == 0xF4) {
                    hi = 0x8F;  // > U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i <= extra) {
                return i;
            }
            auto second = static_cast<std::uint8_t>(data[i + 1]);
            if (second < lo || second > hi) {
                return i;
            }
            for (std::size_t k = 2; k <= extra; k++) {
                auto cont = static_cast<std::uint8_t>(data[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    return i;
                }
            }
            i += extra + 1;
        }
        return std::nullopt;
    }
}
