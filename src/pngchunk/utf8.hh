//
// Created by igor on 16/08/2025.
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngchunk {

    /**
     * @brief Locate the first byte that does not start a valid UTF-8 sequence
     * @return Offset of the offending sequence, or nullopt if @p data is valid UTF-8
     *
     * Rejects overlong encodings, UTF-16 surrogates and code points past U+10FFFF.
     */
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) noexcept;
}
