//
// Created by igor on 15/08/2025.
//

#include "crc.hh"

#include <algorithm>
#include <limits>
#include <zlib.h>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) {
        // zlib takes uInt lengths
        constexpr std::size_t max_block = std::numeric_limits<uInt>::max();

        uLong value = crc;
        const auto* p = static_cast<const Bytef*>(data);
        while (size > 0) {
            auto block = std::min(size, max_block);
            value = ::crc32(value, p, static_cast<uInt>(block));
            p += block;
            size -= block;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size) {
        auto bytes = type.bytes();
        std::uint32_t crc = crc32_update(0, bytes.data(), bytes.size());
        return crc32_update(crc, data, size);
    }

} // namespace pngchunk
