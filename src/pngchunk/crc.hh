//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>

namespace pngchunk {
    class chunk_type;

    // CRC-32/ISO-HDLC as used by PNG: reflected 0xEDB88320, init and xorout 0xFFFFFFFF
    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size);

    // CRC of type bytes followed by payload bytes
    std::uint32_t chunk_crc(const chunk_type& type, const void* data, std::size_t size);
}
