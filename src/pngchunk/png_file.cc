//
// Created by igor on 16/08/2025.
//

#include <pngchunk/png_file.hh>
#include <pngchunk/byte_order.hh>

#include <algorithm>
#include <cstring>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>

#include "input.hh"

namespace pngchunk {

    png_file::png_file(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    bool png_file::has_signature(const void* data, std::size_t size) {
        return data && size >= signature.size() &&
               std::memcmp(data, signature.data(), signature.size()) == 0;
    }

    png_file png_file::from_bytes(const void* data, std::size_t size, const parse_options& options) {
        THROW_PARSE_UNLESS(has_signature(data, size), bad_signature,
                           "Buffer of ", size, " bytes does not start with the PNG signature");

        byte_reader in(data, size);
        in.seek(signature.size());

        std::vector<chunk> chunks;
        while (in.remaining() > 0) {
            std::uint64_t offset = in.tell();
            THROW_PARSE_IF(in.remaining() < chunk::min_size, truncated,
                           "Trailing ", in.remaining(), " bytes at offset ", offset,
                           " are too short for a chunk");

            // The declared length is the only framing a container has
            auto declared = load<std::uint32_t>(in.current(), byte_order::big);
            THROW_PARSE_IF(declared > in.remaining() - chunk::min_size, truncated,
                           "Chunk at offset ", offset, " declares ", declared,
                           " payload bytes but only ", in.remaining() - chunk::min_size, " remain");

            auto region = in.subreader(chunk::min_size + declared);

            parse_options chunk_options = options;
            if (options.on_warning) {
                chunk_options.on_warning = [&options, offset](std::uint64_t o, std::string_view category,
                                                              std::string_view message) {
                    options.on_warning(offset + o, category, message);
                };
            }
            chunks.push_back(chunk::from_bytes(region.current(), region.size(), chunk_options));
        }

        return png_file(std::move(chunks));
    }

    png_file png_file::from_bytes(const std::vector<std::byte>& bytes, const parse_options& options) {
        return from_bytes(bytes.data(), bytes.size(), options);
    }

    png_file png_file::from_bytes(const std::vector<std::byte>& bytes) {
        return from_bytes(bytes.data(), bytes.size(), parse_options{});
    }

    png_file png_file::from_stream(std::istream& is, const parse_options& options) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        std::string contents{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
        THROW_IO_IF(is.bad(), "Stream read failed");

        return from_bytes(contents.data(), contents.size(), options);
    }

    png_file png_file::from_stream(std::istream& is) {
        return from_stream(is, parse_options{});
    }

    void png_file::append(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png_file::remove_first(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        THROW_PARSE_IF(it == m_chunks.end(), chunk_not_found, "No chunk of type '", type, "'");

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png_file::find(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png_file::to_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.serialized_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (auto b : signature) {
            out.push_back(std::byte(b));
        }
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    void png_file::write_to(std::ostream& os) const {
        auto bytes = to_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_IF(os.fail(), "Failed to write ", bytes.size(), " bytes of PNG data");
    }

    std::string png_file::to_string() const {
        std::ostringstream oss;
        for (const auto& c : m_chunks) {
            oss << c << '\n';
        }
        return oss.str();
    }

} // namespace pngchunk
