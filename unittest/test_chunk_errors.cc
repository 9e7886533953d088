//
// Malformed and tampered chunk buffers
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    // Helper to track warnings
    struct warning_tracker {
        struct warning_info {
            std::uint64_t offset;
            std::string category;
            std::string message;
        };

        std::vector<warning_info> warnings;

        void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
            warnings.push_back({offset, std::string(category), std::string(message)});
        }
    };

    error_kind parse_failure(const std::vector<std::byte>& bytes, const parse_options& opts = {}) {
        try {
            (void)chunk::from_bytes(bytes, opts);
        } catch (const parse_error& e) {
            return e.kind();
        }
        FAIL("expected parse_error");
        return error_kind::truncated;
    }
}

TEST_CASE("Chunk parsing - minimum length") {
    SUBCASE("every size below 12 is rejected") {
        auto full = secret_chunk_bytes();
        for (std::size_t size = 0; size < chunk::min_size; size++) {
            std::vector<std::byte> shortened(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(size));
            CAPTURE(size);
            CHECK(parse_failure(shortened) == error_kind::truncated);
        }
    }

    SUBCASE("null pointer with zero size") {
        CHECK_THROWS_AS((void)chunk::from_bytes(nullptr, 0), parse_error);
    }

    SUBCASE("exactly 12 bytes is an empty chunk") {
        auto c = chunk::from_bytes(make_raw_chunk(0, "IEND", "", 0xAE426082u));
        CHECK(c.length() == 0);
        CHECK(c.type() == chunk_types::IEND);
    }
}

TEST_CASE("Chunk parsing - checksum") {
    SUBCASE("wrong stored CRC") {
        auto bytes = make_raw_chunk(42, "RuSt", secret_message, secret_message_crc - 1);
        CHECK(parse_failure(bytes) == error_kind::checksum_mismatch);
    }

    SUBCASE("message carries both values") {
        auto bytes = make_raw_chunk(42, "RuSt", secret_message, 2882656333u);
        try {
            (void)chunk::from_bytes(bytes);
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("2882656333") != std::string::npos);
            CHECK(msg.find("2882656334") != std::string::npos);
            CHECK(msg.find("RuSt") != std::string::npos);
        }
    }

    SUBCASE("lenient mode still verifies the CRC") {
        parse_options opts;
        opts.strict = false;
        auto bytes = make_raw_chunk(42, "RuSt", secret_message, 0);
        CHECK(parse_failure(bytes, opts) == error_kind::checksum_mismatch);
    }
}

TEST_CASE("Chunk parsing - invalid type bytes") {
    auto bytes = make_raw_chunk(42, "Ru1t", secret_message, secret_message_crc);
    CHECK(parse_failure(bytes) == error_kind::invalid_type_bytes);
}

TEST_CASE("Chunk parsing - tamper detection") {
    const auto original = secret_chunk_bytes();

    SUBCASE("every flipped bit is rejected in strict mode") {
        for (std::size_t i = 0; i < original.size(); i++) {
            for (int bit = 0; bit < 8; bit++) {
                auto tampered = original;
                tampered[i] ^= std::byte(1u << bit);
                CAPTURE(i);
                CAPTURE(bit);
                CHECK_THROWS_AS((void)chunk::from_bytes(tampered), parse_error);
            }
        }
    }

    SUBCASE("flipped bits by region") {
        auto flip = [&original](std::size_t index, unsigned mask) {
            auto tampered = original;
            tampered[index] ^= std::byte(mask);
            return tampered;
        };

        CHECK(parse_failure(flip(3, 0x01)) == error_kind::invalid_length);
        // Case bit keeps the byte a letter, so only the CRC can catch it
        CHECK(parse_failure(flip(5, 0x20)) == error_kind::checksum_mismatch);
        CHECK(parse_failure(flip(5, 0x40)) == error_kind::invalid_type_bytes);
        CHECK(parse_failure(flip(20, 0x01)) == error_kind::checksum_mismatch);
        CHECK(parse_failure(flip(original.size() - 1, 0x80)) == error_kind::checksum_mismatch);
    }
}

TEST_CASE("Chunk parsing - declared length boundary") {
    SUBCASE("declared length shorter than the payload (strict)") {
        auto bytes = make_raw_chunk(40, "RuSt", secret_message, secret_message_crc);
        CHECK(parse_failure(bytes) == error_kind::invalid_length);
    }

    SUBCASE("declared length longer than the payload (strict)") {
        auto bytes = make_raw_chunk(44, "RuSt", secret_message, secret_message_crc);
        CHECK(parse_failure(bytes) == error_kind::invalid_length);
    }

    SUBCASE("length field rewritten on a serialized chunk (strict)") {
        auto bytes = chunk(chunk_type("RuSt"), secret_message).to_bytes();
        bytes[3] = std::byte(44);
        CHECK(parse_failure(bytes) == error_kind::invalid_length);
    }

    SUBCASE("error message names both lengths") {
        auto bytes = make_raw_chunk(44, "RuSt", secret_message, secret_message_crc);
        try {
            (void)chunk::from_bytes(bytes);
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("44") != std::string::npos);
            CHECK(msg.find("42") != std::string::npos);
        }
    }

    SUBCASE("lenient mode frames by buffer size and warns") {
        parse_options opts;
        opts.strict = false;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        auto bytes = make_raw_chunk(44, "RuSt", secret_message, secret_message_crc);
        auto c = chunk::from_bytes(bytes, opts);

        // Length is always derived from the payload actually held
        CHECK(c.length() == 42);
        CHECK(c.crc() == secret_message_crc);
        CHECK(c.data_as_string() == secret_message);

        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "length_mismatch");
        CHECK(tracker.warnings[0].offset == 0);

        // Re-serializing repairs the length field
        CHECK(c.to_bytes() == secret_chunk_bytes());
    }

    SUBCASE("lenient mode without a handler") {
        parse_options opts;
        opts.strict = false;
        auto bytes = make_raw_chunk(0, "RuSt", secret_message, secret_message_crc);
        CHECK(chunk::from_bytes(bytes, opts).length() == 42);
    }

    SUBCASE("matching length produces no warning") {
        parse_options opts;
        opts.strict = false;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);
        (void)chunk::from_bytes(secret_chunk_bytes(), opts);
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("Chunk parsing - size limit") {
    SUBCASE("declared length above the configured maximum (strict)") {
        parse_options opts;
        opts.max_chunk_size = 16;
        CHECK(parse_failure(secret_chunk_bytes(), opts) == error_kind::invalid_length);
    }

    SUBCASE("declared length above the PNG limit (strict)") {
        auto bytes = make_raw_chunk(0x80000000u, "RuSt", secret_message, secret_message_crc);
        CHECK(parse_failure(bytes) == error_kind::invalid_length);
    }

    SUBCASE("lenient mode warns") {
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 16;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);

        auto c = chunk::from_bytes(secret_chunk_bytes(), opts);
        CHECK(c.length() == 42);
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].category == "size_limit");
    }
}
