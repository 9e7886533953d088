#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <unordered_map>
#include <set>

using namespace pngchunk;

namespace {
    error_kind kind_of(std::string_view text) {
        try {
            (void)chunk_type::from_string(text);
        } catch (const parse_error& e) {
            return e.kind();
        }
        FAIL("expected parse_error for '" << text << "'");
        return error_kind::invalid_length;
    }
}

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            chunk_type::bytes_type expected = {82, 117, 83, 116};
            auto actual = chunk_type::from_bytes(expected);
            CHECK(actual.bytes() == expected);
        }

        SUBCASE("from string matches from bytes") {
            auto expected = chunk_type::from_bytes(chunk_type::bytes_type{82, 117, 83, 116});
            auto actual = chunk_type::from_string("RuSt");
            CHECK(actual == expected);
        }

        SUBCASE("explicit string_view constructor") {
            chunk_type t("RuSt");
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("from raw pointer") {
            unsigned char raw[4] = {'I', 'H', 'D', 'R'};
            CHECK(chunk_type::from_bytes(raw) == chunk_types::IHDR);
        }

        SUBCASE("case is preserved") {
            for (const char* text : {"abcd", "ABCD", "aBcD", "ZzYy"}) {
                auto t = chunk_type::from_string(text);
                CHECK(t.to_string() == text);
            }
        }

        SUBCASE("bytes() returns a copy") {
            auto t = chunk_type::from_string("RuSt");
            auto b = t.bytes();
            b[0] = 'X';
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("literal") {
            constexpr auto t = "ruSt"_ct;
            static_assert(!t.is_critical());
            static_assert(t.is_safe_to_copy());
            CHECK(t == chunk_type("ruSt"));
        }
    }

    TEST_CASE("chunk_type letter-only enforcement") {
        SUBCASE("digit in text") {
            CHECK(kind_of("Ru1t") == error_kind::invalid_character);
            CHECK_FALSE(chunk_type::try_parse("Ru1t").has_value());
        }

        SUBCASE("wrong text length") {
            CHECK(kind_of("") == error_kind::invalid_length);
            CHECK(kind_of("Rus") == error_kind::invalid_length);
            CHECK(kind_of("RuStY") == error_kind::invalid_length);
            CHECK_FALSE(chunk_type::try_parse("RuStY").has_value());
        }

        SUBCASE("length is checked before characters") {
            CHECK(kind_of("1") == error_kind::invalid_length);
        }

        SUBCASE("characters adjacent to the letter ranges") {
            for (const char* text : {"@AAA", "A[AA", "AA`A", "AAA{", "AA A"}) {
                CHECK(kind_of(text) == error_kind::invalid_character);
            }
        }

        SUBCASE("raw bytes with a digit") {
            chunk_type::bytes_type raw = {82, 117, 0x31, 116};
            try {
                (void)chunk_type::from_bytes(raw);
                FAIL("expected parse_error");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_type_bytes);
                std::string msg = e.what();
                CHECK(msg.find("byte 2") != std::string::npos);
                CHECK(msg.find("0x31") != std::string::npos);
            }
        }

        SUBCASE("raw bytes outside ASCII") {
            chunk_type::bytes_type raw = {static_cast<char>(0xC1), 'A', 'A', 'A'};
            CHECK_THROWS_AS((void)chunk_type::from_bytes(raw), parse_error);
        }

        SUBCASE("null raw buffer") {
            try {
                (void)chunk_type::from_bytes(nullptr);
                FAIL("expected parse_error");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::truncated);
            }
        }

        SUBCASE("errors derive from pngchunk_error") {
            CHECK_THROWS_AS(chunk_type("Ru1t"), pngchunk_error);
        }

        SUBCASE("is_valid_byte") {
            CHECK(chunk_type::is_valid_byte('a'));
            CHECK(chunk_type::is_valid_byte('Z'));
            CHECK_FALSE(chunk_type::is_valid_byte('0'));
            CHECK_FALSE(chunk_type::is_valid_byte(0));
            CHECK_FALSE(chunk_type::is_valid_byte(static_cast<char>(0xE9)));
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("RuSt") {
            auto t = chunk_type::from_string("RuSt");
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
            CHECK(t.is_valid());
        }

        SUBCASE("ancillary") {
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
        }

        SUBCASE("reserved bit set") {
            auto t = chunk_type::from_string("Rust");
            CHECK_FALSE(t.is_reserved_bit_valid());
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("unsafe to copy") {
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("validity ignores the other flags") {
            auto t = chunk_type::from_string("abCd");
            CHECK_FALSE(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_safe_to_copy());
            CHECK(t.is_valid());
        }

        SUBCASE("standard types") {
            CHECK(chunk_types::IHDR.is_critical());
            CHECK(chunk_types::IHDR.is_public());
            CHECK(chunk_types::IEND.is_valid());
            CHECK_FALSE(chunk_types::IDAT.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type display and comparison") {
        SUBCASE("to_string") {
            CHECK(chunk_type::from_string("RuSt").to_string() == "RuSt");
        }

        SUBCASE("stream output") {
            std::ostringstream oss;
            oss << chunk_type::from_string("RuSt");
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("hex stream output") {
            std::ostringstream oss;
            oss << std::hex << chunk_types::IEND;
            CHECK(oss.str() == "0x49454e44");
        }

        SUBCASE("to_uint32 is big-endian") {
            CHECK(chunk_types::IHDR.to_uint32() == 0x49484452u);
            static_assert("ruSt"_ct.to_uint32() == 0x72755374u);
        }

        SUBCASE("per-byte access goes through bytes()") {
            auto b = chunk_type("RuSt").bytes();
            CHECK(b[0] == 'R');
            CHECK(b[3] == 't');
            CHECK((b[1] & chunk_type::property_bit) != 0);
        }

        SUBCASE("ordering and equality") {
            auto a = chunk_type("AAAA");
            auto b = chunk_type("AAAB");
            CHECK(a < b);
            CHECK(a != b);
            CHECK(a == chunk_type("AAAA"));
            CHECK(chunk_type("AAAA") != chunk_type("aAAA"));
        }

        SUBCASE("usable as map key") {
            std::unordered_map<chunk_type, int> counts;
            counts[chunk_types::IDAT]++;
            counts[chunk_types::IDAT]++;
            counts[chunk_types::IEND]++;
            CHECK(counts[chunk_types::IDAT] == 2);
            CHECK(counts.size() == 2);

            std::set<chunk_type> sorted = {chunk_types::IEND, chunk_types::IDAT, chunk_types::IHDR};
            CHECK(*sorted.begin() == chunk_types::IDAT);
        }
    }
}
