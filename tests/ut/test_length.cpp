#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <isotlv/length.hpp>
#include <isotlv/msg.hpp>

namespace ut {
    using isotlv::ber_length;
    using isotlv::error;

    namespace {
        struct length_sample {
            std::size_t length;
            mlab::bin_data encoded;
        };
    }// namespace

    TEST_CASE("0020 BER length forms", "[length]") {
        const auto sample = GENERATE(
                length_sample{0, {0x00}},
                length_sample{1, {0x01}},
                length_sample{127, {0x7f}},
                length_sample{128, {0x81, 0x80}},
                length_sample{255, {0x81, 0xff}},
                length_sample{256, {0x82, 0x01, 0x00}},
                length_sample{65535, {0x82, 0xff, 0xff}},
                length_sample{65536, {0x83, 0x01, 0x00, 0x00}},
                length_sample{0xffffff, {0x83, 0xff, 0xff, 0xff}},
                length_sample{0x1000000, {0x84, 0x01, 0x00, 0x00, 0x00}});

        SECTION("Encode") {
            mlab::bin_data bd;
            bd << ber_length{sample.length};
            CHECK(bd == sample.encoded);
            CHECK(isotlv::length_size(sample.length) == sample.encoded.size());
        }

        SECTION("Decode") {
            mlab::bin_stream s{sample.encoded};
            const auto r = isotlv::read_length(s);
            CHECKED_IF(r) {
                CHECK(*r == sample.length);
                CHECK(s.eof());
            }
        }
    }

    TEST_CASE("0021 BER length decode errors", "[length]") {
        SECTION("Too many length bytes") {
            const mlab::bin_data bd = GENERATE(mlab::bin_data{0x85, 0x00, 0x00, 0x00, 0x00, 0x01}, mlab::bin_data{0xff});
            mlab::bin_stream s{bd};
            const auto r = isotlv::read_length(s);
            REQUIRE_FALSE(r);
            CHECK(r.error() == error::invalid_length);
        }

        SECTION("Truncated") {
            const mlab::bin_data bd = GENERATE(mlab::bin_data{}, mlab::bin_data{0x81}, mlab::bin_data{0x82, 0x01}, mlab::bin_data{0x84, 0x01, 0x00, 0x00});
            mlab::bin_stream s{bd};
            const auto r = isotlv::read_length(s);
            REQUIRE_FALSE(r);
            CHECK(r.error() == error::truncated);
        }

        SECTION("Long form with no length bytes reads as zero") {
            const mlab::bin_data bd{0x80};
            mlab::bin_stream s{bd};
            const auto r = isotlv::read_length(s);
            CHECKED_IF(r) {
                CHECK(*r == 0);
            }
        }
    }

}// namespace ut
