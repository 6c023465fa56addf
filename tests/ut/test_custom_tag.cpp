#include "helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <isotlv/tlv.hpp>

namespace ut {
    using isotlv::error;

    namespace {
        /**
         * PIV (NIST SP 800-73-4) uses tag `34` for a primitive value even if its constructed bit is set.
         */
        class piv_tag {
            isotlv::tag _tag;

        public:
            static constexpr std::uint32_t primitive_override = 0x34;

            explicit piv_tag(isotlv::tag t) : _tag{t} {}

            [[nodiscard]] static isotlv::result<piv_tag> read(mlab::bin_stream &s) {
                ISOTLV_TRY_RESULT_AS_SILENT(isotlv::tag::read(s), r_tag) {
                    return piv_tag{*r_tag};
                }
            }

            [[nodiscard]] mlab::range<std::uint8_t const *> bytes() const { return _tag.bytes(); }
            [[nodiscard]] std::size_t size() const { return _tag.size(); }

            [[nodiscard]] bool is_constructed() const {
                return _tag.raw() != primitive_override and _tag.is_constructed();
            }

            [[nodiscard]] bool operator==(piv_tag const &other) const { return _tag == other._tag; }
            [[nodiscard]] bool operator!=(piv_tag const &other) const { return _tag != other._tag; }
        };

        static_assert(isotlv::tag_capability<piv_tag>);

        using piv_tlv = isotlv::tlv<piv_tag>;

        [[nodiscard]] piv_tag make_piv_tag(std::uint64_t n) {
            return piv_tag{make_tag(n)};
        }
    }// namespace

    TEST_CASE("0050 Custom tag overrides the constructed flag", "[tag][tlv]") {
        CHECK(make_piv_tag(0x34).bytes().size() == 1);
        CHECK(not make_piv_tag(0x34).is_constructed());
        CHECK(make_tag(0x34).is_constructed());
        CHECK(make_piv_tag(0x7f22).is_constructed());
        CHECK(not make_piv_tag(0x01).is_constructed());
    }

    TEST_CASE("0051 Custom tag construction", "[tlv]") {
        SECTION("Overridden tag takes a primitive value") {
            const auto r = piv_tlv::make(make_piv_tag(0x34), piv_tlv::value_type{mlab::bin_data{0x01, 0x02, 0x03}});
            CHECKED_IF(r) {
                CHECK(r->encode() == mlab::bin_data{0x34, 0x03, 0x01, 0x02, 0x03});
            }
        }

        SECTION("Overridden tag rejects a constructed value") {
            const auto r = piv_tlv::make(make_piv_tag(0x34), piv_tlv::value_type{std::vector<piv_tlv>{}});
            REQUIRE_FALSE(r);
            CHECK(r.error() == error::inconsistent);
        }

        SECTION("Default tag rejects a primitive value") {
            const auto r = isotlv::tlv<>::make(make_tag(0x34), isotlv::tlv<>::value_type{mlab::bin_data{0x01}});
            REQUIRE_FALSE(r);
            CHECK(r.error() == error::inconsistent);
        }
    }

    TEST_CASE("0052 Custom tag decode", "[tlv]") {
        SECTION("Top level") {
            const mlab::bin_data bd{0x34, 0x03, 0x01, 0x02, 0x03};

            const auto r_piv = piv_tlv::from_bytes(bd);
            CHECKED_IF(r_piv) {
                CHECK(not r_piv->is_constructed());
                CHECK(r_piv->get_value().data() == mlab::bin_data{0x01, 0x02, 0x03});
                CHECK(r_piv->encode() == bd);
            }

            const auto r_ber = isotlv::tlv<>::from_bytes(bd);
            REQUIRE_FALSE(r_ber);
            CHECK(r_ber.error() == error::truncated);
        }

        SECTION("Nested") {
            const mlab::bin_data bd{0x7c, 0x05, 0x34, 0x03, 0x01, 0x02, 0x03};

            const auto r = piv_tlv::from_bytes(bd);
            CHECKED_IF(r) {
                REQUIRE(r->is_constructed());
                REQUIRE(r->get_value().nodes().size() == 1);
                auto const *inner = r->find(make_piv_tag(0x34));
                REQUIRE(inner != nullptr);
                CHECK(inner->get_value().data() == mlab::bin_data{0x01, 0x02, 0x03});
                CHECK(r->encode() == bd);
            }

            CHECK_FALSE(isotlv::tlv<>::from_bytes(bd));
        }

        SECTION("Parse all") {
            const mlab::bin_data bd{0x34, 0x01, 0xaa, 0x34, 0x01, 0xbb};
            const auto nodes = piv_tlv::parse_all(bd);
            REQUIRE(nodes.size() == 2);
            CHECK(nodes[1].get_value().data() == mlab::bin_data{0xbb});
        }
    }

}// namespace ut
