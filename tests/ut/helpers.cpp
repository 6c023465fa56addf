#include "helpers.hpp"
#include <catch2/catch_test_macros.hpp>

namespace ut {

    isotlv::tag make_tag(std::uint64_t n) {
        auto r = isotlv::tag::from_number(n);
        REQUIRE(r);
        return *r;
    }

    isotlv::tlv<> make_primitive(std::uint64_t tag, mlab::bin_data payload) {
        auto r = isotlv::tlv<>::make(make_tag(tag), isotlv::tlv<>::value_type{std::move(payload)});
        REQUIRE(r);
        return std::move(*r);
    }

    isotlv::tlv<> make_constructed(std::uint64_t tag, std::vector<isotlv::tlv<>> children) {
        auto r = isotlv::tlv<>::make(make_tag(tag), isotlv::tlv<>::value_type{std::move(children)});
        REQUIRE(r);
        return std::move(*r);
    }

    mlab::bin_data make_payload(std::size_t n) {
        mlab::bin_data bd;
        bd.resize(n);
        for (std::size_t i = 0; i < n; ++i) {
            bd[i] = std::uint8_t(i & 0xff);
        }
        return bd;
    }

    isotlv::tlv<> make_chain(std::size_t levels) {
        auto node = make_primitive(0x01, {});
        for (std::size_t i = 1; i < levels; ++i) {
            std::vector<isotlv::tlv<>> children;
            children.push_back(std::move(node));
            node = make_constructed(0xe1, std::move(children));
        }
        return node;
    }

}// namespace ut
