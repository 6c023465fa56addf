#ifndef TESTS_HELPERS_HPP
#define TESTS_HELPERS_HPP

#include <isotlv/tlv.hpp>
#include <utility>
#include <vector>

namespace ut {

    /**
     * Use within test cases. Builds the tag for @p n, aborting the test case if @p n is not a valid tag.
     */
    [[nodiscard]] isotlv::tag make_tag(std::uint64_t n);

    [[nodiscard]] isotlv::tlv<> make_primitive(std::uint64_t tag, mlab::bin_data payload);

    [[nodiscard]] isotlv::tlv<> make_constructed(std::uint64_t tag, std::vector<isotlv::tlv<>> children);

    /**
     * Bytes `00 01 02 ... ff 00 01 ...`, @p n in total.
     */
    [[nodiscard]] mlab::bin_data make_payload(std::size_t n);

    /**
     * A chain of constructed nodes with tag `e1`, @p levels deep in total, ending with an empty primitive `01`.
     */
    [[nodiscard]] isotlv::tlv<> make_chain(std::size_t levels);

    /**
     * True if `T::parse` accepts a temporary buffer, which would leave the returned remainder dangling.
     */
    template <class T>
    concept parses_temporaries = requires(mlab::bin_data &&bd) { T::parse(std::move(bd)); };

}// namespace ut

#endif//TESTS_HELPERS_HPP
