#ifndef ISOTLV_SIMPLE_HPP
#define ISOTLV_SIMPLE_HPP

#include <isotlv/bits.hpp>
#include <isotlv/result.hpp>
#include <mlab/bin_data.hpp>
#include <string_view>
#include <utility>
#include <vector>

/**
 * SIMPLE-TLV data objects: single byte tags, no nesting.
 */
namespace isotlv::simple {

    /**
     * @brief A SIMPLE-TLV tag, any byte but `0x00` and `0xff`.
     */
    class tag {
        std::uint8_t _value;

        explicit tag(std::uint8_t value);

    public:
        /**
         * @return The tag, or @ref error::invalid_input if @p b is `0x00` or `0xff`.
         */
        [[nodiscard]] static result<tag> from_byte(std::uint8_t b);

        /**
         * @return The tag, @ref error::parse_int_error if @p s is not a hexadecimal byte, or
         *  @ref error::invalid_input if it is `00` or `ff`.
         */
        [[nodiscard]] static result<tag> from_hex(std::string_view s);

        [[nodiscard]] static result<tag> read(mlab::bin_stream &s);

        [[nodiscard]] std::uint8_t raw() const;

        [[nodiscard]] bool operator==(tag const &other) const;
        [[nodiscard]] bool operator!=(tag const &other) const;
    };

    /**
     * @brief A SIMPLE-TLV data object.
     * The length field is one byte for values shorter than 255 bytes, otherwise `0xff` followed by the length on two
     * big-endian bytes. Values are therefore limited to 65535 bytes.
     */
    class tlv {
        tag _tag;
        mlab::bin_data _value;

        tlv(tag t, mlab::bin_data value);

    public:
        /**
         * @return The data object, or @ref error::invalid_length if @p value is longer than 65535 bytes.
         */
        [[nodiscard]] static result<tlv> make(tag t, mlab::bin_data value);

        /**
         * @return The data object read from @p s, @ref error::truncated if @p s ends early, or @ref error::invalid_input
         *  if the tag byte is not valid.
         */
        [[nodiscard]] static result<tlv> read(mlab::bin_stream &s);

        /**
         * @return The outcome of @ref read on @p data and the bytes that were not consumed.
         */
        [[nodiscard]] static std::pair<result<tlv>, mlab::range<mlab::bin_data::const_iterator>> parse(mlab::bin_data const &data);
        static std::pair<result<tlv>, mlab::range<mlab::bin_data::const_iterator>> parse(mlab::bin_data &&data) = delete;

        /**
         * @return The data object spanning all of @p data, any error of @ref read, or @ref error::invalid_input if
         *  bytes are left over.
         */
        [[nodiscard]] static result<tlv> from_bytes(mlab::bin_data const &data);

        /**
         * Decodes concatenated data objects, stopping at the first error.
         */
        [[nodiscard]] static std::vector<tlv> parse_all(mlab::bin_data const &data);

        [[nodiscard]] tag get_tag() const;
        [[nodiscard]] mlab::bin_data const &get_value() const;

        /**
         * Total encoded size: tag, length field and value.
         */
        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] mlab::bin_data encode() const;

        [[nodiscard]] bool operator==(tlv const &other) const;
        [[nodiscard]] bool operator!=(tlv const &other) const;
    };

}// namespace isotlv::simple

namespace mlab {
    bin_data &operator<<(bin_data &bd, isotlv::simple::tag const &t);
    bin_data &operator<<(bin_data &bd, isotlv::simple::tlv const &t);
}// namespace mlab

#endif//ISOTLV_SIMPLE_HPP
