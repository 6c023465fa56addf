#ifndef ISOTLV_TAG_HPP
#define ISOTLV_TAG_HPP

#include <array>
#include <concepts>
#include <isotlv/bits.hpp>
#include <isotlv/result.hpp>
#include <mlab/bin_data.hpp>
#include <string>
#include <string_view>

namespace isotlv {

    /**
     * @brief A BER-TLV tag, one to three bytes long.
     * Instances can only be obtained through the validating factories (@ref from_number, @ref from_hex, @ref from_bytes,
     * @ref read), therefore any @ref tag object always obeys the tag number grammar.
     * The first byte carries the class (bits 8-7), the constructed flag (bit 6) and either the tag number itself, or
     * `0x1f` to signal that one or two continuation bytes follow. Every continuation byte but the last has bit 8 set.
     */
    class tag {
        std::array<std::uint8_t, bits::max_tag_length> _bytes{};
        std::uint8_t _size = 0;

        tag(std::array<std::uint8_t, bits::max_tag_length> bytes, std::size_t size);

        [[nodiscard]] static result<tag> validate(std::array<std::uint8_t, bits::max_tag_length> bytes, std::size_t size);

    public:
        /**
         * @brief Builds a tag from its big-endian integer representation, e.g. `0x7f22`.
         * Leading zero bytes are stripped before validation.
         * @return The tag, or
         *  - @ref error::malformed_tag if @p n is zero or the bytes violate the grammar,
         *  - @ref error::tag_rfu if @p n needs four or more bytes.
         */
        [[nodiscard]] static result<tag> from_number(std::uint64_t n);

        /**
         * @brief Same as @ref from_number, but parses a hexadecimal string like `"7f22"`.
         * @return The tag, @ref error::parse_int_error if @p s is empty, has non-hex characters or overflows 64 bits,
         *  or any of the errors of @ref from_number.
         */
        [[nodiscard]] static result<tag> from_hex(std::string_view s);

        /**
         * @brief Parses a tag from its raw bytes, which must be consumed exactly.
         * @return The tag, @ref error::invalid_input if bytes are left over, or any of the errors of @ref read.
         */
        [[nodiscard]] static result<tag> from_bytes(mlab::bin_data const &data);

        /**
         * @brief Reads a tag from the current position of @p s.
         * On success, @p s is advanced past the last tag byte.
         * @return The tag, or
         *  - @ref error::truncated if @p s ends before the last continuation byte,
         *  - @ref error::tag_rfu if a fourth tag byte is announced,
         *  - @ref error::malformed_tag if the bytes violate the grammar.
         */
        [[nodiscard]] static result<tag> read(mlab::bin_stream &s);

        [[nodiscard]] mlab::range<std::uint8_t const *> bytes() const;
        [[nodiscard]] std::size_t size() const;

        /**
         * Big-endian integer formed by the tag bytes, e.g. `0x7f22`.
         */
        [[nodiscard]] std::uint32_t raw() const;

        [[nodiscard]] tag_class get_class() const;
        [[nodiscard]] bool is_constructed() const;
        [[nodiscard]] value_encoding encoding() const;

        [[nodiscard]] bool operator==(tag const &other) const;
        [[nodiscard]] bool operator!=(tag const &other) const;
    };

    /**
     * @brief Requirements for a type to be used as the tag of @ref value and @ref tlv.
     * Any such type must serialize to its canonical bytes, report their count, state whether the value it introduces
     * is constructed, and read itself from a @ref mlab::bin_stream. The constructed flag is the only thing the
     * decoding engine asks of the tag when choosing between a primitive and a constructed value; the bytes are
     * always emitted as they are.
     */
    template <class T>
    concept tag_capability = std::copyable<T> and std::equality_comparable<T> and
                             requires(T const &t, mlab::bin_stream &s) {
                                 { t.bytes() } -> mlab::is_byte_enumerable;
                                 { t.size() } -> std::convertible_to<std::size_t>;
                                 { t.is_constructed() } -> std::convertible_to<bool>;
                                 { T::read(s) } -> std::same_as<result<T>>;
                             };

    static_assert(tag_capability<tag>);

    namespace impl {
        /**
         * Parses a non-empty hexadecimal string, without prefix, into a 64 bits integer.
         * @return The number, or @ref error::parse_int_error.
         */
        [[nodiscard]] result<std::uint64_t> parse_hex(std::string_view s);
    }// namespace impl

    /**
     * Renders e.g. `7f22 (application, constructed)`.
     */
    [[nodiscard]] std::string to_string(tag const &t);

}// namespace isotlv

namespace mlab {
    bin_data &operator<<(bin_data &bd, isotlv::tag const &t);
}// namespace mlab

#endif//ISOTLV_TAG_HPP
