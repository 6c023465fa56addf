#include <algorithm>
#include <isotlv/msg.hpp>
#include <isotlv/tag.hpp>
#include <mlab/byte_order.hpp>
#include <mlab/strutils.hpp>

namespace isotlv {

    namespace {
        [[nodiscard]] constexpr bool has_more_bytes(std::uint8_t b) {
            return (b & bits::tag_more_bytes_bit) != 0;
        }

        [[nodiscard]] constexpr bool announces_continuation(std::uint8_t first) {
            return (first & bits::tag_number_mask) == bits::tag_number_mask;
        }

        [[nodiscard]] constexpr int hex_digit_value(char c) {
            if ('0' <= c and c <= '9') {
                return c - '0';
            } else if ('a' <= c and c <= 'f') {
                return 0xa + (c - 'a');
            } else if ('A' <= c and c <= 'F') {
                return 0xa + (c - 'A');
            }
            return -1;
        }
    }// namespace

    tag::tag(std::array<std::uint8_t, bits::max_tag_length> bytes, std::size_t size)
        : _bytes{bytes}, _size{std::uint8_t(size)} {}

    result<tag> tag::validate(std::array<std::uint8_t, bits::max_tag_length> bytes, std::size_t size) {
        switch (size) {
            case 0:
                return error::malformed_tag;
            case 1:
                if (announces_continuation(bytes[0])) {
                    return error::malformed_tag;
                }
                break;
            case 2:
                if (not announces_continuation(bytes[0]) or has_more_bytes(bytes[1])) {
                    return error::malformed_tag;
                }
                break;
            case 3:
                if (not announces_continuation(bytes[0]) or not has_more_bytes(bytes[1]) or has_more_bytes(bytes[2])) {
                    return error::malformed_tag;
                }
                break;
            default:
                return error::tag_rfu;
        }
        return tag{bytes, size};
    }

    result<tag> tag::from_number(std::uint64_t n) {
        const auto be = mlab::msb_unsigned_encode<std::uint64_t, sizeof(std::uint64_t)>(n);
        const auto first_nonzero = std::find_if(std::begin(be), std::end(be), [](std::uint8_t b) { return b != 0x00; });
        const auto size = std::size_t(std::distance(first_nonzero, std::end(be)));
        if (size > bits::max_tag_length) {
            return error::tag_rfu;
        }
        std::array<std::uint8_t, bits::max_tag_length> bytes{};
        std::copy(first_nonzero, std::end(be), std::begin(bytes));
        return validate(bytes, size);
    }

    result<std::uint64_t> impl::parse_hex(std::string_view s) {
        if (s.empty()) {
            return error::parse_int_error;
        }
        std::uint64_t n = 0;
        for (char c : s) {
            const int digit = hex_digit_value(c);
            // Also catches overflow
            if (digit < 0 or (n >> 60) != 0) {
                return error::parse_int_error;
            }
            n = (n << 4) | std::uint64_t(digit);
        }
        return n;
    }

    result<tag> tag::from_hex(std::string_view s) {
        ISOTLV_TRY_RESULT_AS_SILENT(impl::parse_hex(s), r_n) {
            return from_number(*r_n);
        }
    }

    result<tag> tag::from_bytes(mlab::bin_data const &data) {
        mlab::bin_stream s{data};
        ISOTLV_TRY_RESULT_AS_SILENT(read(s), r_tag) {
            if (s.remaining() > 0) {
                return error::invalid_input;
            }
            return *r_tag;
        }
    }

    result<tag> tag::read(mlab::bin_stream &s) {
        std::array<std::uint8_t, bits::max_tag_length> bytes{};
        bytes[0] = s.pop();
        if (s.bad()) {
            return error::truncated;
        }
        std::size_t size = 1;
        if (announces_continuation(bytes[0])) {
            std::uint8_t b = 0x00;
            do {
                b = s.pop();
                if (s.bad()) {
                    return error::truncated;
                }
                if (size >= bits::max_tag_length) {
                    return error::tag_rfu;
                }
                bytes[size++] = b;
            } while (has_more_bytes(b));
        }
        return validate(bytes, size);
    }

    mlab::range<std::uint8_t const *> tag::bytes() const {
        return {_bytes.data(), _bytes.data() + _size};
    }

    std::size_t tag::size() const {
        return _size;
    }

    std::uint32_t tag::raw() const {
        std::uint32_t n = 0;
        for (std::uint8_t b : bytes()) {
            n = (n << 8) | b;
        }
        return n;
    }

    tag_class tag::get_class() const {
        return static_cast<tag_class>(_bytes[0] & bits::tag_class_mask);
    }

    bool tag::is_constructed() const {
        return (_bytes[0] & bits::tag_constructed_bit) != 0;
    }

    value_encoding tag::encoding() const {
        return is_constructed() ? value_encoding::constructed : value_encoding::primitive;
    }

    bool tag::operator==(tag const &other) const {
        return _size == other._size and std::equal(std::begin(bytes()), std::end(bytes()), std::begin(other.bytes()));
    }

    bool tag::operator!=(tag const &other) const {
        return not operator==(other);
    }

    std::string to_string(tag const &t) {
        const auto hex = mlab::data_to_hex_string(std::begin(t.bytes()), std::end(t.bytes()));
        return mlab::concatenate({hex, " (", to_string(t.get_class()), ", ", to_string(t.encoding()), ")"});
    }

}// namespace isotlv

namespace mlab {
    bin_data &operator<<(bin_data &bd, isotlv::tag const &t) {
        return bd << t.bytes();
    }
}// namespace mlab
