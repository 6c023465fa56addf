#include <isotlv/length.hpp>
#include <mlab/byte_order.hpp>

namespace isotlv {

    namespace {
        [[nodiscard]] std::size_t significant_bytes(std::size_t n) {
            std::size_t count = 0;
            for (; n > 0; n >>= 8) {
                ++count;
            }
            return count;
        }
    }// namespace

    std::size_t length_size(std::size_t length) {
        if (length <= bits::max_short_length) {
            return 1;
        }
        return 1 + significant_bytes(length);
    }

    result<std::size_t> read_length(mlab::bin_stream &s) {
        const std::uint8_t first = s.pop();
        if (s.bad()) {
            return error::truncated;
        }
        if ((first & bits::length_long_form_bit) == 0) {
            return std::size_t{first};
        }
        const std::size_t num_bytes = first & bits::length_size_mask;
        if (num_bytes > bits::max_length_field_bytes) {
            return error::invalid_length;
        }
        std::size_t length = 0;
        for (std::size_t i = 0; i < num_bytes; ++i) {
            const std::uint8_t b = s.pop();
            if (s.bad()) {
                return error::truncated;
            }
            length = (length << 8) | b;
        }
        return length;
    }

}// namespace isotlv

namespace mlab {
    bin_data &operator<<(bin_data &bd, isotlv::ber_length const &l) {
        if (l.value <= isotlv::bits::max_short_length) {
            return bd << std::uint8_t(l.value);
        }
        const auto num_bytes = isotlv::length_size(l.value) - 1;
        const auto be = msb_unsigned_encode<std::uint64_t, sizeof(std::uint64_t)>(l.value);
        bd << std::uint8_t(isotlv::bits::length_long_form_bit | num_bytes);
        return bd << make_range(std::end(be) - num_bytes, std::end(be));
    }
}// namespace mlab
