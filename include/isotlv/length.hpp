#ifndef ISOTLV_LENGTH_HPP
#define ISOTLV_LENGTH_HPP

#include <isotlv/bits.hpp>
#include <isotlv/result.hpp>
#include <mlab/bin_data.hpp>

namespace isotlv {

    /**
     * @brief Wraps a length so that it is injected into a @ref mlab::bin_data as a BER length field.
     * Lengths up to 127 use the short form (one byte). Longer ones use the long form: `0x80 | k` followed by the
     * length on `k` big-endian bytes, where `k` is the minimum number of bytes needed.
     * @code
     * mlab::bin_data bd;
     * bd << ber_length{256};  // 82 01 00
     * @endcode
     */
    struct ber_length {
        std::size_t value = 0;
    };

    /**
     * Number of bytes taken by the BER length field encoding @p length.
     */
    [[nodiscard]] std::size_t length_size(std::size_t length);

    /**
     * @brief Reads a BER length field from @p s.
     * A long form field announcing zero length bytes (`0x80`) is read as zero.
     * @return The length, or
     *  - @ref error::truncated if @p s ends within the field,
     *  - @ref error::invalid_length if the long form announces more than four length bytes.
     */
    [[nodiscard]] result<std::size_t> read_length(mlab::bin_stream &s);

}// namespace isotlv

namespace mlab {
    bin_data &operator<<(bin_data &bd, isotlv::ber_length const &l);
}// namespace mlab

#endif//ISOTLV_LENGTH_HPP
