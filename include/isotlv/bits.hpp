#ifndef ISOTLV_BITS_HPP
#define ISOTLV_BITS_HPP

#include <cstddef>
#include <cstdint>

#ifndef ISOTLV_DEFAULT_MAX_DEPTH
#define ISOTLV_DEFAULT_MAX_DEPTH 32
#endif

/**
 * BER-TLV and SIMPLE-TLV data objects as defined in ISO7816-4.
 */
namespace isotlv {

    /**
     * @brief Class of a BER-TLV tag, as encoded in the two most significant bits of the first tag byte.
     */
    enum struct tag_class : std::uint8_t {
        universal = 0x00,       ///< `00xxxxxx`
        application = 0x40,     ///< `01xxxxxx`
        context_specific = 0x80,///< `10xxxxxx`
        private_use = 0xc0      ///< `11xxxxxx`
    };

    /**
     * @brief Whether a value is an opaque byte payload or a sequence of nested data objects.
     */
    enum struct value_encoding : std::uint8_t {
        primitive,  ///< The value is a plain byte sequence.
        constructed ///< The value is an ordered sequence of BER-TLV nodes.
    };

#ifndef DOXYGEN_SHOULD_SKIP_THIS
    namespace bits {
        static constexpr std::uint8_t tag_class_mask = 0xc0;
        static constexpr std::uint8_t tag_constructed_bit = 0x20;
        static constexpr std::uint8_t tag_number_mask = 0x1f;
        static constexpr std::uint8_t tag_more_bytes_bit = 0x80;
        static constexpr std::size_t max_tag_length = 3;

        static constexpr std::uint8_t length_long_form_bit = 0x80;
        static constexpr std::uint8_t length_size_mask = 0x7f;
        static constexpr std::size_t max_short_length = 0x7f;
        static constexpr std::size_t max_length_field_bytes = 4;
        static constexpr std::size_t max_length = 0xffffffff;

        static constexpr std::uint8_t simple_tag_invalid_lo = 0x00;
        static constexpr std::uint8_t simple_tag_invalid_hi = 0xff;
        static constexpr std::uint8_t simple_length_marker = 0xff;
        static constexpr std::size_t simple_max_short_length = 0xfe;
        static constexpr std::size_t simple_max_length = 0xffff;

        static constexpr std::size_t default_max_depth = ISOTLV_DEFAULT_MAX_DEPTH;

        static_assert(default_max_depth > 0, "A zero nesting depth would not decode anything.");
    }// namespace bits
#endif

}// namespace isotlv

#endif//ISOTLV_BITS_HPP
