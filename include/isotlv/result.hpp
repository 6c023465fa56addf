#ifndef ISOTLV_RESULT_HPP
#define ISOTLV_RESULT_HPP

#include <cstdint>
#include <mlab/result.hpp>

namespace isotlv {

    /**
     * @brief Reasons for which decoding or constructing a data object can fail.
     */
    enum struct error : std::uint8_t {
        malformed_tag,   ///< The tag bytes violate the tag number grammar.
        tag_rfu,         ///< The tag would need four or more bytes, reserved for future use.
        truncated,       ///< The input ended before a tag, length or value was complete.
        invalid_length,  ///< The length field uses more long form bytes than supported, or the length is out of range.
        inconsistent,    ///< The tag constructed flag disagrees with the shape of the value, or lengths do not add up.
        invalid_input,   ///< The input is well-formed but unconsumed bytes remain where exact consumption is required.
        parse_int_error, ///< A hexadecimal tag specification could not be parsed.
        nesting_too_deep ///< Constructed values are nested beyond the configured maximum depth.
    };

    template <class... Tn>
    using result = mlab::result<error, Tn...>;

    [[nodiscard]] const char *to_string(error e);

}// namespace isotlv

#define ISOTLV_CMD_WITH_NAMED_RESULT_SILENT(CMD, RESULT_NAME) \
    if (auto RESULT_NAME = (CMD); not RESULT_NAME) {          \
        return RESULT_NAME.error();                           \
    }

#define ISOTLV_TRY_SILENT(CMD) ISOTLV_CMD_WITH_NAMED_RESULT_SILENT(CMD, _r)

#define ISOTLV_TRY_RESULT_AS_SILENT(CMD, RES_VAR)     \
    ISOTLV_CMD_WITH_NAMED_RESULT_SILENT(CMD, RES_VAR) \
    else

#endif//ISOTLV_RESULT_HPP
