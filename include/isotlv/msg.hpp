#ifndef ISOTLV_MSG_HPP
#define ISOTLV_MSG_HPP

#include <isotlv/bits.hpp>
#include <isotlv/result.hpp>

namespace isotlv {
#ifndef DOXYGEN_SHOULD_SKIP_THIS
    /**
     * @addtogroup StringConversion
     * @{
     */
    [[nodiscard]] const char *to_string(error e);
    [[nodiscard]] const char *to_string(tag_class c);
    [[nodiscard]] const char *to_string(value_encoding enc);
    /**
     * @}
     */
#endif
}// namespace isotlv

#endif//ISOTLV_MSG_HPP
