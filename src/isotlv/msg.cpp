#include <isotlv/msg.hpp>

namespace isotlv {
    const char *to_string(error e) {
        switch (e) {
            case error::malformed_tag:
                return "malformed tag";
            case error::tag_rfu:
                return "tag reserved for future use";
            case error::truncated:
                return "truncated input";
            case error::invalid_length:
                return "invalid length";
            case error::inconsistent:
                return "inconsistent data object";
            case error::invalid_input:
                return "invalid input";
            case error::parse_int_error:
                return "integer parse error";
            case error::nesting_too_deep:
                return "nesting too deep";
        }
        return "UNKNOWN";
    }

    const char *to_string(tag_class c) {
        switch (c) {
            case tag_class::universal:
                return "universal";
            case tag_class::application:
                return "application";
            case tag_class::context_specific:
                return "context specific";
            case tag_class::private_use:
                return "private";
        }
        return "UNKNOWN";
    }

    const char *to_string(value_encoding enc) {
        switch (enc) {
            case value_encoding::primitive:
                return "primitive";
            case value_encoding::constructed:
                return "constructed";
        }
        return "UNKNOWN";
    }
}// namespace isotlv
