#include <algorithm>
#include <isotlv/log.h>
#include <isotlv/msg.hpp>
#include <isotlv/simple.hpp>
#include <isotlv/tag.hpp>

namespace isotlv::simple {

    namespace {
        [[nodiscard]] result<std::size_t> read_simple_length(mlab::bin_stream &s) {
            const std::uint8_t first = s.pop();
            if (s.bad()) {
                return error::truncated;
            }
            if (first != bits::simple_length_marker) {
                return std::size_t{first};
            }
            std::uint16_t length = 0;
            s >> mlab::msb16 >> length;
            if (s.bad()) {
                return error::truncated;
            }
            return std::size_t{length};
        }
    }// namespace

    tag::tag(std::uint8_t value) : _value{value} {}

    result<tag> tag::from_byte(std::uint8_t b) {
        if (b == bits::simple_tag_invalid_lo or b == bits::simple_tag_invalid_hi) {
            return error::invalid_input;
        }
        return tag{b};
    }

    result<tag> tag::from_hex(std::string_view s) {
        ISOTLV_TRY_RESULT_AS_SILENT(impl::parse_hex(s), r_n) {
            if (*r_n > 0xff) {
                return error::parse_int_error;
            }
            return from_byte(std::uint8_t(*r_n));
        }
    }

    result<tag> tag::read(mlab::bin_stream &s) {
        const std::uint8_t b = s.pop();
        if (s.bad()) {
            return error::truncated;
        }
        return from_byte(b);
    }

    std::uint8_t tag::raw() const {
        return _value;
    }

    bool tag::operator==(tag const &other) const {
        return _value == other._value;
    }

    bool tag::operator!=(tag const &other) const {
        return not operator==(other);
    }

    tlv::tlv(tag t, mlab::bin_data value) : _tag{t}, _value{std::move(value)} {}

    result<tlv> tlv::make(tag t, mlab::bin_data value) {
        if (value.size() > bits::simple_max_length) {
            ISOTLV_LOGW("SIMPLE-TLV value of %zu bytes exceeds %zu bytes.", value.size(), bits::simple_max_length);
            return error::invalid_length;
        }
        return tlv{t, std::move(value)};
    }

    result<tlv> tlv::read(mlab::bin_stream &s) {
        ISOTLV_TRY_RESULT_AS_SILENT(tag::read(s), r_tag) {
            ISOTLV_TRY_RESULT_AS_SILENT(read_simple_length(s), r_length) {
                if (s.remaining() < *r_length) {
                    ISOTLV_LOGW("Cannot parse SIMPLE-TLV data object, not enough data.");
                    return error::truncated;
                }
                return tlv{*r_tag, mlab::bin_data{s.read(*r_length)}};
            }
        }
    }

    std::pair<result<tlv>, mlab::range<mlab::bin_data::const_iterator>> tlv::parse(mlab::bin_data const &data) {
        mlab::bin_stream s{data};
        auto r = read(s);
        const std::size_t consumed = std::min(s.tell(), data.size());
        return {std::move(r), data.view(consumed)};
    }

    result<tlv> tlv::from_bytes(mlab::bin_data const &data) {
        mlab::bin_stream s{data};
        ISOTLV_TRY_RESULT_AS_SILENT(read(s), r_tlv) {
            if (s.remaining() > 0) {
                ISOTLV_LOGW("Cannot parse SIMPLE-TLV data object, %zu trailing bytes.", s.remaining());
                return error::invalid_input;
            }
            return std::move(*r_tlv);
        }
    }

    std::vector<tlv> tlv::parse_all(mlab::bin_data const &data) {
        std::vector<tlv> objects;
        mlab::bin_stream s{data};
        while (not s.eof()) {
            auto r = read(s);
            if (not r) {
                ISOTLV_LOGW("Stopping at offset %zu: %s.", s.tell(), to_string(r.error()));
                break;
            }
            objects.push_back(std::move(*r));
        }
        return objects;
    }

    tag tlv::get_tag() const {
        return _tag;
    }

    mlab::bin_data const &tlv::get_value() const {
        return _value;
    }

    std::size_t tlv::size() const {
        const std::size_t length_size = _value.size() > bits::simple_max_short_length ? 3 : 1;
        return 1 + length_size + _value.size();
    }

    mlab::bin_data tlv::encode() const {
        mlab::bin_data bd{mlab::prealloc{size()}};
        bd << *this;
        return bd;
    }

    bool tlv::operator==(tlv const &other) const {
        return _tag == other._tag and _value == other._value;
    }

    bool tlv::operator!=(tlv const &other) const {
        return not operator==(other);
    }

}// namespace isotlv::simple

namespace mlab {
    bin_data &operator<<(bin_data &bd, isotlv::simple::tag const &t) {
        return bd << t.raw();
    }

    bin_data &operator<<(bin_data &bd, isotlv::simple::tlv const &t) {
        auto const &v = t.get_value();
        bd << t.get_tag();
        if (v.size() > isotlv::bits::simple_max_short_length) {
            bd << isotlv::bits::simple_length_marker << msb16 << std::uint16_t(v.size());
        } else {
            bd << std::uint8_t(v.size());
        }
        return bd << v;
    }
}// namespace mlab
