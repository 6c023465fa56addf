#ifndef ISOTLV_TLV_HPP
#define ISOTLV_TLV_HPP

#include <algorithm>
#include <isotlv/bits.hpp>
#include <isotlv/log.h>
#include <isotlv/length.hpp>
#include <isotlv/msg.hpp>
#include <isotlv/result.hpp>
#include <isotlv/tag.hpp>
#include <isotlv/value.hpp>
#include <mlab/bin_data.hpp>
#include <mlab/strutils.hpp>
#include <string>
#include <utility>
#include <vector>

namespace isotlv {

    /**
     * @brief Runtime settings for decoding BER-TLV data objects.
     */
    struct decode_cfg {
        /**
         * Maximum nesting level of constructed values. The top level node is at level 1.
         */
        std::size_t max_depth = bits::default_max_depth;
    };

    /**
     * @brief A BER-TLV data object, i.e. a tag bound to a value.
     * A node always satisfies `get_tag().is_constructed() == get_value().is_constructed()`; it can only be obtained
     * through @ref make or by decoding bytes.
     * @tparam Tag Any type satisfying @ref tag_capability. Wrapping @ref isotlv::tag lets the user override which
     *  tags introduce constructed values without changing how they are serialized.
     */
    template <tag_capability Tag>
    class tlv {
    public:
        using tag_type = Tag;
        using value_type = value<Tag>;

    private:
        tag_type _tag;
        value_type _value;

        tlv(tag_type t, value_type v);

        [[nodiscard]] static result<tlv> read_nested(mlab::bin_stream &s, std::size_t depth, decode_cfg const &cfg);

        void collect(tag_type const &t, std::vector<tlv const *> &matches) const;

    public:
        /**
         * @brief Binds @p t and @p v into a node.
         * @return The node, or
         *  - @ref error::inconsistent if the constructed flag of @p t differs from the encoding of @p v,
         *  - @ref error::invalid_length if @p v is too large for a four bytes length field.
         */
        [[nodiscard]] static result<tlv> make(tag_type t, value_type v);

        /**
         * @brief Decodes one node from the current position of @p s, recursing into constructed values.
         * For a constructed tag, children are decoded until they exactly fill the declared length; for a primitive
         * tag, exactly that many bytes are taken as payload. Failures are logged once here.
         * @return The node, or any of the errors of @ref tag_type::read and @ref read_length, plus
         *  - @ref error::truncated if the payload is shorter than declared,
         *  - @ref error::inconsistent if the children overrun the declared length, or the value does not add up to it,
         *  - @ref error::nesting_too_deep if constructed values nest beyond @ref decode_cfg::max_depth.
         */
        [[nodiscard]] static result<tlv> read(mlab::bin_stream &s, decode_cfg const &cfg = {});

        /**
         * @brief Decodes one node at the beginning of @p data, without requiring all of it to be consumed.
         * @return The outcome of @ref read and the bytes of @p data that were not consumed.
         */
        [[nodiscard]] static std::pair<result<tlv>, mlab::range<mlab::bin_data::const_iterator>> parse(mlab::bin_data const &data, decode_cfg const &cfg = {});

        /**
         * The remainder would point into a temporary.
         */
        static std::pair<result<tlv>, mlab::range<mlab::bin_data::const_iterator>> parse(mlab::bin_data &&data, decode_cfg const &cfg = {}) = delete;

        /**
         * @brief Decodes exactly one node spanning the whole of @p data.
         * @return The node, any of the errors of @ref read, or @ref error::invalid_input if bytes are left over.
         */
        [[nodiscard]] static result<tlv> from_bytes(mlab::bin_data const &data, decode_cfg const &cfg = {});

        /**
         * @brief Decodes a sequence of concatenated top level nodes.
         * Stops at the first node that fails to decode.
         * @return All nodes decoded before the end of @p data or before the first error.
         */
        [[nodiscard]] static std::vector<tlv> parse_all(mlab::bin_data const &data, decode_cfg const &cfg = {});

        [[nodiscard]] tag_type const &get_tag() const;
        [[nodiscard]] value_type const &get_value() const;

        [[nodiscard]] bool is_constructed() const;

        /**
         * Total encoded size: tag, length field and value.
         */
        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] mlab::bin_data encode() const;

        /**
         * @brief Depth-first search of the first node with tag @p t, starting from (and including) this node.
         * @return A pointer into this tree, or `nullptr`.
         */
        [[nodiscard]] tlv const *find(tag_type const &t) const;

        /**
         * All nodes with tag @p t, in the order in which they appear when encoded.
         */
        [[nodiscard]] std::vector<tlv const *> find_all(tag_type const &t) const;

        [[nodiscard]] bool operator==(tlv const &other) const;
        [[nodiscard]] bool operator!=(tlv const &other) const;
    };

    /**
     * @brief Multi-line, indented dump of the tree rooted at @p node.
     * Each line holds the tag bytes in hex, the encoding and the value length; primitive payloads follow in hex.
     */
    template <tag_capability Tag>
    [[nodiscard]] std::string to_string(tlv<Tag> const &node);

}// namespace isotlv

namespace mlab {
    template <isotlv::tag_capability Tag>
    bin_data &operator<<(bin_data &bd, isotlv::tlv<Tag> const &node);
}// namespace mlab

namespace isotlv {

    template <tag_capability Tag>
    tlv<Tag>::tlv(tag_type t, value_type v) : _tag{std::move(t)}, _value{std::move(v)} {}

    template <tag_capability Tag>
    result<tlv<Tag>> tlv<Tag>::make(tag_type t, value_type v) {
        if (bool(t.is_constructed()) != v.is_constructed()) {
            ISOTLV_LOGW("Tag requires a %s value, got a %s value.",
                        t.is_constructed() ? "constructed" : "primitive", to_string(v.type()));
            return error::inconsistent;
        }
        if (v.size() > bits::max_length) {
            ISOTLV_LOGW("Value of %zu bytes exceeds the maximum BER-TLV length.", v.size());
            return error::invalid_length;
        }
        return tlv{std::move(t), std::move(v)};
    }

    template <tag_capability Tag>
    result<tlv<Tag>> tlv<Tag>::read_nested(mlab::bin_stream &s, std::size_t depth, decode_cfg const &cfg) {
        if (depth > cfg.max_depth) {
            return error::nesting_too_deep;
        }
        ISOTLV_TRY_RESULT_AS_SILENT(tag_type::read(s), r_tag) {
            ISOTLV_TRY_RESULT_AS_SILENT(read_length(s), r_length) {
                const std::size_t length = *r_length;
                value_type v{};
                if (r_tag->is_constructed()) {
                    v = value_type{std::vector<tlv>{}};
                    const std::size_t start = s.tell();
                    while (s.tell() - start < length) {
                        ISOTLV_TRY_RESULT_AS_SILENT(read_nested(s, depth + 1, cfg), r_child) {
                            ISOTLV_TRY_SILENT(v.push_back(std::move(*r_child)))
                        }
                    }
                    if (s.tell() - start != length) {
                        return error::inconsistent;
                    }
                } else {
                    if (s.remaining() < length) {
                        return error::truncated;
                    }
                    v = value_type{mlab::bin_data{s.read(length)}};
                }
                ISOTLV_TRY_RESULT_AS_SILENT(make(std::move(*r_tag), std::move(v)), r_node) {
                    if (r_node->get_value().size() != length) {
                        return error::inconsistent;
                    }
                    return std::move(*r_node);
                }
            }
        }
    }

    template <tag_capability Tag>
    result<tlv<Tag>> tlv<Tag>::read(mlab::bin_stream &s, decode_cfg const &cfg) {
        const std::size_t start = s.tell();
        auto r = read_nested(s, 1, cfg);
        if (not r) {
            ISOTLV_LOGW("Cannot parse BER-TLV data object at offset %zu: %s.", start, to_string(r.error()));
        }
        return r;
    }

    template <tag_capability Tag>
    std::pair<result<tlv<Tag>>, mlab::range<mlab::bin_data::const_iterator>> tlv<Tag>::parse(mlab::bin_data const &data, decode_cfg const &cfg) {
        mlab::bin_stream s{data};
        auto r = read(s, cfg);
        const std::size_t consumed = std::min(s.tell(), data.size());
        return {std::move(r), data.view(consumed)};
    }

    template <tag_capability Tag>
    result<tlv<Tag>> tlv<Tag>::from_bytes(mlab::bin_data const &data, decode_cfg const &cfg) {
        mlab::bin_stream s{data};
        ISOTLV_TRY_RESULT_AS_SILENT(read(s, cfg), r_node) {
            if (s.remaining() > 0) {
                ISOTLV_LOGW("Cannot parse BER-TLV data object, %zu trailing bytes.", s.remaining());
                return error::invalid_input;
            }
            return std::move(*r_node);
        }
    }

    template <tag_capability Tag>
    std::vector<tlv<Tag>> tlv<Tag>::parse_all(mlab::bin_data const &data, decode_cfg const &cfg) {
        std::vector<tlv> nodes;
        mlab::bin_stream s{data};
        while (not s.eof()) {
            auto r = read(s, cfg);
            if (not r) {
                break;
            }
            nodes.push_back(std::move(*r));
        }
        return nodes;
    }

    template <tag_capability Tag>
    typename tlv<Tag>::tag_type const &tlv<Tag>::get_tag() const {
        return _tag;
    }

    template <tag_capability Tag>
    typename tlv<Tag>::value_type const &tlv<Tag>::get_value() const {
        return _value;
    }

    template <tag_capability Tag>
    bool tlv<Tag>::is_constructed() const {
        return _value.is_constructed();
    }

    template <tag_capability Tag>
    std::size_t tlv<Tag>::size() const {
        const std::size_t value_size = _value.size();
        return std::size_t(_tag.size()) + length_size(value_size) + value_size;
    }

    template <tag_capability Tag>
    mlab::bin_data tlv<Tag>::encode() const {
        mlab::bin_data bd{mlab::prealloc{size()}};
        bd << *this;
        return bd;
    }

    template <tag_capability Tag>
    tlv<Tag> const *tlv<Tag>::find(tag_type const &t) const {
        if (_tag == t) {
            return this;
        }
        if (is_constructed()) {
            for (auto const &child : _value.nodes()) {
                if (auto const *match = child.find(t); match != nullptr) {
                    return match;
                }
            }
        }
        return nullptr;
    }

    template <tag_capability Tag>
    void tlv<Tag>::collect(tag_type const &t, std::vector<tlv const *> &matches) const {
        if (_tag == t) {
            matches.push_back(this);
        }
        if (is_constructed()) {
            for (auto const &child : _value.nodes()) {
                child.collect(t, matches);
            }
        }
    }

    template <tag_capability Tag>
    std::vector<tlv<Tag> const *> tlv<Tag>::find_all(tag_type const &t) const {
        std::vector<tlv const *> matches;
        collect(t, matches);
        return matches;
    }

    template <tag_capability Tag>
    bool tlv<Tag>::operator==(tlv const &other) const {
        return _tag == other._tag and _value == other._value;
    }

    template <tag_capability Tag>
    bool tlv<Tag>::operator!=(tlv const &other) const {
        return not operator==(other);
    }

    namespace impl {
        template <tag_capability Tag>
        void dump_tree(std::string &out, tlv<Tag> const &node, std::size_t indent) {
            auto const &v = node.get_value();
            const auto tag_bytes = node.get_tag().bytes();
            out.append(2 * indent, ' ');
            out += mlab::data_to_hex_string(std::begin(tag_bytes), std::end(tag_bytes));
            out += mlab::concatenate({" ", to_string(v.type()), " [", std::to_string(v.size()), "]"});
            if (v.is_constructed()) {
                out += '\n';
                for (auto const &child : v.nodes()) {
                    dump_tree(out, child, indent + 1);
                }
            } else {
                if (not v.data().empty()) {
                    out += ": ";
                    out += mlab::data_to_hex_string(v.data());
                }
                out += '\n';
            }
        }
    }// namespace impl

    template <tag_capability Tag>
    std::string to_string(tlv<Tag> const &node) {
        std::string out;
        impl::dump_tree(out, node, 0);
        return out;
    }

}// namespace isotlv

namespace mlab {
    template <isotlv::tag_capability Tag>
    bin_data &operator<<(bin_data &bd, isotlv::tlv<Tag> const &node) {
        auto const &v = node.get_value();
        bd << node.get_tag().bytes() << isotlv::ber_length{v.size()};
        return bd << v;
    }
}// namespace mlab

#endif//ISOTLV_TLV_HPP
