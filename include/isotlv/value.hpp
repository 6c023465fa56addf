#ifndef ISOTLV_VALUE_HPP
#define ISOTLV_VALUE_HPP

#include <isotlv/bits.hpp>
#include <isotlv/log.h>
#include <isotlv/msg.hpp>
#include <isotlv/result.hpp>
#include <isotlv/tag.hpp>
#include <mlab/any_of.hpp>
#include <mlab/bin_data.hpp>
#include <type_traits>
#include <vector>

namespace isotlv {

    template <tag_capability Tag = tag>
    class tlv;

    namespace impl {
        /**
         * @note @ref mlab::any_of requires a matching `template <value_encoding> class T`, so the tag type is bound
         * in an outer struct.
         */
        template <class Tag>
        struct value_content {
            template <value_encoding Enc>
            struct content_wrap {
                using content_type = std::conditional_t<Enc == value_encoding::primitive, mlab::bin_data, std::vector<tlv<Tag>>>;
                content_type content;
            };
        };
    }// namespace impl

    /**
     * @brief Payload of a BER-TLV data object: either a primitive byte sequence, or an ordered list of child nodes.
     * A constructed value owns its children. Children can be appended with @ref push_back while the tree is being
     * assembled; once the value is bound to a @ref tlv, it should be treated as frozen.
     * @note Include @ref isotlv/tlv.hpp to use this class.
     */
    template <tag_capability Tag>
    class value : private mlab::any_of<value_encoding, impl::value_content<Tag>::template content_wrap, value_encoding::primitive> {
        template <value_encoding Enc>
        using content_wrap = typename impl::value_content<Tag>::template content_wrap<Enc>;

        using base = mlab::any_of<value_encoding, impl::value_content<Tag>::template content_wrap, value_encoding::primitive>;

    public:
        using node_type = tlv<Tag>;

        /**
         * Empty primitive value.
         */
        value() = default;

        explicit value(mlab::bin_data data);

        explicit value(std::vector<node_type> nodes);

        value(value const &other);
        value(value &&) noexcept = default;

        value &operator=(value const &other);
        value &operator=(value &&) noexcept = default;

        using base::type;

        [[nodiscard]] bool is_constructed() const;

        /**
         * @brief Number of bytes this value takes once encoded.
         * For a constructed value, this is the sum of the full encoded size (tag, length and value) of each child.
         */
        [[nodiscard]] std::size_t size() const;

        /**
         * @brief Appends a child node at the end of a constructed value.
         * @return @ref error::inconsistent if this value is primitive; in that case @p node is discarded.
         */
        result<> push_back(node_type node);

        /**
         * @brief Payload of a primitive value.
         * Test @ref type before calling this method, it is only valid on @ref value_encoding::primitive.
         */
        [[nodiscard]] mlab::bin_data const &data() const;

        /**
         * @brief Children of a constructed value.
         * Test @ref type before calling this method, it is only valid on @ref value_encoding::constructed.
         */
        [[nodiscard]] std::vector<node_type> const &nodes() const;

        /**
         * @copydoc nodes
         */
        [[nodiscard]] std::vector<node_type> &nodes();

        [[nodiscard]] bool operator==(value const &other) const;
        [[nodiscard]] bool operator!=(value const &other) const;
    };

}// namespace isotlv

namespace mlab {
    template <isotlv::tag_capability Tag>
    bin_data &operator<<(bin_data &bd, isotlv::value<Tag> const &v);
}// namespace mlab

namespace isotlv {

    template <tag_capability Tag>
    value<Tag>::value(mlab::bin_data data) : base{content_wrap<value_encoding::primitive>{std::move(data)}} {}

    template <tag_capability Tag>
    value<Tag>::value(std::vector<node_type> nodes) : base{content_wrap<value_encoding::constructed>{std::move(nodes)}} {}

    template <tag_capability Tag>
    value<Tag>::value(value const &other) : base{other.type()} {
        *this = other;
    }

    template <tag_capability Tag>
    value<Tag> &value<Tag>::operator=(value const &other) {
        if (&other != this) {
            switch (other.type()) {
                case value_encoding::primitive:
                    base::template set<value_encoding::primitive>(content_wrap<value_encoding::primitive>{other.data()});
                    break;
                case value_encoding::constructed:
                    base::template set<value_encoding::constructed>(content_wrap<value_encoding::constructed>{other.nodes()});
                    break;
            }
        }
        return *this;
    }

    template <tag_capability Tag>
    bool value<Tag>::is_constructed() const {
        return type() == value_encoding::constructed;
    }

    template <tag_capability Tag>
    std::size_t value<Tag>::size() const {
        switch (type()) {
            case value_encoding::primitive:
                return data().size();
            case value_encoding::constructed: {
                std::size_t total = 0;
                for (auto const &node : nodes()) {
                    total += node.size();
                }
                return total;
            }
        }
        return 0;
    }

    template <tag_capability Tag>
    result<> value<Tag>::push_back(node_type node) {
        if (not is_constructed()) {
            ISOTLV_LOGE("Cannot append a child node to a primitive value.");
            return error::inconsistent;
        }
        nodes().push_back(std::move(node));
        return mlab::result_success;
    }

    template <tag_capability Tag>
    mlab::bin_data const &value<Tag>::data() const {
        return base::template get<value_encoding::primitive>().content;
    }

    template <tag_capability Tag>
    std::vector<typename value<Tag>::node_type> const &value<Tag>::nodes() const {
        return base::template get<value_encoding::constructed>().content;
    }

    template <tag_capability Tag>
    std::vector<typename value<Tag>::node_type> &value<Tag>::nodes() {
        return base::template get<value_encoding::constructed>().content;
    }

    template <tag_capability Tag>
    bool value<Tag>::operator==(value const &other) const {
        if (type() != other.type()) {
            return false;
        }
        switch (type()) {
            case value_encoding::primitive:
                return data() == other.data();
            case value_encoding::constructed:
                return nodes() == other.nodes();
        }
        return false;
    }

    template <tag_capability Tag>
    bool value<Tag>::operator!=(value const &other) const {
        return not operator==(other);
    }

}// namespace isotlv

namespace mlab {
    template <isotlv::tag_capability Tag>
    bin_data &operator<<(bin_data &bd, isotlv::value<Tag> const &v) {
        switch (v.type()) {
            case isotlv::value_encoding::primitive:
                bd << v.data();
                break;
            case isotlv::value_encoding::constructed:
                for (auto const &node : v.nodes()) {
                    bd << node;
                }
                break;
        }
        return bd;
    }
}// namespace mlab

#endif//ISOTLV_VALUE_HPP
