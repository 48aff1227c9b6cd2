/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_DECODER_HPP
#define TESSERA_CBOR_DECODER_HPP

/*
 * A pull decoder over a borrowed buffer. Each operation reads exactly one item at the current position
 * and either advances the position by the item's wire size or throws a decode_error
 * positioned at the start of the failing item.
 * Non-minimal encodings of integers and lengths are accepted.
 */

#include <iterator>
#include <type_traits>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <tessera/common/bytes.hpp>
#include <tessera/config.hpp>
#include "error.hpp"
#include "fwd.hpp"
#include "half.hpp"
#include "integer.hpp"
#include "types.hpp"

namespace tessera::cbor {
    template<typename T, typename C> struct array_iter;
    template<typename K, typename V, typename C> struct map_iter;
    template<typename S> struct chunk_iter;
    using bytes_iter = chunk_iter<buffer>;
    using text_iter = chunk_iter<std::string_view>;

    struct decoder {
        explicit decoder(const buffer bytes) noexcept:
            _buf { bytes }
        {
        }

        buffer input() const noexcept
        {
            return _buf;
        }

        size_t position() const noexcept
        {
            return _pos;
        }

        void set_position(const size_t pos)
        {
            if (pos > _buf.size()) [[unlikely]]
                throw decode_error::message(fmt::format("position {} is past the end of input of {} bytes", pos, _buf.size())).at(_pos);
            _pos = pos;
        }

        bool empty() const noexcept
        {
            return _pos >= _buf.size();
        }

        // a copy of this decoder for lookahead; reads through it leave this decoder untouched
        decoder probe() const noexcept
        {
            return *this;
        }

        data_type datatype() const;

        bool boolean();
        uint8_t u8();
        uint16_t u16();
        uint32_t u32();
        uint64_t u64();
        int8_t i8();
        int16_t i16();
        int32_t i32();
        int64_t i64();
        cbor::integer integer();
#if TESSERA_HALF
        float f16();
#endif
        float f32();
        double f64();
        char32_t character();
        // a definite byte string; indefinite ones are available through bytes_iter
        buffer bytes();
        // a definite UTF-8 validated text string; indefinite ones are available through text_iter
        std::string_view text();
        // the declared number of elements or std::nullopt for an indefinite array
        std::optional<uint64_t> array();
        // the declared number of key-value pairs or std::nullopt for an indefinite map
        std::optional<uint64_t> map();
        uint64_t tag();
        void null();
        void undefined();
        uint8_t simple();

        template<typename T, typename C>
        cbor::array_iter<T, C> array_iter(C &ctx);
        template<typename T>
        cbor::array_iter<T, unit> array_iter();
        template<typename K, typename V, typename C>
        cbor::map_iter<K, V, C> map_iter(C &ctx);
        template<typename K, typename V>
        cbor::map_iter<K, V, unit> map_iter();
        cbor::bytes_iter bytes_iter();
        cbor::text_iter text_iter();

        /*
         * Skips exactly one item of any shape without materializing it.
         * With TESSERA_ALLOC nesting is tracked with an explicit work list of remaining elements per level
         * so that arbitrarily deep definite and indefinite containers are handled without recursion.
         * Without it this is limited_skip().
         */
        void skip();

        /*
         * An allocation-free skip that tracks two counters: the remaining definite elements and the number of
         * open indefinite containers. It is correct for nested definite containers and for indefinite containers
         * at the top. An indefinite container nested inside a definite one can end the skip early.
         */
        void limited_skip();
    private:
        friend struct chunk_iter<buffer>;
        friend struct chunk_iter<std::string_view>;
        template<typename T, typename C> friend struct cbor::array_iter;
        template<typename K, typename V, typename C> friend struct cbor::map_iter;

        buffer _buf;
        size_t _pos = 0;
        unit _unit {};

        // the classification of the item at pos or std::nullopt if the input ends before it can be classified
        std::optional<data_type> _classify(size_t pos) const noexcept;
        [[noreturn]] void _type_mismatch(size_t start) const;

        uint8_t _peek() const
        {
            if (_pos >= _buf.size()) [[unlikely]]
                throw decode_error::end_of_input().at(_pos);
            return _buf[_pos];
        }

        uint8_t _read_byte(const size_t start)
        {
            if (_pos >= _buf.size()) [[unlikely]]
                throw decode_error::end_of_input().at(start);
            return _buf[_pos++];
        }

        buffer _read_slice(const uint64_t sz, const size_t start)
        {
            if (sz > std::numeric_limits<size_t>::max() - _pos) [[unlikely]]
                throw decode_error::overflow(sz).at(start).with_message("the length exceeds the addressable range");
            if (sz > _buf.size() - _pos) [[unlikely]]
                throw decode_error::end_of_input().at(start);
            const buffer res { _buf.data() + _pos, static_cast<size_t>(sz) };
            _pos += sz;
            return res;
        }

        template<typename T>
        T _read_be(const size_t start)
        {
            return _read_slice(sizeof(T), start).to_host<T>();
        }

        // the argument of an item with the given additional info, indefinite lengths are not accepted here
        uint64_t _argument(const uint8_t info, const size_t start)
        {
            switch (info) {
                case 24: return _read_byte(start);
                case 25: return _read_be<uint16_t>(start);
                case 26: return _read_be<uint32_t>(start);
                case 27: return _read_be<uint64_t>(start);
                default:
                    if (info < 24) [[likely]]
                        return info;
                    _type_mismatch(start);
            }
        }

        // reads the initial byte and checks its major type
        uint8_t _initial(const major_type typ, const size_t start)
        {
            const auto b = _read_byte(start);
            if (major_of(b) != typ) [[unlikely]]
                _type_mismatch(start);
            return b;
        }

        uint64_t _unsigned(const size_t start)
        {
            return _argument(info_of(_initial(major_type::uint, start)), start);
        }

        // an integer of either sign as the pair of a negative flag and the raw wire magnitude
        std::pair<bool, uint64_t> _signed(const size_t start)
        {
            const auto b = _read_byte(start);
            switch (major_of(b)) {
                case major_type::uint: return { false, _argument(info_of(b), start) };
                case major_type::nint: return { true, _argument(info_of(b), start) };
                [[unlikely]] default: _type_mismatch(start);
            }
        }

        template<typename T>
        T _narrow_unsigned()
        {
            const auto start = _pos;
            const auto val = _unsigned(start);
            if (val > std::numeric_limits<T>::max()) [[unlikely]]
                throw decode_error::overflow(val).at(start);
            return static_cast<T>(val);
        }

        template<typename T>
        T _narrow_signed()
        {
            const auto start = _pos;
            const auto [neg, raw] = _signed(start);
            if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) [[unlikely]]
                throw decode_error::overflow(raw).at(start);
            const auto val = static_cast<int64_t>(raw);
            return static_cast<T>(neg ? -1 - val : val);
        }

        std::optional<uint64_t> _container(major_type typ);
        buffer _definite_string(major_type typ, size_t start);
        void _skip_indefinite_string(major_type typ);
        std::string_view _validate_text(buffer bytes, size_t start) const;
    };

    // reads the array elements lazily; stopping early leaves the position right after the last element read
    template<typename T, typename C>
    struct array_iter {
        struct iterator {
            using value_type = T;
            using difference_type = std::ptrdiff_t;

            const T &operator*() const noexcept
            {
                return *_parent->_cur;
            }

            const T *operator->() const noexcept
            {
                return &*_parent->_cur;
            }

            iterator &operator++()
            {
                _parent->_cur = _parent->next();
                return *this;
            }

            void operator++(int)
            {
                ++*this;
            }

            bool operator==(std::default_sentinel_t) const noexcept
            {
                return !_parent->_cur;
            }

            array_iter *_parent;
        };

        array_iter(decoder &dec, C &ctx):
            _dec { dec }, _ctx { ctx }, _remaining { dec.array() }
        {
        }

        // the declared number of elements, std::nullopt for indefinite arrays
        std::optional<uint64_t> size() const noexcept
        {
            return _size;
        }

        std::optional<T> next()
        {
            if (_done)
                return {};
            if (_remaining) {
                if (*_remaining == 0) {
                    _done = true;
                    return {};
                }
                --*_remaining;
            } else if (_dec._peek() == s_break_byte) {
                ++_dec._pos;
                _done = true;
                return {};
            }
            return codec<T>::decode(_dec, _ctx);
        }

        iterator begin()
        {
            _cur = next();
            return { this };
        }

        std::default_sentinel_t end() const noexcept
        {
            return {};
        }
    private:
        decoder &_dec;
        C &_ctx;
        std::optional<uint64_t> _remaining;
        std::optional<uint64_t> _size { _remaining };
        bool _done = false;
        std::optional<T> _cur {};
    };

    template<typename K, typename V, typename C>
    struct map_iter {
        using value_type = std::pair<K, V>;

        struct iterator {
            using value_type = map_iter::value_type;
            using difference_type = std::ptrdiff_t;

            const value_type &operator*() const noexcept
            {
                return *_parent->_cur;
            }

            const value_type *operator->() const noexcept
            {
                return &*_parent->_cur;
            }

            iterator &operator++()
            {
                _parent->_cur = _parent->next();
                return *this;
            }

            void operator++(int)
            {
                ++*this;
            }

            bool operator==(std::default_sentinel_t) const noexcept
            {
                return !_parent->_cur;
            }

            map_iter *_parent;
        };

        map_iter(decoder &dec, C &ctx):
            _dec { dec }, _ctx { ctx }, _remaining { dec.map() }
        {
        }

        std::optional<uint64_t> size() const noexcept
        {
            return _size;
        }

        std::optional<value_type> next()
        {
            if (_done)
                return {};
            if (_remaining) {
                if (*_remaining == 0) {
                    _done = true;
                    return {};
                }
                --*_remaining;
            } else if (_dec._peek() == s_break_byte) {
                ++_dec._pos;
                _done = true;
                return {};
            }
            auto k = codec<K>::decode(_dec, _ctx);
            auto v = codec<V>::decode(_dec, _ctx);
            return value_type { std::move(k), std::move(v) };
        }

        iterator begin()
        {
            _cur = next();
            return { this };
        }

        std::default_sentinel_t end() const noexcept
        {
            return {};
        }
    private:
        decoder &_dec;
        C &_ctx;
        std::optional<uint64_t> _remaining;
        std::optional<uint64_t> _size { _remaining };
        bool _done = false;
        std::optional<value_type> _cur {};
    };

    /*
     * The chunks of a byte or text string: a single chunk for a definite string and
     * the sequence of definite chunks up to the break marker for an indefinite one.
     */
    template<typename S>
    struct chunk_iter {
        static constexpr major_type typ = std::is_same_v<S, std::string_view> ? major_type::text : major_type::bytes;

        struct iterator {
            using value_type = S;
            using difference_type = std::ptrdiff_t;

            const S &operator*() const noexcept
            {
                return *_parent->_cur;
            }

            iterator &operator++()
            {
                _parent->_cur = _parent->next();
                return *this;
            }

            void operator++(int)
            {
                ++*this;
            }

            bool operator==(std::default_sentinel_t) const noexcept
            {
                return !_parent->_cur;
            }

            chunk_iter *_parent;
        };

        explicit chunk_iter(decoder &dec):
            _dec { dec }
        {
            const auto start = _dec._pos;
            const auto b = _dec._peek();
            if (major_of(b) != typ) [[unlikely]]
                _dec._type_mismatch(start);
            if (info_of(b) == static_cast<uint8_t>(special_val::s_break)) {
                ++_dec._pos;
                _indefinite = true;
            }
        }

        bool indefinite() const noexcept
        {
            return _indefinite;
        }

        std::optional<S> next()
        {
            if (_done)
                return {};
            const auto start = _dec._pos;
            if (!_indefinite) {
                _done = true;
                return _chunk(start);
            }
            if (_dec._peek() == s_break_byte) {
                ++_dec._pos;
                _done = true;
                return {};
            }
            return _chunk(start);
        }

        iterator begin()
        {
            _cur = next();
            return { this };
        }

        std::default_sentinel_t end() const noexcept
        {
            return {};
        }
    private:
        decoder &_dec;
        bool _indefinite = false;
        bool _done = false;
        std::optional<S> _cur {};

        S _chunk(const size_t start)
        {
            const auto bytes = _dec._definite_string(typ, start);
            if constexpr (std::is_same_v<S, std::string_view>) {
                return _dec._validate_text(bytes, start);
            } else {
                return bytes;
            }
        }
    };

    template<typename T, typename C>
    array_iter<T, C> decoder::array_iter(C &ctx)
    {
        return { *this, ctx };
    }

    template<typename T>
    array_iter<T, unit> decoder::array_iter()
    {
        return { *this, _unit };
    }

    template<typename K, typename V, typename C>
    map_iter<K, V, C> decoder::map_iter(C &ctx)
    {
        return { *this, ctx };
    }

    template<typename K, typename V>
    map_iter<K, V, unit> decoder::map_iter()
    {
        return { *this, _unit };
    }

    inline bytes_iter decoder::bytes_iter()
    {
        return cbor::bytes_iter { *this };
    }

    inline text_iter decoder::text_iter()
    {
        return cbor::text_iter { *this };
    }
}

#endif // !TESSERA_CBOR_DECODER_HPP
