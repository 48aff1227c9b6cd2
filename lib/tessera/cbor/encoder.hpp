/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_ENCODER_HPP
#define TESSERA_CBOR_ENCODER_HPP

#include <array>
#include <limits>
#include <tessera/common/bytes.hpp>
#include <tessera/config.hpp>
#include "error.hpp"
#include "fwd.hpp"
#include "half.hpp"
#include "integer.hpp"
#include "types.hpp"
#include "write.hpp"

namespace tessera::cbor {
    /*
     * Writes CBOR items into a writer that the caller owns.
     * Integers and lengths always take the shortest form.
     * Any failure of the writer other than an encode_error is reported as encode_error::write with the original
     * exception as its cause.
     */
    template<typename W>
    struct encoder {
        explicit encoder(W &w) noexcept:
            _w { w }
        {
        }

        encoder(const encoder &) =delete;

        W &writer() noexcept
        {
            return _w;
        }

        const W &writer() const noexcept
        {
            return _w;
        }

        encoder &boolean(const bool val)
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(val ? special_val::s_true : special_val::s_false));
            return *this;
        }

        encoder &s_true()
        {
            return boolean(true);
        }

        encoder &s_false()
        {
            return boolean(false);
        }

        encoder &u8(const uint8_t val)
        {
            return u64(val);
        }

        encoder &u16(const uint16_t val)
        {
            return u64(val);
        }

        encoder &u32(const uint32_t val)
        {
            return u64(val);
        }

        encoder &u64(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        encoder &i8(const int8_t val)
        {
            return i64(val);
        }

        encoder &i16(const int16_t val)
        {
            return i64(val);
        }

        encoder &i32(const int32_t val)
        {
            return i64(val);
        }

        encoder &i64(const int64_t val)
        {
            if (val >= 0)
                _encode_uint_item(major_type::uint, static_cast<uint64_t>(val));
            else
                _encode_uint_item(major_type::nint, static_cast<uint64_t>(-1 - val));
            return *this;
        }

        encoder &integer(const cbor::integer &val)
        {
            _encode_uint_item(val.negative() ? major_type::nint : major_type::uint, val.raw());
            return *this;
        }

#if TESSERA_HALF
        // lossy: the value is rounded to the nearest half-precision number
        encoder &f16(const float val)
        {
            const auto h = host_to_net(float_to_half(val));
            _encode_item_with_data(initial_byte(major_type::simple, special_val::two_bytes), buffer::from(h));
            return *this;
        }
#endif

        encoder &f32(const float val)
        {
            const auto bits = host_to_net(std::bit_cast<uint32_t>(val));
            _encode_item_with_data(initial_byte(major_type::simple, special_val::four_bytes), buffer::from(bits));
            return *this;
        }

        encoder &f64(const double val)
        {
            const auto bits = host_to_net(std::bit_cast<uint64_t>(val));
            _encode_item_with_data(initial_byte(major_type::simple, special_val::eight_bytes), buffer::from(bits));
            return *this;
        }

        encoder &character(const char32_t val)
        {
            return u32(static_cast<uint32_t>(val));
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _write(buf);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size());
            _write(sv);
            return *this;
        }

        // begins an indefinite byte string: definite chunks followed by s_break
        encoder &bytes()
        {
            _encode_item(major_type::bytes, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        // begins an indefinite text string: definite chunks followed by s_break
        encoder &text()
        {
            _encode_item(major_type::text, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &array()
        {
            _encode_item(major_type::array, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &array(const uint64_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &map()
        {
            _encode_item(major_type::map, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &map(const uint64_t sz)
        {
            _encode_uint_item(major_type::map, sz);
            return *this;
        }

        encoder &s_break()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_break));
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            _encode_uint_item(major_type::tag, id);
            return *this;
        }

        // values 20..31 are either booleans, null, undefined or not well-formed and have dedicated methods
        encoder &simple(const uint8_t val)
        {
            if (val < 20) {
                _encode_item(major_type::simple, val);
            } else if (val >= 32) {
                _encode_item_with_data(initial_byte(major_type::simple, special_val::one_byte), buffer { &val, 1 });
            } else [[unlikely]] {
                throw encode_error::message(fmt::format("simple value {} cannot be encoded with simple()", val));
            }
            return *this;
        }

        encoder &s_null()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_undefined()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_undefined));
            return *this;
        }

        // writes bytes that must already be valid CBOR
        encoder &raw_cbor(const buffer buf)
        {
            _write(buf);
            return *this;
        }

        template<typename T, typename C>
        encoder &encode(const T &val, C &ctx)
        {
            codec<T>::encode(*this, val, ctx);
            return *this;
        }

        template<typename T>
        encoder &encode(const T &val)
        {
            unit ctx {};
            return encode(val, ctx);
        }
    private:
        W &_w;

        void _write(const buffer buf)
        {
            try {
                _w.write_all(buf);
            } catch (const encode_error &) {
                throw;
            } catch (const std::exception &) {
                throw encode_error::write(std::current_exception());
            }
        }

        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint8_t>::max()) {
                const auto h_val = static_cast<uint8_t>(val);
                _encode_item_with_data(initial_byte(typ, special_val::one_byte), buffer { &h_val, sizeof(h_val) });
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                _encode_item_with_data(initial_byte(typ, special_val::two_bytes), buffer::from(host_to_net<uint16_t>(val)));
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                _encode_item_with_data(initial_byte(typ, special_val::four_bytes), buffer::from(host_to_net<uint32_t>(val)));
            } else {
                _encode_item_with_data(initial_byte(typ, special_val::eight_bytes), buffer::from(host_to_net<uint64_t>(val)));
            }
        }

        // the header and its argument go out in a single write
        void _encode_item_with_data(const uint8_t initial, const buffer data)
        {
            std::array<uint8_t, 9> item;
            item[0] = initial;
            memcpy(item.data() + 1, data.data(), data.size());
            _write(buffer { item.data(), data.size() + 1 });
        }

        void _encode_item(const major_type typ, const uint8_t special)
        {
            const uint8_t initial = make_initial_byte(typ, special);
            _write(buffer { &initial, 1 });
        }
    };
}

#endif // !TESSERA_CBOR_ENCODER_HPP
