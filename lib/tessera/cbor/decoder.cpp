/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <bit>
#include <utility>
#include <vector>
#include <utf8.h>
#include <tessera/cbor/decoder.hpp>

namespace tessera::cbor {
    std::optional<data_type> decoder::_classify(const size_t pos) const noexcept
    {
        if (pos >= _buf.size())
            return {};
        const auto b = _buf[pos];
        const auto info = info_of(b);
        // the big-endian argument of a negative integer or std::nullopt if the input is truncated
        const auto arg = [&](const size_t sz) -> std::optional<uint64_t> {
            if (sz > _buf.size() - pos - 1)
                return {};
            uint64_t val = 0;
            for (size_t i = 0; i < sz; ++i)
                val = (val << 8) | _buf[pos + 1 + i];
            return val;
        };
        const auto container = [info](const data_type definite, const data_type indefinite) {
            if (info < 28)
                return definite;
            if (info == 31)
                return indefinite;
            return data_type::unknown;
        };
        switch (major_of(b)) {
            case major_type::uint:
                if (info <= 24)
                    return data_type::u8;
                switch (info) {
                    case 25: return data_type::u16;
                    case 26: return data_type::u32;
                    case 27: return data_type::u64;
                    default: return data_type::unknown;
                }
            case major_type::nint: {
                if (info < 24)
                    return data_type::i8;
                if (info > 27)
                    return data_type::unknown;
                const auto val = arg(size_t { 1 } << (info - 24));
                if (!val)
                    return {};
                switch (info) {
                    case 24: return *val < 0x80 ? data_type::i8 : data_type::i16;
                    case 25: return *val < 0x8000 ? data_type::i16 : data_type::i32;
                    case 26: return *val < 0x80000000 ? data_type::i32 : data_type::i64;
                    default: return *val < 0x8000000000000000ULL ? data_type::i64 : data_type::integer;
                }
            }
            case major_type::bytes: return container(data_type::bytes, data_type::bytes_indef);
            case major_type::text: return container(data_type::text, data_type::text_indef);
            case major_type::array: return container(data_type::array, data_type::array_indef);
            case major_type::map: return container(data_type::map, data_type::map_indef);
            case major_type::tag: return info < 28 ? data_type::tag : data_type::unknown;
            case major_type::simple:
                if (info < 20)
                    return data_type::simple;
                switch (info) {
                    case 20:
                    case 21:
                        return data_type::boolean;
                    case 22: return data_type::null;
                    case 23: return data_type::undefined;
                    case 24: return data_type::simple;
                    case 25: return data_type::f16;
                    case 26: return data_type::f32;
                    case 27: return data_type::f64;
                    case 31: return data_type::brk;
                    default: return data_type::unknown;
                }
            default:
                return data_type::unknown;
        }
    }

    void decoder::_type_mismatch(const size_t start) const
    {
        throw decode_error::type_mismatch(_classify(start).value_or(data_type::unknown)).at(start);
    }

    data_type decoder::datatype() const
    {
        if (const auto dt = _classify(_pos); dt) [[likely]]
            return *dt;
        throw decode_error::end_of_input().at(_pos);
    }

    bool decoder::boolean()
    {
        const auto start = _pos;
        switch (_read_byte(start)) {
            case initial_byte(major_type::simple, special_val::s_false): return false;
            case initial_byte(major_type::simple, special_val::s_true): return true;
            [[unlikely]] default: _type_mismatch(start);
        }
    }

    uint8_t decoder::u8()
    {
        return _narrow_unsigned<uint8_t>();
    }

    uint16_t decoder::u16()
    {
        return _narrow_unsigned<uint16_t>();
    }

    uint32_t decoder::u32()
    {
        return _narrow_unsigned<uint32_t>();
    }

    uint64_t decoder::u64()
    {
        return _unsigned(_pos);
    }

    int8_t decoder::i8()
    {
        return _narrow_signed<int8_t>();
    }

    int16_t decoder::i16()
    {
        return _narrow_signed<int16_t>();
    }

    int32_t decoder::i32()
    {
        return _narrow_signed<int32_t>();
    }

    int64_t decoder::i64()
    {
        return _narrow_signed<int64_t>();
    }

    cbor::integer decoder::integer()
    {
        const auto [neg, raw] = _signed(_pos);
        return cbor::integer::from_raw(neg, raw);
    }

#if TESSERA_HALF
    float decoder::f16()
    {
        const auto start = _pos;
        if (_read_byte(start) != initial_byte(major_type::simple, special_val::two_bytes)) [[unlikely]]
            _type_mismatch(start);
        return half_to_float(_read_be<uint16_t>(start));
    }
#endif

    float decoder::f32()
    {
        const auto start = _pos;
        switch (_read_byte(start)) {
            case initial_byte(major_type::simple, special_val::four_bytes):
                return std::bit_cast<float>(_read_be<uint32_t>(start));
#if TESSERA_HALF
            case initial_byte(major_type::simple, special_val::two_bytes):
                return half_to_float(_read_be<uint16_t>(start));
#endif
            [[unlikely]] default:
                _type_mismatch(start);
        }
    }

    double decoder::f64()
    {
        const auto start = _pos;
        switch (_read_byte(start)) {
            case initial_byte(major_type::simple, special_val::eight_bytes):
                return std::bit_cast<double>(_read_be<uint64_t>(start));
            case initial_byte(major_type::simple, special_val::four_bytes):
                return std::bit_cast<float>(_read_be<uint32_t>(start));
#if TESSERA_HALF
            case initial_byte(major_type::simple, special_val::two_bytes):
                return half_to_float(_read_be<uint16_t>(start));
#endif
            [[unlikely]] default:
                _type_mismatch(start);
        }
    }

    char32_t decoder::character()
    {
        const auto start = _pos;
        const auto val = u32();
        if (val > 0x10FFFF || (val >= 0xD800 && val <= 0xDFFF)) [[unlikely]]
            throw decode_error::invalid_char(val).at(start);
        return static_cast<char32_t>(val);
    }

    buffer decoder::bytes()
    {
        return _definite_string(major_type::bytes, _pos);
    }

    std::string_view decoder::text()
    {
        const auto start = _pos;
        return _validate_text(_definite_string(major_type::text, start), start);
    }

    std::optional<uint64_t> decoder::array()
    {
        return _container(major_type::array);
    }

    std::optional<uint64_t> decoder::map()
    {
        return _container(major_type::map);
    }

    uint64_t decoder::tag()
    {
        const auto start = _pos;
        return _argument(info_of(_initial(major_type::tag, start)), start);
    }

    void decoder::null()
    {
        const auto start = _pos;
        if (_read_byte(start) != initial_byte(major_type::simple, special_val::s_null)) [[unlikely]]
            _type_mismatch(start);
    }

    void decoder::undefined()
    {
        const auto start = _pos;
        if (_read_byte(start) != initial_byte(major_type::simple, special_val::s_undefined)) [[unlikely]]
            _type_mismatch(start);
    }

    uint8_t decoder::simple()
    {
        const auto start = _pos;
        const auto b = _read_byte(start);
        if (major_of(b) == major_type::simple) [[likely]] {
            const auto info = info_of(b);
            if (info < 20)
                return info;
            if (info == static_cast<uint8_t>(special_val::one_byte)) {
                const auto val = _read_byte(start);
                if (val < 32) [[unlikely]]
                    throw decode_error::message(fmt::format("simple value {} must use the one-byte encoding", val)).at(start);
                return val;
            }
        }
        _type_mismatch(start);
    }

    void decoder::skip()
    {
#if TESSERA_ALLOC
        try {
            // remaining elements per open container, std::nullopt for an indefinite one
            std::vector<std::optional<uint64_t>> levels {};
            // a tag must be followed by its content, never by a break
            bool tag_pending = false;
            for (;;) {
                const auto start = _pos;
                const auto after_tag = std::exchange(tag_pending, false);
                const auto b = _read_byte(start);
                const auto typ = major_of(b);
                const auto info = info_of(b);
                bool item_done = true;
                switch (typ) {
                    case major_type::uint:
                    case major_type::nint:
                        _argument(info, start);
                        break;
                    case major_type::bytes:
                    case major_type::text:
                        if (info == static_cast<uint8_t>(special_val::s_break)) {
                            _skip_indefinite_string(typ);
                        } else {
                            const auto data = _read_slice(_argument(info, start), start);
                            if (typ == major_type::text)
                                _validate_text(data, start);
                        }
                        break;
                    case major_type::array:
                    case major_type::map:
                        if (info == static_cast<uint8_t>(special_val::s_break)) {
                            levels.emplace_back();
                            item_done = false;
                        } else {
                            auto num_items = _argument(info, start);
                            if (typ == major_type::map) {
                                if (num_items > std::numeric_limits<uint64_t>::max() / 2) [[unlikely]]
                                    throw decode_error::overflow(num_items).at(start);
                                num_items *= 2;
                            }
                            if (num_items > 0) {
                                levels.emplace_back(num_items);
                                item_done = false;
                            }
                        }
                        break;
                    case major_type::tag:
                        _argument(info, start);
                        tag_pending = true;
                        item_done = false;
                        break;
                    case major_type::simple:
                        if (info == static_cast<uint8_t>(special_val::s_break)) {
                            if (after_tag || levels.empty() || levels.back()) [[unlikely]]
                                _type_mismatch(start);
                            levels.pop_back();
                        } else {
                            _argument(info, start);
                        }
                        break;
                }
                if (item_done) {
                    while (!levels.empty() && levels.back()) {
                        if (--*levels.back() > 0)
                            break;
                        levels.pop_back();
                    }
                    if (levels.empty())
                        return;
                }
            }
        } catch (const decode_error &) {
            _pos = _buf.size();
            throw;
        }
#else
        limited_skip();
#endif
    }

    void decoder::limited_skip()
    {
        static constexpr auto sat_add = [](const uint64_t a, const uint64_t b) {
            return a > std::numeric_limits<uint64_t>::max() - b ? std::numeric_limits<uint64_t>::max() : a + b;
        };
        try {
            uint64_t nrounds = 1;
            uint64_t irounds = 0;
            bool tag_pending = false;
            while (nrounds > 0 || irounds > 0) {
                const auto start = _pos;
                const auto after_tag = std::exchange(tag_pending, false);
                const auto b = _read_byte(start);
                const auto typ = major_of(b);
                const auto info = info_of(b);
                switch (typ) {
                    case major_type::uint:
                    case major_type::nint:
                        _argument(info, start);
                        break;
                    case major_type::bytes:
                    case major_type::text:
                        if (info == static_cast<uint8_t>(special_val::s_break)) {
                            _skip_indefinite_string(typ);
                        } else {
                            const auto data = _read_slice(_argument(info, start), start);
                            if (typ == major_type::text)
                                _validate_text(data, start);
                        }
                        break;
                    case major_type::array:
                    case major_type::map:
                        if (info == static_cast<uint8_t>(special_val::s_break)) {
                            irounds = sat_add(irounds, 1);
                        } else {
                            const auto num_items = _argument(info, start);
                            nrounds = sat_add(nrounds, typ == major_type::map ? sat_add(num_items, num_items) : num_items);
                        }
                        break;
                    case major_type::tag:
                        _argument(info, start);
                        nrounds = sat_add(nrounds, 1);
                        tag_pending = true;
                        break;
                    case major_type::simple:
                        if (info == static_cast<uint8_t>(special_val::s_break)) {
                            if (after_tag || irounds == 0) [[unlikely]]
                                _type_mismatch(start);
                            --irounds;
                        } else {
                            _argument(info, start);
                        }
                        break;
                }
                if (nrounds > 0)
                    --nrounds;
            }
        } catch (const decode_error &) {
            _pos = _buf.size();
            throw;
        }
    }

    std::optional<uint64_t> decoder::_container(const major_type typ)
    {
        const auto start = _pos;
        const auto info = info_of(_initial(typ, start));
        if (info == static_cast<uint8_t>(special_val::s_break))
            return {};
        return _argument(info, start);
    }

    buffer decoder::_definite_string(const major_type typ, const size_t start)
    {
        const auto info = info_of(_initial(typ, start));
        if (info == static_cast<uint8_t>(special_val::s_break)) [[unlikely]]
            _type_mismatch(start);
        return _read_slice(_argument(info, start), start);
    }

    void decoder::_skip_indefinite_string(const major_type typ)
    {
        while (_peek() != s_break_byte) {
            const auto chunk_start = _pos;
            const auto data = _definite_string(typ, chunk_start);
            if (typ == major_type::text)
                _validate_text(data, chunk_start);
        }
        ++_pos;
    }

    std::string_view decoder::_validate_text(const buffer bytes, const size_t start) const
    {
        const auto *begin = reinterpret_cast<const char *>(bytes.data());
        const auto *end = begin + bytes.size();
        if (const auto *invalid = utf8::find_invalid(begin, end); invalid != end) [[unlikely]]
            throw decode_error::utf8(static_cast<size_t>(invalid - begin)).at(start);
        return { begin, bytes.size() };
    }
}
