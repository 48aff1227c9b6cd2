/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/cbor/tokenizer.hpp>

namespace tessera::cbor {
    std::optional<token> tokenizer::next()
    {
        if (_dec.empty())
            return {};
        try {
            return _read();
        } catch (const decode_error &) {
            _dec.set_position(_dec.input().size());
            throw;
        }
    }

    token tokenizer::_read()
    {
        const auto start = _dec.position();
        switch (const auto typ = _dec.datatype(); typ) {
            case data_type::boolean: return _dec.boolean();
            case data_type::null: _dec.null(); return null_token {};
            case data_type::undefined: _dec.undefined(); return undefined_token {};
            case data_type::u8: return _dec.u8();
            case data_type::u16: return _dec.u16();
            case data_type::u32: return _dec.u32();
            case data_type::u64: return _dec.u64();
            case data_type::i8: return _dec.i8();
            case data_type::i16: return _dec.i16();
            case data_type::i32: return _dec.i32();
            case data_type::i64: return _dec.i64();
            case data_type::integer: return _dec.integer();
#if TESSERA_HALF
            case data_type::f16: return f16_token { _dec.f16() };
#endif
            case data_type::f32: return _dec.f32();
            case data_type::f64: return _dec.f64();
            case data_type::simple: return simple_token { _dec.simple() };
            case data_type::bytes: return _dec.bytes();
            case data_type::text: return _dec.text();
            case data_type::bytes_indef:
                _dec.set_position(start + 1);
                return begin_bytes {};
            case data_type::text_indef:
                _dec.set_position(start + 1);
                return begin_text {};
            case data_type::array:
            case data_type::array_indef:
                return begin_array { _dec.array() };
            case data_type::map:
            case data_type::map_indef:
                return begin_map { _dec.map() };
            case data_type::tag: return tag_token { _dec.tag() };
            case data_type::brk:
                _dec.set_position(start + 1);
                return break_token {};
            default:
                throw decode_error::type_mismatch(typ).at(start).with_message("unsupported item");
        }
    }
}
