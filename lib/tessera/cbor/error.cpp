/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/cbor/error.hpp>

namespace tessera::cbor {
    codec_error::codec_error(const std::string_view prefix, const error_kind kind, std::string detail, std::exception_ptr cause):
        error { fmt::format("{}: {}", prefix, detail) },
        _prefix { prefix }, _kind { kind }, _detail { std::move(detail) }, _cause { std::move(cause) }
    {
    }

    void codec_error::_set_position(const size_t pos)
    {
        _pos = pos;
        _update();
    }

    void codec_error::_append_message(const std::string_view msg)
    {
        _detail = fmt::format("{}: {}", _detail, msg);
        _update();
    }

    void codec_error::_update()
    {
        if (_pos)
            _set_message(fmt::format("{} at position {}: {}", _prefix, *_pos, _detail));
        else
            _set_message(fmt::format("{}: {}", _prefix, _detail));
    }

    decode_error::decode_error(const error_kind kind, std::string detail, std::exception_ptr cause):
        codec_error { "decode error", kind, std::move(detail), std::move(cause) }
    {
    }

    decode_error decode_error::message(const std::string_view msg)
    {
        return { error_kind::message, std::string { msg } };
    }

    decode_error decode_error::type_mismatch(const data_type found)
    {
        decode_error err { error_kind::type_mismatch, fmt::format("unexpected type {}", found) };
        err._found = found;
        return err;
    }

    decode_error decode_error::end_of_input()
    {
        return { error_kind::end_of_input, "end of input bytes" };
    }

    decode_error decode_error::overflow(const uint64_t val)
    {
        return { error_kind::overflow, fmt::format("{} overflows the target type", val) };
    }

#if TESSERA_STD
    decode_error decode_error::custom(std::exception_ptr cause)
    {
        auto detail = describe_exception(cause);
        return { error_kind::custom, std::move(detail), std::move(cause) };
    }
#endif

    decode_error decode_error::invalid_char(const uint32_t val)
    {
        return { error_kind::invalid_char, fmt::format("invalid char: {:#x}", val) };
    }

    decode_error decode_error::utf8(const size_t offset)
    {
        return { error_kind::utf8, fmt::format("invalid utf-8 sequence at text offset {}", offset) };
    }

    decode_error decode_error::missing_value(const uint64_t idx)
    {
        return { error_kind::missing_value, fmt::format("missing value at index {}", idx) };
    }

    decode_error decode_error::unknown_variant(const uint64_t idx)
    {
        return { error_kind::unknown_variant, fmt::format("unknown enum variant {}", idx) };
    }

    decode_error &decode_error::at(const size_t pos) &
    {
        _set_position(pos);
        return *this;
    }

    decode_error &&decode_error::at(const size_t pos) &&
    {
        _set_position(pos);
        return std::move(*this);
    }

    decode_error &decode_error::with_message(const std::string_view msg) &
    {
        _append_message(msg);
        return *this;
    }

    decode_error &&decode_error::with_message(const std::string_view msg) &&
    {
        _append_message(msg);
        return std::move(*this);
    }

    encode_error::encode_error(const error_kind kind, std::string detail, std::exception_ptr cause):
        codec_error { "encode error", kind, std::move(detail), std::move(cause) }
    {
    }

    encode_error encode_error::message(const std::string_view msg)
    {
        return { error_kind::message, std::string { msg } };
    }

    encode_error encode_error::write(std::exception_ptr cause)
    {
        auto detail = fmt::format("write failed: {}", describe_exception(cause));
        return { error_kind::write, std::move(detail), std::move(cause) };
    }

    encode_error encode_error::end_of_slice()
    {
        return { error_kind::end_of_slice, "end of output slice" };
    }

#if TESSERA_STD
    encode_error encode_error::custom(std::exception_ptr cause)
    {
        auto detail = describe_exception(cause);
        return { error_kind::custom, std::move(detail), std::move(cause) };
    }
#endif

    encode_error &encode_error::with_message(const std::string_view msg) &
    {
        _append_message(msg);
        return *this;
    }

    encode_error &&encode_error::with_message(const std::string_view msg) &&
    {
        _append_message(msg);
        return std::move(*this);
    }
}
