/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_TYPES_HPP
#define TESSERA_CBOR_TYPES_HPP

#include <cstdint>
#include <tessera/common/format.hpp>

namespace tessera::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    // the kind of the next item as seen by decoder::datatype
    enum class data_type: uint8_t {
        boolean,
        null,
        undefined,
        u8,
        u16,
        u32,
        u64,
        i8,
        i16,
        i32,
        i64,
        // a negative integer whose magnitude does not fit into int64_t
        integer,
        f16,
        f32,
        f64,
        simple,
        bytes,
        bytes_indef,
        text,
        text_indef,
        array,
        array_indef,
        map,
        map_indef,
        tag,
        brk,
        unknown
    };

    // the default context for codecs that need none
    struct unit {
        bool operator==(const unit &) const noexcept =default;
    };

    constexpr uint8_t make_initial_byte(const major_type typ, const uint8_t info) noexcept
    {
        return (static_cast<uint8_t>(typ) << 5) | (info & 0x1F);
    }

    constexpr uint8_t initial_byte(const major_type typ, const special_val sv) noexcept
    {
        return make_initial_byte(typ, static_cast<uint8_t>(sv));
    }

    constexpr major_type major_of(const uint8_t initial) noexcept
    {
        return static_cast<major_type>(initial >> 5);
    }

    constexpr uint8_t info_of(const uint8_t initial) noexcept
    {
        return initial & 0x1F;
    }

    constexpr uint8_t s_break_byte = initial_byte(major_type::simple, special_val::s_break);
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tessera::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tessera::cbor::data_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::data_type;
            switch (v) {
                case data_type::boolean: return fmt::format_to(ctx.out(), "bool");
                case data_type::null: return fmt::format_to(ctx.out(), "null");
                case data_type::undefined: return fmt::format_to(ctx.out(), "undefined");
                case data_type::u8: return fmt::format_to(ctx.out(), "u8");
                case data_type::u16: return fmt::format_to(ctx.out(), "u16");
                case data_type::u32: return fmt::format_to(ctx.out(), "u32");
                case data_type::u64: return fmt::format_to(ctx.out(), "u64");
                case data_type::i8: return fmt::format_to(ctx.out(), "i8");
                case data_type::i16: return fmt::format_to(ctx.out(), "i16");
                case data_type::i32: return fmt::format_to(ctx.out(), "i32");
                case data_type::i64: return fmt::format_to(ctx.out(), "i64");
                case data_type::integer: return fmt::format_to(ctx.out(), "int");
                case data_type::f16: return fmt::format_to(ctx.out(), "f16");
                case data_type::f32: return fmt::format_to(ctx.out(), "f32");
                case data_type::f64: return fmt::format_to(ctx.out(), "f64");
                case data_type::simple: return fmt::format_to(ctx.out(), "simple");
                case data_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case data_type::bytes_indef: return fmt::format_to(ctx.out(), "indefinite bytes");
                case data_type::text: return fmt::format_to(ctx.out(), "string");
                case data_type::text_indef: return fmt::format_to(ctx.out(), "indefinite string");
                case data_type::array: return fmt::format_to(ctx.out(), "array");
                case data_type::array_indef: return fmt::format_to(ctx.out(), "indefinite array");
                case data_type::map: return fmt::format_to(ctx.out(), "map");
                case data_type::map_indef: return fmt::format_to(ctx.out(), "indefinite map");
                case data_type::tag: return fmt::format_to(ctx.out(), "tag");
                case data_type::brk: return fmt::format_to(ctx.out(), "break");
                case data_type::unknown: return fmt::format_to(ctx.out(), "unknown");
                default: return fmt::format_to(ctx.out(), "data_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TESSERA_CBOR_TYPES_HPP
