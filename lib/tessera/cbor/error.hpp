/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_ERROR_HPP
#define TESSERA_CBOR_ERROR_HPP

#include <exception>
#include <optional>
#include <string>
#include <tessera/common/error.hpp>
#include <tessera/config.hpp>
#include "types.hpp"

namespace tessera::cbor {
    enum class error_kind: uint8_t {
        message,
        type_mismatch,
        end_of_input,
        overflow,
        custom,
        invalid_char,
        utf8,
        missing_value,
        unknown_variant,
        write,
        end_of_slice
    };

    /*
     * The common part of decode and encode errors.
     * Instances are created only through the named factories of the subclasses.
     * Copies share the boxed cause.
     */
    struct codec_error: error {
        error_kind kind() const noexcept
        {
            return _kind;
        }

        std::optional<size_t> position() const noexcept
        {
            return _pos;
        }

        std::exception_ptr cause() const noexcept
        {
            return _cause;
        }

        // the message without the position suffix
        const std::string &detail() const noexcept
        {
            return _detail;
        }
    protected:
        codec_error(std::string_view prefix, error_kind kind, std::string detail, std::exception_ptr cause={});

        void _set_position(size_t pos);
        void _append_message(std::string_view msg);
    private:
        std::string_view _prefix;
        error_kind _kind;
        std::string _detail;
        std::optional<size_t> _pos {};
        std::exception_ptr _cause {};

        void _update();
    };

    struct decode_error: codec_error {
        static decode_error message(std::string_view msg);
        static decode_error type_mismatch(data_type found);
        static decode_error end_of_input();
        static decode_error overflow(uint64_t val);
#if TESSERA_STD
        static decode_error custom(std::exception_ptr cause);
#endif
        static decode_error invalid_char(uint32_t val);
        static decode_error utf8(size_t offset);
        static decode_error missing_value(uint64_t idx);
        static decode_error unknown_variant(uint64_t idx);

        decode_error &at(size_t pos) &;
        decode_error &&at(size_t pos) &&;
        decode_error &with_message(std::string_view msg) &;
        decode_error &&with_message(std::string_view msg) &&;

        std::optional<data_type> found() const noexcept
        {
            return _found;
        }
    private:
        std::optional<data_type> _found {};

        decode_error(error_kind kind, std::string detail, std::exception_ptr cause={});
    };

    struct encode_error: codec_error {
        static encode_error message(std::string_view msg);
        static encode_error write(std::exception_ptr cause);
        static encode_error end_of_slice();
#if TESSERA_STD
        static encode_error custom(std::exception_ptr cause);
#endif

        encode_error &with_message(std::string_view msg) &;
        encode_error &&with_message(std::string_view msg) &&;
    private:
        encode_error(error_kind kind, std::string detail, std::exception_ptr cause={});
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::error_kind;
            switch (v) {
                case error_kind::message: return fmt::format_to(ctx.out(), "message");
                case error_kind::type_mismatch: return fmt::format_to(ctx.out(), "type_mismatch");
                case error_kind::end_of_input: return fmt::format_to(ctx.out(), "end_of_input");
                case error_kind::overflow: return fmt::format_to(ctx.out(), "overflow");
                case error_kind::custom: return fmt::format_to(ctx.out(), "custom");
                case error_kind::invalid_char: return fmt::format_to(ctx.out(), "invalid_char");
                case error_kind::utf8: return fmt::format_to(ctx.out(), "utf8");
                case error_kind::missing_value: return fmt::format_to(ctx.out(), "missing_value");
                case error_kind::unknown_variant: return fmt::format_to(ctx.out(), "unknown_variant");
                case error_kind::write: return fmt::format_to(ctx.out(), "write");
                case error_kind::end_of_slice: return fmt::format_to(ctx.out(), "end_of_slice");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TESSERA_CBOR_ERROR_HPP
