/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_FRAME_ERROR_HPP
#define TESSERA_FRAME_ERROR_HPP

#include <cstdint>
#include <exception>
#include <tessera/common/error.hpp>
#include <tessera/common/format.hpp>
#include <tessera/config.hpp>

namespace tessera::frame {
    static_assert(capabilities::host_io, "the frame layer requires TESSERA_STD");

    enum class error_kind: uint8_t {
        io,
        decode,
        encode,
        invalid_len,
        unexpected_eof
    };

    // the length prefix is a big-endian uint32_t
    static constexpr size_t prefix_size = sizeof(uint32_t);
    static constexpr size_t default_max_len = 512 * 1024;

    struct error: tessera::error {
        static error io(std::exception_ptr cause);
        static error decode(std::exception_ptr cause);
        static error encode(std::exception_ptr cause);
        static error invalid_len(uint64_t len, size_t max_len);
        static error unexpected_eof(size_t have, size_t need);

        error_kind kind() const noexcept
        {
            return _kind;
        }

        std::exception_ptr cause() const noexcept
        {
            return _cause;
        }
    private:
        error_kind _kind;
        std::exception_ptr _cause;

        error(error_kind kind, std::string_view msg, std::exception_ptr cause={});
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::frame::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::frame::error_kind;
            switch (v) {
                case error_kind::io: return fmt::format_to(ctx.out(), "io");
                case error_kind::decode: return fmt::format_to(ctx.out(), "decode");
                case error_kind::encode: return fmt::format_to(ctx.out(), "encode");
                case error_kind::invalid_len: return fmt::format_to(ctx.out(), "invalid_len");
                case error_kind::unexpected_eof: return fmt::format_to(ctx.out(), "unexpected_eof");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TESSERA_FRAME_ERROR_HPP
