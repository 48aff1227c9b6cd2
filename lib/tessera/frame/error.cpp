/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/frame/error.hpp>

namespace tessera::frame {
    error::error(const error_kind kind, const std::string_view msg, std::exception_ptr cause):
        tessera::error { msg }, _kind { kind }, _cause { std::move(cause) }
    {
    }

    error error::io(std::exception_ptr cause)
    {
        const auto msg = fmt::format("frame i/o failed: {}", cause);
        return { error_kind::io, msg, std::move(cause) };
    }

    error error::decode(std::exception_ptr cause)
    {
        const auto msg = fmt::format("frame payload decode failed: {}", cause);
        return { error_kind::decode, msg, std::move(cause) };
    }

    error error::encode(std::exception_ptr cause)
    {
        const auto msg = fmt::format("frame payload encode failed: {}", cause);
        return { error_kind::encode, msg, std::move(cause) };
    }

    error error::invalid_len(const uint64_t len, const size_t max_len)
    {
        return { error_kind::invalid_len, fmt::format("frame length {} exceeds the maximum of {}", len, max_len) };
    }

    error error::unexpected_eof(const size_t have, const size_t need)
    {
        return { error_kind::unexpected_eof, fmt::format("the stream ended after {} of {} bytes of a frame", have, need) };
    }
}
