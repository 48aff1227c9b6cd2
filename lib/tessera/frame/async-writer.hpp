/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_FRAME_ASYNC_WRITER_HPP
#define TESSERA_FRAME_ASYNC_WRITER_HPP

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "writer.hpp"

namespace tessera::frame {
    // writes length-prefixed CBOR frames to a Boost.Asio AsyncWriteStream inside a coroutine
    template<typename Stream>
    struct async_writer {
        explicit async_writer(Stream &stream, const size_t max_len=default_max_len):
            _stream { stream }, _max_len { max_len }
        {
        }

        async_writer(const async_writer &) =delete;

        void set_max_len(const size_t max_len)
        {
            if (max_len > std::numeric_limits<uint32_t>::max()) [[unlikely]]
                throw tessera::error(fmt::format("the maximum frame length must fit into uint32_t but got {}", max_len));
            _max_len = max_len;
        }

        size_t max_len() const noexcept
        {
            return _max_len;
        }

        // completes once the whole frame is written; returns the number of payload bytes
        template<typename T, typename C>
        boost::asio::awaitable<size_t> write_with(const T &val, C &ctx)
        {
            const auto len = detail::encode_frame(_scratch, val, ctx, _max_len);
            const auto &bytes = _scratch.bytes();
            _written = 0;
            while (_written < bytes.size()) {
                try {
                    _written += co_await _stream.async_write_some(
                        boost::asio::const_buffer { bytes.data() + _written, bytes.size() - _written }, boost::asio::use_awaitable);
                } catch (const boost::system::system_error &ex) {
                    if (ex.code() != boost::asio::error::interrupted)
                        throw error::io(std::current_exception());
                }
            }
            co_return len;
        }

        template<typename T>
        boost::asio::awaitable<size_t> write(const T &val)
        {
            cbor::unit ctx {};
            co_return co_await write_with(val, ctx);
        }

        Stream &stream() noexcept
        {
            return _stream;
        }

        const uint8_vector &buffer() const noexcept
        {
            return _scratch.bytes();
        }
    private:
        Stream &_stream;
        size_t _max_len;
        cbor::vector_writer _scratch {};
        size_t _written = 0;
    };
}

#endif // !TESSERA_FRAME_ASYNC_WRITER_HPP
