/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_FRAME_ASYNC_READER_HPP
#define TESSERA_FRAME_ASYNC_READER_HPP

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "reader.hpp"

namespace tessera::frame {
    /*
     * Reads length-prefixed CBOR frames from a Boost.Asio AsyncReadStream inside a coroutine.
     * The bytes of a partially received prefix or payload are kept in the reader itself,
     * so a read that was abandoned while suspended is continued by the next call without losing input.
     */
    template<typename Stream>
    struct async_reader {
        explicit async_reader(Stream &stream, const size_t max_len=default_max_len):
            _stream { stream }, _max_len { max_len }
        {
        }

        async_reader(const async_reader &) =delete;

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

        template<typename T, typename C>
        boost::asio::awaitable<std::optional<T>> read_with(C &ctx)
        {
            if (!_in_payload) {
                while (_prefix_len < _prefix.size()) {
                    const auto num_read = co_await _read_some(_prefix.data() + _prefix_len, _prefix.size() - _prefix_len);
                    if (num_read == 0) {
                        if (_prefix_len == 0) {
                            logger::trace("async frame reader: the stream ended at a frame boundary");
                            co_return std::nullopt;
                        }
                        const auto have = std::exchange(_prefix_len, 0);
                        throw error::unexpected_eof(have, _prefix.size());
                    }
                    _prefix_len += num_read;
                }
                _prefix_len = 0;
                _buf.resize(detail::check_len(_prefix, _max_len));
                _payload_len = 0;
                _in_payload = true;
            }
            while (_payload_len < _buf.size()) {
                const auto num_read = co_await _read_some(_buf.data() + _payload_len, _buf.size() - _payload_len);
                if (num_read == 0) {
                    _in_payload = false;
                    throw error::unexpected_eof(prefix_size + _payload_len, prefix_size + _buf.size());
                }
                _payload_len += num_read;
            }
            _in_payload = false;
            co_return detail::decode_payload<T>(_buf, ctx);
        }

        template<typename T>
        boost::asio::awaitable<std::optional<T>> read()
        {
            cbor::unit ctx {};
            co_return co_await read_with<T>(ctx);
        }

        Stream &stream() noexcept
        {
            return _stream;
        }

        const uint8_vector &buffer() const noexcept
        {
            return _buf;
        }
    private:
        Stream &_stream;
        size_t _max_len;
        std::array<uint8_t, prefix_size> _prefix {};
        size_t _prefix_len = 0;
        uint8_vector _buf {};
        size_t _payload_len = 0;
        bool _in_payload = false;

        // the number of bytes read, zero once the stream has ended
        boost::asio::awaitable<size_t> _read_some(uint8_t *data, const size_t sz)
        {
            for (;;) {
                try {
                    co_return co_await _stream.async_read_some(boost::asio::mutable_buffer { data, sz }, boost::asio::use_awaitable);
                } catch (const boost::system::system_error &ex) {
                    if (ex.code() == boost::asio::error::eof)
                        co_return 0;
                    if (ex.code() != boost::asio::error::interrupted)
                        throw error::io(std::current_exception());
                }
            }
        }
    };
}

#endif // !TESSERA_FRAME_ASYNC_READER_HPP
