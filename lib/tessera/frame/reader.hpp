/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_FRAME_READER_HPP
#define TESSERA_FRAME_READER_HPP

#include <array>
#include <optional>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <tessera/cbor/codec.hpp>
#include <tessera/logger.hpp>
#include "error.hpp"

namespace tessera::frame {
    namespace detail {
        template<typename T, typename C>
        T decode_payload(const buffer payload, C &ctx)
        {
            try {
                return cbor::decode_with<T>(payload, ctx);
            } catch (const cbor::decode_error &) {
                throw error::decode(std::current_exception());
            }
        }

        inline size_t check_len(const std::array<uint8_t, prefix_size> &prefix, const size_t max_len)
        {
            const auto len = buffer { prefix.data(), prefix.size() }.to_host<uint32_t>();
            if (len > max_len) [[unlikely]] {
                logger::debug("frame reader: rejecting a frame of {} bytes, the maximum is {}", len, max_len);
                throw error::invalid_len(len, max_len);
            }
            return len;
        }
    }

    /*
     * Reads length-prefixed CBOR frames from a Boost.Asio SyncReadStream.
     * read returns std::nullopt when the stream ends exactly at a frame boundary and throws
     * an unexpected_eof error when it ends inside a length prefix or a payload.
     */
    template<typename Stream>
    struct reader {
        explicit reader(Stream &stream, const size_t max_len=default_max_len):
            _stream { stream }, _max_len { max_len }
        {
        }

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
        std::optional<T> read_with(C &ctx)
        {
            std::array<uint8_t, prefix_size> prefix {};
            const auto prefix_read = _read_full(prefix.data(), prefix.size());
            if (prefix_read == 0) {
                logger::trace("frame reader: the stream ended at a frame boundary");
                return {};
            }
            if (prefix_read < prefix.size()) [[unlikely]]
                throw error::unexpected_eof(prefix_read, prefix.size());
            const auto len = detail::check_len(prefix, _max_len);
            _buf.resize(len);
            if (const auto payload_read = _read_full(_buf.data(), _buf.size()); payload_read < len) [[unlikely]]
                throw error::unexpected_eof(prefix_size + payload_read, prefix_size + len);
            return detail::decode_payload<T>(_buf, ctx);
        }

        template<typename T>
        std::optional<T> read()
        {
            cbor::unit ctx {};
            return read_with<T>(ctx);
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
        uint8_vector _buf {};

        // reads until sz bytes are read or the stream ends; returns the number of bytes read
        size_t _read_full(uint8_t *data, const size_t sz)
        {
            size_t done = 0;
            while (done < sz) {
                boost::system::error_code ec {};
                const auto num_read = _stream.read_some(boost::asio::mutable_buffer { data + done, sz - done }, ec);
                done += num_read;
                if (ec == boost::asio::error::interrupted)
                    continue;
                if (ec == boost::asio::error::eof || (!ec && num_read == 0))
                    break;
                if (ec) [[unlikely]]
                    throw error::io(std::make_exception_ptr(boost::system::system_error { ec }));
            }
            return done;
        }
    };
}

#endif // !TESSERA_FRAME_READER_HPP
