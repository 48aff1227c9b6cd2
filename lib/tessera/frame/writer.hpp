/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_FRAME_WRITER_HPP
#define TESSERA_FRAME_WRITER_HPP

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <tessera/cbor/codec.hpp>
#include <tessera/logger.hpp>
#include "error.hpp"

namespace tessera::frame {
    namespace detail {
        // encodes the value after a zeroed length prefix and then fills in the prefix
        template<typename T, typename C>
        size_t encode_frame(cbor::vector_writer &scratch, const T &val, C &ctx, const size_t max_len)
        {
            scratch.clear();
            static constexpr std::array<uint8_t, prefix_size> no_prefix {};
            scratch.write_all(buffer { no_prefix.data(), no_prefix.size() });
            try {
                cbor::encode_with(val, scratch, ctx);
            } catch (const cbor::encode_error &) {
                throw error::encode(std::current_exception());
            }
            auto &bytes = scratch.bytes();
            const auto len = bytes.size() - prefix_size;
            if (len > max_len) [[unlikely]] {
                logger::debug("frame writer: rejecting a payload of {} bytes, the maximum is {}", len, max_len);
                throw error::invalid_len(len, max_len);
            }
            const auto prefix = host_to_net<uint32_t>(static_cast<uint32_t>(len));
            memcpy(bytes.data(), &prefix, sizeof(prefix));
            return len;
        }
    }

    /*
     * Writes length-prefixed CBOR frames to a Boost.Asio SyncWriteStream.
     * Each call encodes one value into the scratch buffer and writes the whole frame before returning.
     */
    template<typename Stream>
    struct writer {
        explicit writer(Stream &stream, const size_t max_len=default_max_len):
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

        // returns the number of payload bytes written, the length prefix excluded
        template<typename T, typename C>
        size_t write_with(const T &val, C &ctx)
        {
            const auto len = detail::encode_frame(_scratch, val, ctx, _max_len);
            const auto &bytes = _scratch.bytes();
            try {
                boost::asio::write(_stream, boost::asio::const_buffer { bytes.data(), bytes.size() });
            } catch (const boost::system::system_error &) {
                throw error::io(std::current_exception());
            }
            return len;
        }

        template<typename T>
        size_t write(const T &val)
        {
            cbor::unit ctx {};
            return write_with(val, ctx);
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
    };
}

#endif // !TESSERA_FRAME_WRITER_HPP
