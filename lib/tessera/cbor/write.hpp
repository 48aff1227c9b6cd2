/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_WRITE_HPP
#define TESSERA_CBOR_WRITE_HPP

#include <concepts>
#include <cstring>
#include <tessera/common/bytes.hpp>
#include <tessera/config.hpp>
#if TESSERA_STD
#   include <ostream>
#endif
#include "error.hpp"

namespace tessera::cbor {
    // a byte sink: write_all either writes every byte or throws
    template<typename W>
    concept writer = requires(W &w, const buffer bytes) {
        { w.write_all(bytes) };
    };

#if TESSERA_ALLOC
    struct vector_writer {
        vector_writer() =default;

        // reuses the storage of an existing vector, its contents are discarded
        explicit vector_writer(uint8_vector &&storage):
            _buf { std::move(storage) }
        {
            _buf.clear();
        }

        void write_all(const buffer bytes)
        {
            _buf << bytes;
        }

        const uint8_vector &bytes() const noexcept
        {
            return _buf;
        }

        uint8_vector &bytes() noexcept
        {
            return _buf;
        }

        uint8_vector take() noexcept
        {
            return std::move(_buf);
        }

        void clear() noexcept
        {
            _buf.clear();
        }
    private:
        uint8_vector _buf {};
    };
    static_assert(writer<vector_writer>);
#endif

    // writes into a caller-provided fixed-size area
    struct slice_writer {
        explicit slice_writer(const write_buffer out) noexcept:
            _out { out }
        {
        }

        void write_all(const buffer bytes)
        {
            if (bytes.size() > _out.size() - _pos) [[unlikely]]
                throw encode_error::end_of_slice();
            if (!bytes.empty())
                memcpy(_out.data() + _pos, bytes.data(), bytes.size());
            _pos += bytes.size();
        }

        size_t size() const noexcept
        {
            return _pos;
        }

        buffer written() const noexcept
        {
            return { _out.data(), _pos };
        }
    private:
        write_buffer _out;
        size_t _pos = 0;
    };
    static_assert(writer<slice_writer>);

    // counts the bytes without storing them
    struct size_writer {
        void write_all(const buffer bytes) noexcept
        {
            _size += bytes.size();
        }

        size_t size() const noexcept
        {
            return _size;
        }
    private:
        size_t _size = 0;
    };
    static_assert(writer<size_writer>);

#if TESSERA_STD
    struct ostream_writer {
        explicit ostream_writer(std::ostream &os) noexcept:
            _os { os }
        {
        }

        void write_all(const buffer bytes)
        {
            _os.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!_os) [[unlikely]]
                throw error_sys(fmt::format("failed to write {} bytes to an output stream", bytes.size()));
        }

        std::ostream &stream() noexcept
        {
            return _os;
        }
    private:
        std::ostream &_os;
    };
    static_assert(writer<ostream_writer>);
#endif
}

#endif // !TESSERA_CBOR_WRITE_HPP
