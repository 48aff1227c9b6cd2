/* This file is part of Tessera project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_NET_HPP
#define TESSERA_CBOR_NET_HPP

/*
 * Codecs for the Boost.Asio address types.
 * compact: address_v4 and address_v6 are byte strings of 4 and 16 bytes
 * legacy: address_v4 and address_v6 are arrays of 4 and 16 unsigned integers
 * In both forms an address is [0, v4] or [1, v6], an endpoint is [0 or 1, [ip, port]].
 * Encoding uses the form selected by TESSERA_LEGACY, decoding accepts both.
 */

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/basic_endpoint.hpp>
#include <tessera/config.hpp>
#include "codec.hpp"

namespace tessera::cbor {
    enum class address_form: uint8_t {
        compact,
        legacy
    };

    constexpr address_form default_address_form = capabilities::legacy ? address_form::legacy : address_form::compact;

    namespace detail {
        template<size_t N, typename W>
        void encode_octets(encoder<W> &enc, const std::array<unsigned char, N> &octets, const address_form form)
        {
            if (form == address_form::legacy) {
                enc.array(N);
                for (const auto b: octets)
                    enc.u8(b);
            } else {
                enc.bytes(buffer { octets.data(), octets.size() });
            }
        }

        template<size_t N>
        std::array<unsigned char, N> decode_octets(decoder &dec)
        {
            const auto start = dec.position();
            std::array<unsigned char, N> octets {};
            if (dec.datatype() == data_type::bytes) {
                const auto bytes = dec.bytes();
                if (bytes.size() != N) [[unlikely]]
                    throw decode_error::message(fmt::format("an ip address must have {} bytes but got {}", N, bytes.size())).at(start);
                std::copy(bytes.begin(), bytes.end(), octets.begin());
                return octets;
            }
            unit ctx {};
            const auto arr = codec<std::array<uint8_t, N>>::decode(dec, ctx);
            std::copy(arr.begin(), arr.end(), octets.begin());
            return octets;
        }

        struct variant_header {
            uint32_t index;
            bool indefinite;
        };

        // the [variant, value] header of an address or an endpoint; an indefinite array needs expect_break after the value
        inline variant_header decode_variant(decoder &dec)
        {
            const auto sz = fixed_array(dec, 2);
            const auto var_start = dec.position();
            const auto var = dec.u32();
            if (var > 1) [[unlikely]]
                throw decode_error::unknown_variant(var).at(var_start);
            return { var, !sz };
        }
    }

    template<typename W>
    void encode_address(encoder<W> &enc, const boost::asio::ip::address_v4 &addr, const address_form form=default_address_form)
    {
        detail::encode_octets(enc, addr.to_bytes(), form);
    }

    template<typename W>
    void encode_address(encoder<W> &enc, const boost::asio::ip::address_v6 &addr, const address_form form=default_address_form)
    {
        detail::encode_octets(enc, addr.to_bytes(), form);
    }

    template<typename W>
    void encode_address(encoder<W> &enc, const boost::asio::ip::address &addr, const address_form form=default_address_form)
    {
        enc.array(2);
        if (addr.is_v4()) {
            enc.u8(0);
            encode_address(enc, addr.to_v4(), form);
        } else {
            enc.u8(1);
            encode_address(enc, addr.to_v6(), form);
        }
    }

    template<typename W, typename P>
    void encode_endpoint(encoder<W> &enc, const boost::asio::ip::basic_endpoint<P> &ep, const address_form form=default_address_form)
    {
        enc.array(2);
        const auto addr = ep.address();
        if (addr.is_v4()) {
            enc.u8(0).array(2);
            encode_address(enc, addr.to_v4(), form);
        } else {
            enc.u8(1).array(2);
            encode_address(enc, addr.to_v6(), form);
        }
        enc.u16(ep.port());
    }

    template<>
    struct codec<boost::asio::ip::address_v4> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const boost::asio::ip::address_v4 &addr, C &)
        {
            encode_address(enc, addr);
        }

        template<typename C>
        static boost::asio::ip::address_v4 decode(decoder &dec, C &)
        {
            return boost::asio::ip::address_v4 { detail::decode_octets<4>(dec) };
        }
    };

    template<>
    struct codec<boost::asio::ip::address_v6> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const boost::asio::ip::address_v6 &addr, C &)
        {
            encode_address(enc, addr);
        }

        template<typename C>
        static boost::asio::ip::address_v6 decode(decoder &dec, C &)
        {
            return boost::asio::ip::address_v6 { detail::decode_octets<16>(dec) };
        }
    };

    template<>
    struct codec<boost::asio::ip::address> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const boost::asio::ip::address &addr, C &)
        {
            encode_address(enc, addr);
        }

        template<typename C>
        static boost::asio::ip::address decode(decoder &dec, C &ctx)
        {
            const auto hdr = detail::decode_variant(dec);
            boost::asio::ip::address addr {};
            if (hdr.index == 0)
                addr = codec<boost::asio::ip::address_v4>::decode(dec, ctx);
            else
                addr = codec<boost::asio::ip::address_v6>::decode(dec, ctx);
            if (hdr.indefinite)
                detail::expect_break(dec);
            return addr;
        }
    };

    template<typename P>
    struct codec<boost::asio::ip::basic_endpoint<P>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const boost::asio::ip::basic_endpoint<P> &ep, C &)
        {
            encode_endpoint(enc, ep);
        }

        template<typename C>
        static boost::asio::ip::basic_endpoint<P> decode(decoder &dec, C &ctx)
        {
            const auto hdr = detail::decode_variant(dec);
            const auto sz = detail::fixed_array(dec, 2);
            boost::asio::ip::address addr {};
            if (hdr.index == 0)
                addr = codec<boost::asio::ip::address_v4>::decode(dec, ctx);
            else
                addr = codec<boost::asio::ip::address_v6>::decode(dec, ctx);
            const auto port = dec.u16();
            if (!sz)
                detail::expect_break(dec);
            if (hdr.indefinite)
                detail::expect_break(dec);
            return { addr, port };
        }
    };
}

#endif // !TESSERA_CBOR_NET_HPP
