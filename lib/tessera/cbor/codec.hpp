/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_CODEC_HPP
#define TESSERA_CBOR_CODEC_HPP

/*
 * The Encode/Decode contract. A type T is encodable when codec<T>::encode(encoder<W> &, const T &, C &) exists
 * and decodable when codec<T>::decode(decoder &, C &) returns a T. The context C is an arbitrary caller-owned
 * value passed by reference to every nested call; cbor::unit is used when the caller has none.
 * Types either specialize codec<T> or provide the members
 *   template<typename W, typename C> void to_cbor(encoder<W> &, C &) const;
 *   template<typename C> static T from_cbor(decoder &, C &);
 * A codec may also declare its nil value with nil() and is_nil(const T &) so that record codecs can
 * omit a field that is nil when encoding and substitute nil() for a missing field when decoding.
 */

#include <array>
#include <chrono>
#include <concepts>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>
#include <tessera/config.hpp>
#if TESSERA_ALLOC
#   include <map>
#   include <string>
#   include <vector>
#endif
#include "decoder.hpp"
#include "encoder.hpp"

namespace tessera::cbor {
    template<typename T>
    struct codec {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const T &val, C &ctx)
            requires requires { val.to_cbor(enc, ctx); }
        {
            val.to_cbor(enc, ctx);
        }

        template<typename C>
        static T decode(decoder &dec, C &ctx)
            requires requires { { T::from_cbor(dec, ctx) } -> std::convertible_to<T>; }
        {
            return T::from_cbor(dec, ctx);
        }
    };

    template<typename T, typename C=unit>
    concept decodable = requires(decoder &dec, C &ctx) {
        { codec<T>::decode(dec, ctx) } -> std::convertible_to<T>;
    };

    template<typename T, typename W=size_writer, typename C=unit>
    concept encodable = requires(encoder<W> &enc, const T &val, C &ctx) {
        codec<T>::encode(enc, val, ctx);
    };

    template<typename T>
    concept nillable = requires(const T &val) {
        { codec<T>::nil() } -> std::convertible_to<T>;
        { codec<T>::is_nil(val) } -> std::same_as<bool>;
    };

    template<typename T>
    concept plain_integer = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>
        && !std::same_as<T, char8_t> && !std::same_as<T, char16_t> && !std::same_as<T, char32_t> && !std::same_as<T, wchar_t>;

    namespace detail {
        // a definite array header must declare exactly sz elements; an indefinite one is closed by expect_break
        inline std::optional<uint64_t> fixed_array(decoder &dec, const uint64_t sz)
        {
            const auto start = dec.position();
            const auto arr_sz = dec.array();
            if (arr_sz && *arr_sz != sz) [[unlikely]]
                throw decode_error::message(fmt::format("expected an array of {} elements but got {}", sz, *arr_sz)).at(start);
            return arr_sz;
        }

        inline void expect_break(decoder &dec)
        {
            const auto start = dec.position();
            if (dec.datatype() != data_type::brk) [[unlikely]]
                throw decode_error::type_mismatch(dec.datatype()).at(start).with_message("expected the end of an indefinite array");
            dec.set_position(start + 1);
        }

        // calls fn(key_decoder) once per map entry; fn must consume exactly one key and one value
        template<typename F>
        void for_each_entry(decoder &dec, const F &fn)
        {
            const auto sz = dec.map();
            for (uint64_t i = 0; !sz || i < *sz; ++i) {
                if (!sz && dec.datatype() == data_type::brk) {
                    dec.set_position(dec.position() + 1);
                    break;
                }
                fn(dec);
            }
        }
    }

    template<>
    struct codec<bool> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const bool val, C &)
        {
            enc.boolean(val);
        }

        template<typename C>
        static bool decode(decoder &dec, C &)
        {
            return dec.boolean();
        }
    };

    template<plain_integer T>
    struct codec<T> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const T val, C &)
        {
            if constexpr (std::is_signed_v<T>)
                enc.i64(val);
            else
                enc.u64(val);
        }

        template<typename C>
        static T decode(decoder &dec, C &)
        {
            if constexpr (std::is_signed_v<T>) {
                if constexpr (sizeof(T) == 1)
                    return dec.i8();
                else if constexpr (sizeof(T) == 2)
                    return dec.i16();
                else if constexpr (sizeof(T) == 4)
                    return dec.i32();
                else
                    return dec.i64();
            } else {
                if constexpr (sizeof(T) == 1)
                    return dec.u8();
                else if constexpr (sizeof(T) == 2)
                    return dec.u16();
                else if constexpr (sizeof(T) == 4)
                    return dec.u32();
                else
                    return dec.u64();
            }
        }
    };

    template<>
    struct codec<integer> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const integer &val, C &)
        {
            enc.integer(val);
        }

        template<typename C>
        static integer decode(decoder &dec, C &)
        {
            return dec.integer();
        }
    };

    template<>
    struct codec<float> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const float val, C &)
        {
            enc.f32(val);
        }

        template<typename C>
        static float decode(decoder &dec, C &)
        {
            return dec.f32();
        }
    };

    template<>
    struct codec<double> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const double val, C &)
        {
            enc.f64(val);
        }

        template<typename C>
        static double decode(decoder &dec, C &)
        {
            return dec.f64();
        }
    };

    template<>
    struct codec<char32_t> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const char32_t val, C &)
        {
            enc.character(val);
        }

        template<typename C>
        static char32_t decode(decoder &dec, C &)
        {
            return dec.character();
        }
    };

    // borrows from the decoder's input, only definite strings are accepted
    template<>
    struct codec<std::string_view> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::string_view val, C &)
        {
            enc.text(val);
        }

        template<typename C>
        static std::string_view decode(decoder &dec, C &)
        {
            return dec.text();
        }
    };

    // borrows from the decoder's input, only definite byte strings are accepted
    template<>
    struct codec<buffer> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const buffer val, C &)
        {
            enc.bytes(val);
        }

        template<typename C>
        static buffer decode(decoder &dec, C &)
        {
            return dec.bytes();
        }
    };

    template<size_t N>
    struct codec<byte_array<N>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const byte_array<N> &val, C &)
        {
            enc.bytes(val);
        }

        template<typename C>
        static byte_array<N> decode(decoder &dec, C &)
        {
            const auto start = dec.position();
            const auto bytes = dec.bytes();
            if (bytes.size() != N) [[unlikely]]
                throw decode_error::message(fmt::format("expected a byte string of {} bytes but got {}", N, bytes.size())).at(start);
            return byte_array<N> { bytes };
        }
    };

    template<typename T, size_t N>
    struct codec<std::array<T, N>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::array<T, N> &val, C &ctx)
        {
            enc.array(N);
            for (const auto &v: val)
                codec<T>::encode(enc, v, ctx);
        }

        template<typename C>
        static std::array<T, N> decode(decoder &dec, C &ctx)
        {
            const auto start = dec.position();
            auto it = dec.array_iter<T>(ctx);
            std::array<T, N> res {};
            size_t i = 0;
            while (auto v = it.next()) {
                if (i >= N) [[unlikely]]
                    throw decode_error::message(fmt::format("expected an array of {} elements but got more", N)).at(start);
                res[i++] = std::move(*v);
            }
            if (i != N) [[unlikely]]
                throw decode_error::message(fmt::format("expected an array of {} elements but got {}", N, i)).at(start);
            return res;
        }
    };

    template<typename T>
    struct codec<std::optional<T>> {
        static std::optional<T> nil() noexcept
        {
            return {};
        }

        static bool is_nil(const std::optional<T> &val) noexcept
        {
            return !val.has_value();
        }

        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::optional<T> &val, C &ctx)
        {
            if (val)
                codec<T>::encode(enc, *val, ctx);
            else
                enc.s_null();
        }

        template<typename C>
        static std::optional<T> decode(decoder &dec, C &ctx)
        {
            if (dec.datatype() == data_type::null) {
                dec.null();
                return {};
            }
            return codec<T>::decode(dec, ctx);
        }
    };

    template<typename A, typename B>
    struct codec<std::pair<A, B>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::pair<A, B> &val, C &ctx)
        {
            enc.array(2);
            codec<A>::encode(enc, val.first, ctx);
            codec<B>::encode(enc, val.second, ctx);
        }

        template<typename C>
        static std::pair<A, B> decode(decoder &dec, C &ctx)
        {
            const auto sz = detail::fixed_array(dec, 2);
            auto first = codec<A>::decode(dec, ctx);
            auto second = codec<B>::decode(dec, ctx);
            if (!sz)
                detail::expect_break(dec);
            return { std::move(first), std::move(second) };
        }
    };

    template<typename... Ts>
    struct codec<std::tuple<Ts...>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::tuple<Ts...> &val, C &ctx)
        {
            enc.array(sizeof...(Ts));
            std::apply([&](const auto &...v) {
                (codec<std::decay_t<decltype(v)>>::encode(enc, v, ctx), ...);
            }, val);
        }

        template<typename C>
        static std::tuple<Ts...> decode(decoder &dec, C &ctx)
        {
            const auto sz = detail::fixed_array(dec, sizeof...(Ts));
            // braced initialization decodes the elements from left to right
            std::tuple<Ts...> res { codec<Ts>::decode(dec, ctx)... };
            if (!sz)
                detail::expect_break(dec);
            return res;
        }
    };

    // a duration as the map {0: whole seconds, 1: nanoseconds in [0, 1e9)}
    template<typename Rep, typename Period>
    struct codec<std::chrono::duration<Rep, Period>> {
        using duration_type = std::chrono::duration<Rep, Period>;

        template<typename W, typename C>
        static void encode(encoder<W> &enc, const duration_type &val, C &)
        {
            const auto secs = std::chrono::floor<std::chrono::seconds>(val);
            const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(val - secs);
            enc.map(2)
                .u8(0).i64(secs.count())
                .u8(1).u32(static_cast<uint32_t>(nanos.count()));
        }

        template<typename C>
        static duration_type decode(decoder &dec, C &)
        {
            const auto start = dec.position();
            std::optional<int64_t> secs {};
            std::optional<uint32_t> nanos {};
            detail::for_each_entry(dec, [&](decoder &d) {
                switch (d.u32()) {
                    case 0: secs = d.i64(); break;
                    case 1: nanos = d.u32(); break;
                    default: d.skip(); break;
                }
            });
            if (!secs) [[unlikely]]
                throw decode_error::missing_value(0).at(start).with_message("duration seconds");
            if (!nanos) [[unlikely]]
                throw decode_error::missing_value(1).at(start).with_message("duration nanoseconds");
            if (*nanos >= 1'000'000'000) [[unlikely]]
                throw decode_error::overflow(*nanos).at(start).with_message("duration nanoseconds must be below one second");
            // the seconds are range-checked before any conversion multiplies them
            using wide_seconds = std::chrono::duration<long double>;
            const auto wide_secs = static_cast<long double>(*secs);
            const auto secs_mag = *secs < 0 ? 0 - static_cast<uint64_t>(*secs) : static_cast<uint64_t>(*secs);
            if (wide_secs > wide_seconds { duration_type::max() }.count() || wide_secs < wide_seconds { duration_type::min() }.count()) [[unlikely]]
                throw decode_error::overflow(secs_mag).at(start).with_message(fmt::format("duration of {} seconds does not fit the target type", *secs));
            const auto whole = std::chrono::duration_cast<duration_type>(std::chrono::seconds { *secs });
            const auto frac = std::chrono::duration_cast<duration_type>(std::chrono::nanoseconds { *nanos });
            if (whole > duration_type::max() - frac) [[unlikely]]
                throw decode_error::overflow(secs_mag).at(start).with_message(fmt::format("duration of {} seconds does not fit the target type", *secs));
            return whole + frac;
        }
    };

    // a value that must be preceded by the tag N
    template<uint64_t N, typename T>
    struct tagged {
        static constexpr uint64_t tag = N;
        T value {};

        bool operator==(const tagged &o) const =default;
    };

    template<uint64_t N, typename T>
    struct codec<tagged<N, T>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const tagged<N, T> &val, C &ctx)
        {
            enc.tag(N);
            codec<T>::encode(enc, val.value, ctx);
        }

        template<typename C>
        static tagged<N, T> decode(decoder &dec, C &ctx)
        {
            const auto start = dec.position();
            if (const auto id = dec.tag(); id != N) [[unlikely]]
                throw decode_error::message(fmt::format("expected tag {} but got {}", N, id)).at(start);
            return { codec<T>::decode(dec, ctx) };
        }
    };

#if TESSERA_ALLOC
    template<>
    struct codec<std::string> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::string &val, C &)
        {
            enc.text(val);
        }

        // accepts definite and indefinite strings
        template<typename C>
        static std::string decode(decoder &dec, C &)
        {
            std::string res {};
            for (const auto chunk: dec.text_iter())
                res += chunk;
            return res;
        }
    };

    template<>
    struct codec<uint8_vector> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const uint8_vector &val, C &)
        {
            enc.bytes(val);
        }

        // accepts definite and indefinite byte strings
        template<typename C>
        static uint8_vector decode(decoder &dec, C &)
        {
            uint8_vector res {};
            for (const auto chunk: dec.bytes_iter())
                res << chunk;
            return res;
        }
    };

    template<typename T, typename A>
    struct codec<std::vector<T, A>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::vector<T, A> &val, C &ctx)
        {
            enc.array(val.size());
            for (const auto &v: val)
                codec<T>::encode(enc, v, ctx);
        }

        template<typename C>
        static std::vector<T, A> decode(decoder &dec, C &ctx)
        {
            std::vector<T, A> res {};
            auto it = dec.array_iter<T>(ctx);
            if (const auto sz = it.size(); sz && *sz <= dec.input().size())
                res.reserve(*sz);
            while (auto v = it.next())
                res.emplace_back(std::move(*v));
            return res;
        }
    };

    template<typename K, typename V, typename L, typename A>
    struct codec<std::map<K, V, L, A>> {
        template<typename W, typename C>
        static void encode(encoder<W> &enc, const std::map<K, V, L, A> &val, C &ctx)
        {
            enc.map(val.size());
            for (const auto &[k, v]: val) {
                codec<K>::encode(enc, k, ctx);
                codec<V>::encode(enc, v, ctx);
            }
        }

        template<typename C>
        static std::map<K, V, L, A> decode(decoder &dec, C &ctx)
        {
            std::map<K, V, L, A> res {};
            auto it = dec.map_iter<K, V>(ctx);
            while (auto kv = it.next())
                res.insert_or_assign(std::move(kv->first), std::move(kv->second));
            return res;
        }
    };
#endif

    template<typename T, typename W, typename C>
    void encode_with(const T &val, W &w, C &ctx)
    {
        encoder<W> enc { w };
        codec<T>::encode(enc, val, ctx);
    }

    template<typename T, typename W>
    void encode(const T &val, W &w)
    {
        unit ctx {};
        encode_with(val, w, ctx);
    }

    template<typename T>
    size_t encoded_size(const T &val)
    {
        size_writer w {};
        encode(val, w);
        return w.size();
    }

#if TESSERA_ALLOC
    template<typename T>
    uint8_vector to_vector(const T &val)
    {
        vector_writer w {};
        encode(val, w);
        return w.take();
    }
#endif

    template<typename T, typename C>
    T decode_with(const buffer bytes, C &ctx)
    {
        decoder dec { bytes };
        return codec<T>::decode(dec, ctx);
    }

    template<typename T>
    T decode(const buffer bytes)
    {
        unit ctx {};
        return decode_with<T>(bytes, ctx);
    }
}

#endif // !TESSERA_CBOR_CODEC_HPP
