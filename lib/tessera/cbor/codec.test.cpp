/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/common/test.hpp>
#include <tessera/cbor/codec.hpp>

using namespace std::literals;
using namespace tessera;
using namespace tessera::cbor;

namespace {
    // a record encoded as a map with integer keys; the note is omitted when it is nil
    struct peer_record {
        std::string name {};
        uint16_t port = 0;
        std::optional<std::string> note {};

        bool operator==(const peer_record &o) const =default;

        template<typename W, typename C>
        void to_cbor(encoder<W> &enc, C &ctx) const
        {
            using note_codec = codec<std::optional<std::string>>;
            const auto has_note = !note_codec::is_nil(note);
            enc.map(has_note ? 3 : 2);
            enc.u8(0).encode(name, ctx);
            enc.u8(1).encode(port, ctx);
            if (has_note)
                enc.u8(2).encode(note, ctx);
        }

        template<typename C>
        static peer_record from_cbor(decoder &dec, C &ctx)
        {
            using note_codec = codec<std::optional<std::string>>;
            const auto start = dec.position();
            std::optional<std::string> name {};
            std::optional<uint16_t> port {};
            std::optional<std::optional<std::string>> note {};
            cbor::detail::for_each_entry(dec, [&](decoder &d) {
                switch (d.u32()) {
                    case 0: name = codec<std::string>::decode(d, ctx); break;
                    case 1: port = codec<uint16_t>::decode(d, ctx); break;
                    case 2: note = note_codec::decode(d, ctx); break;
                    default: d.skip(); break;
                }
            });
            if (!name) [[unlikely]]
                throw decode_error::missing_value(0).at(start);
            if (!port) [[unlikely]]
                throw decode_error::missing_value(1).at(start);
            return { std::move(*name), *port, note ? std::move(*note) : note_codec::nil() };
        }
    };

    // multiplies every encoded value by the factor of the context
    struct scale_ctx {
        uint64_t factor = 1;
        size_t calls = 0;
    };

    struct scaled {
        uint64_t val = 0;

        template<typename W>
        void to_cbor(encoder<W> &enc, scale_ctx &ctx) const
        {
            ++ctx.calls;
            enc.u64(val * ctx.factor);
        }

        static scaled from_cbor(decoder &dec, scale_ctx &ctx)
        {
            ++ctx.calls;
            return { dec.u64() / ctx.factor };
        }
    };

    template<typename T>
    decode_error catch_decode(const std::string_view hex)
    {
        const auto bytes = uint8_vector::from_hex(hex);
        return catch_error<decode_error>([&] { decode<T>(bytes); });
    }
}

namespace fmt {
    template<>
    struct formatter<peer_record>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "peer({}, {}, {})", v.name, v.port, v.note);
        }
    };
}

suite cbor_codec_suite = [] {
    "cbor::codec"_test = [] {
        "concepts"_test = [] {
            static_assert(decodable<uint64_t>);
            static_assert(encodable<std::vector<std::string>>);
            static_assert(decodable<peer_record>);
            static_assert(encodable<peer_record>);
            static_assert(decodable<scaled, scale_ctx>);
            static_assert(!decodable<scaled>);
            static_assert(nillable<std::optional<int>>);
            static_assert(!nillable<int>);
        };
        "scalars"_test = [] {
            test_hex("f5", to_vector(true));
            test_same(true, decode<bool>(uint8_vector::from_hex("f5")));
            test_hex("3903e7", to_vector(int16_t { -1000 }));
            test_same(-1000, decode<int16_t>(uint8_vector::from_hex("3903e7")));
            test_same(-1000, decode<int64_t>(uint8_vector::from_hex("3903e7")));
            test_hex("1818", to_vector(uint32_t { 24 }));
            test_same(24, decode<uint8_t>(uint8_vector::from_hex("1818")));
            test_hex("fa3fc00000", to_vector(1.5F));
            test_same(1.5, decode<double>(uint8_vector::from_hex("f93e00")));
            test_same(-2.0F, decode<float>(uint8_vector::from_hex("f9c000")));
            test_hex("3bffffffffffffffff", to_vector(integer::from_raw(true, std::numeric_limits<uint64_t>::max())));
            test_same(integer { -5 }, decode<integer>(uint8_vector::from_hex("24")));
            test_hex("1861", to_vector(U'a'));
            test_same(0x61U, static_cast<uint32_t>(decode<char32_t>(uint8_vector::from_hex("1861"))));
            test_same(error_kind::overflow, catch_decode<int8_t>("3903e7").kind());
            test_same(error_kind::type_mismatch, catch_decode<uint64_t>("20").kind());
        };
        "strings"_test = [] {
            test_hex("6449455446", to_vector("IETF"sv));
            test_hex("6449455446", to_vector("IETF"s));
            const auto text = uint8_vector::from_hex("6449455446");
            test_same("IETF"sv, decode<std::string_view>(text));
            test_same("hi!"s, decode<std::string>(uint8_vector::from_hex("7f626869" "6121" "ff")));
            test_same(error_kind::type_mismatch, catch_decode<std::string_view>("7f626869ff").kind());
            test_hex("43010203", to_vector(uint8_vector::from_hex("010203")));
            test_same(uint8_vector::from_hex("010203"), decode<uint8_vector>(uint8_vector::from_hex("5f" "4101" "420203" "ff")));
            test_hex("0102", decode<buffer>(uint8_vector::from_hex("420102")));
        };
        "fixed-size collections"_test = [] {
            test_same(byte_array<4>::from_hex("01020304"), decode<byte_array<4>>(uint8_vector::from_hex("4401020304")));
            test_same(error_kind::message, catch_decode<byte_array<4>>("43010203").kind());
            test_hex("820102", to_vector(std::array<uint16_t, 2> { 1, 2 }));
            const auto arr = decode<std::array<uint16_t, 2>>(uint8_vector::from_hex("9f0102ff"));
            test_same(1, arr[0]);
            test_same(2, arr[1]);
            test_same(error_kind::message, catch_decode<std::array<uint16_t, 2>>("83010203").kind());
            test_same(error_kind::message, catch_decode<std::array<uint16_t, 2>>("8101").kind());
        };
        "optional"_test = [] {
            test_hex("f6", to_vector(std::optional<uint64_t> {}));
            test_hex("05", to_vector(std::optional<uint64_t> { 5 }));
            expect(!decode<std::optional<uint64_t>>(uint8_vector::from_hex("f6")));
            test_same(std::optional<uint64_t> { 5 }, decode<std::optional<uint64_t>>(uint8_vector::from_hex("05")));
            test_same(error_kind::type_mismatch, catch_decode<std::optional<uint64_t>>("f7").kind());
        };
        "pair and tuple"_test = [] {
            const std::pair<uint64_t, std::string> p { 1, "a" };
            test_hex("82016161", to_vector(p));
            test_same(true, p == decode<std::pair<uint64_t, std::string>>(uint8_vector::from_hex("82016161")));
            test_same(true, p == decode<std::pair<uint64_t, std::string>>(uint8_vector::from_hex("9f016161ff")));
            test_same(error_kind::message, catch_decode<std::pair<uint64_t, std::string>>("8301616102").kind());
            {
                const auto ex = catch_decode<std::pair<uint64_t, std::string>>("9f01616102");
                test_same(error_kind::type_mismatch, ex.kind());
                test_same(std::optional<size_t> { 4 }, ex.position());
            }
            const std::tuple<uint8_t, bool, std::string> t { 7, true, "hi" };
            test_hex("8307f5626869", to_vector(t));
            test_same(t, decode<std::tuple<uint8_t, bool, std::string>>(uint8_vector::from_hex("8307f5626869")));
            test_same(t, decode<std::tuple<uint8_t, bool, std::string>>(uint8_vector::from_hex("9f07f5626869ff")));
        };
        "duration"_test = [] {
            test_hex("a20001011a1dcd6500", to_vector(std::chrono::milliseconds { 1500 }));
            test_hex("a20021011a1dcd6500", to_vector(std::chrono::milliseconds { -1500 }));
            test_same(-1500, decode<std::chrono::milliseconds>(uint8_vector::from_hex("a20021011a1dcd6500")).count());
            test_same(1, decode<std::chrono::seconds>(uint8_vector::from_hex("a3000101000283010203")).count());
            test_same(1, decode<std::chrono::seconds>(uint8_vector::from_hex("bf00010100ff")).count());
            test_same(error_kind::missing_value, catch_decode<std::chrono::seconds>("a10001").kind());
            test_same(error_kind::missing_value, catch_decode<std::chrono::seconds>("a10100").kind());
            test_same(error_kind::overflow, catch_decode<std::chrono::seconds>("a20000011a3b9aca00").kind());
        };
        "duration beyond the target range"_test = [] {
            // 10^10 seconds fits seconds but not nanoseconds
            test_same(10'000'000'000, decode<std::chrono::seconds>(uint8_vector::from_hex("a2001b00000002540be4000100")).count());
            test_same(error_kind::overflow, catch_decode<std::chrono::nanoseconds>("a2001b00000002540be4000100").kind());
            test_same(std::numeric_limits<int64_t>::min(), decode<std::chrono::seconds>(uint8_vector::from_hex("a2003b7fffffffffffffff0100")).count());
            test_same(error_kind::overflow, catch_decode<std::chrono::nanoseconds>("a2003b7fffffffffffffff0100").kind());
            test_same(error_kind::overflow, catch_decode<std::chrono::milliseconds>("a2003b7fffffffffffffff0100").kind());
            // the largest whole second of nanoseconds plus a fraction that crosses the maximum
            const auto max_secs = std::chrono::floor<std::chrono::seconds>(std::chrono::nanoseconds::max()).count();
            test_same(max_secs, std::chrono::floor<std::chrono::seconds>(decode<std::chrono::nanoseconds>(to_vector(std::chrono::seconds { max_secs }))).count());
            const auto ex = catch_decode<std::chrono::nanoseconds>("a2001b0000000225c17d04011a3b9ac9ff");
            test_same(error_kind::overflow, ex.kind());
            test_same(std::optional<size_t> { 0 }, ex.position());
        };
        "tagged"_test = [] {
            using epoch_time = tagged<1, uint32_t>;
            test_hex("c11a514b67b0", to_vector(epoch_time { 1363896240 }));
            test_same(1363896240, decode<epoch_time>(uint8_vector::from_hex("c11a514b67b0")).value);
            const auto ex = catch_decode<epoch_time>("c200");
            test_same(error_kind::message, ex.kind());
            test_same(std::string { "expected tag 1 but got 2" }, ex.detail());
        };
        "vector"_test = [] {
            const std::vector<int32_t> v { 1, -1, -1000 };
            test_hex("8301203903e7", to_vector(v));
            test_same(true, v == decode<std::vector<int32_t>>(uint8_vector::from_hex("8301203903e7")));
            test_same(true, v == decode<std::vector<int32_t>>(uint8_vector::from_hex("9f01203903e7ff")));
            test_same(0, decode<std::vector<int32_t>>(uint8_vector::from_hex("80")).size());
            {
                // the declared length is not trusted for preallocation
                const auto ex = catch_decode<std::vector<int32_t>>("9bffffffffffffffff01");
                test_same(error_kind::end_of_input, ex.kind());
                test_same(std::optional<size_t> { 10 }, ex.position());
            }
            const std::vector<std::vector<uint8_t>> nested { { 1 }, {}, { 2, 3 } };
            test_same(true, nested == decode<std::vector<std::vector<uint8_t>>>(to_vector(nested)));
        };
        "map"_test = [] {
            const std::map<std::string, uint64_t> m { { "a", 1 }, { "b", 2 } };
            test_hex("a2616101616202", to_vector(m));
            test_same(true, m == decode<std::map<std::string, uint64_t>>(uint8_vector::from_hex("a2616101616202")));
            test_same(true, m == decode<std::map<std::string, uint64_t>>(uint8_vector::from_hex("bf616101616202ff")));
            const auto last_wins = decode<std::map<uint64_t, uint64_t>>(uint8_vector::from_hex("a201020103"));
            test_same(1, last_wins.size());
            test_same(3, last_wins.at(1));
        };
        "user record"_test = [] {
            const peer_record full { "relay", 3001, "primary" };
            const auto full_bytes = to_vector(full);
            test_hex("a3006572656c617901190bb902677072696d617279", full_bytes);
            test_same(full, decode<peer_record>(full_bytes));
            test_same(full_bytes.size(), encoded_size(full));

            const peer_record bare { "relay", 3001 };
            const auto bare_bytes = to_vector(bare);
            test_hex("a2006572656c617901190bb9", bare_bytes);
            test_same(bare, decode<peer_record>(bare_bytes));
            // an explicit null is accepted in place of an omitted note
            test_same(bare, decode<peer_record>(uint8_vector::from_hex("a3006572656c617901190bb902f6")));
            // unknown keys are skipped
            test_same(bare, decode<peer_record>(uint8_vector::from_hex("a3006572656c617909820102" "01190bb9")));

            const auto ex = catch_decode<peer_record>("a1006572656c6179");
            test_same(error_kind::missing_value, ex.kind());
            test_same(std::string { "missing value at index 1" }, ex.detail());
            test_same(error_kind::overflow, catch_decode<peer_record>("a2006572656c6179011a00010000").kind());
        };
        "context is threaded through nested calls"_test = [] {
            const std::vector<scaled> vals { { 1 }, { 2 } };
            scale_ctx ctx { 10 };
            vector_writer w {};
            encode_with(vals, w, ctx);
            test_hex("820a14", w.bytes());
            test_same(2, ctx.calls);
            const auto decoded = decode_with<std::vector<scaled>>(w.bytes(), ctx);
            test_same(4, ctx.calls);
            test_same(2, decoded.size());
            test_same(2, decoded.at(1).val);
        };
        "encoded_size"_test = [] {
            const std::vector<std::string> v { "a", "bc", std::string(30, 'x') };
            test_same(to_vector(v).size(), encoded_size(v));
            test_same(9, encoded_size(std::numeric_limits<uint64_t>::max()));
        };
    };
};
