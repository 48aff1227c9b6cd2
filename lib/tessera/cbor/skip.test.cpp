/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/common/test.hpp>
#include <tessera/cbor/decoder.hpp>

using namespace tessera;
using namespace tessera::cbor;

namespace {
    // items that both skip implementations must consume completely
    const std::vector<std::string_view> whole_items {
        "00", "1bffffffffffffffff", "3bffffffffffffffff", "f5", "f6", "f7", "f0", "f8ff",
        "f93c00", "fa47c35000", "fb3ff199999999999a",
        "4401020304", "6449455446", "5f420102" "4103" "ff", "7f6161" "6162" "ff",
        "80", "83010203", "9f0102ff", "9f9f01ffff", "a0", "a201020304", "bf6161f5ff",
        "c11a514b67b0", "d818d81801",
        "a2" "01" "a10203" "04" "9fff"
    };

    template<typename F>
    decode_error catch_skip_error(decoder &dec, const F &f)
    {
        return catch_error<decode_error>([&] { f(dec); });
    }
}

suite cbor_skip_suite = [] {
    "cbor::decoder::skip"_test = [] {
        "consumes exactly one item"_test = [] {
            for (const auto hex: whole_items) {
                auto bytes = uint8_vector::from_hex(hex);
                const auto item_size = bytes.size();
                // a trailing item must stay untouched
                bytes.emplace_back(0x07);
                {
                    decoder dec { bytes };
                    dec.skip();
                    test_same(fmt::format("skip {}", hex), item_size, dec.position());
                    test_same(fmt::format("skip {} next", hex), 7, dec.u8());
                }
                {
                    decoder dec { bytes };
                    dec.limited_skip();
                    test_same(fmt::format("limited_skip {}", hex), item_size, dec.position());
                }
            }
        };
        "indefinite inside definite"_test = [] {
            const auto bytes = uint8_vector::from_hex("83" "01" "9f02ff" "03");
            decoder dec { bytes };
            dec.skip();
            test_same(6, dec.position());
            // the counter-based skip stops early on this shape
            decoder lim { bytes };
            lim.limited_skip();
            test_same(5, lim.position());
        };
        "deep nesting"_test = [] {
            uint8_vector bytes {};
            bytes.assign(10000, 0x81);
            bytes.emplace_back(0x00);
            decoder dec { bytes };
            dec.skip();
            test_same(bytes.size(), dec.position());
            decoder lim { bytes };
            lim.limited_skip();
            test_same(bytes.size(), lim.position());

            uint8_vector indef {};
            indef.assign(5000, 0x9f);
            indef.resize(10000, 0xff);
            decoder dec_indef { indef };
            dec_indef.skip();
            test_same(indef.size(), dec_indef.position());
        };
        "skips a sequence of items one at a time"_test = [] {
            const auto bytes = uint8_vector::from_hex("01" "820203" "6161" "f6");
            decoder dec { bytes };
            size_t cnt = 0;
            while (!dec.empty()) {
                dec.skip();
                ++cnt;
            }
            test_same(4, cnt);
        };
        "errors move the decoder to the end of input"_test = [] {
            struct bad_case {
                std::string_view hex;
                error_kind kind;
                size_t pos;
            };
            const std::vector<bad_case> cases {
                { "ff", error_kind::type_mismatch, 0 },
                { "82ff", error_kind::type_mismatch, 1 },
                { "8201", error_kind::end_of_input, 2 },
                { "1c", error_kind::type_mismatch, 0 },
                { "5f6161ff", error_kind::type_mismatch, 1 },
                { "826161" "61ff", error_kind::utf8, 3 },
                { "bbffffffffffffffff", error_kind::overflow, 0 },
                { "5bffffffffffffffff", error_kind::overflow, 0 },
                { "9fc1ff", error_kind::type_mismatch, 2 }
            };
            for (const auto &c: cases) {
                const auto bytes = uint8_vector::from_hex(c.hex);
                decoder dec { bytes };
                const auto ex = catch_skip_error(dec, [](auto &d) { d.skip(); });
                test_same(fmt::format("{} kind", c.hex), c.kind, ex.kind());
                test_same(fmt::format("{} position", c.hex), std::optional<size_t> { c.pos }, ex.position());
                test_same(fmt::format("{} terminated", c.hex), true, dec.empty());
            }
        };
        "a tag must not be followed by a break"_test = [] {
            for (const auto hex: { "9fc1ff", "9fc1c2ff", "c1ff", "bf01c1ff" }) {
                const auto bytes = uint8_vector::from_hex(hex);
                decoder dec { bytes };
                const auto ex = catch_skip_error(dec, [](auto &d) { d.skip(); });
                test_same(fmt::format("{} skip", hex), error_kind::type_mismatch, ex.kind());
                test_same(fmt::format("{} skip position", hex), std::optional<size_t> { bytes.size() - 1 }, ex.position());
                decoder lim_dec { bytes };
                const auto lim_ex = catch_skip_error(lim_dec, [](auto &d) { d.limited_skip(); });
                test_same(fmt::format("{} limited_skip", hex), error_kind::type_mismatch, lim_ex.kind());
                test_same(fmt::format("{} limited_skip position", hex), std::optional<size_t> { bytes.size() - 1 }, lim_ex.position());
            }
            // a tagged item inside an indefinite array is still fine
            const auto ok = uint8_vector::from_hex("9fc10102ff");
            decoder dec { ok };
            dec.skip();
            expect(dec.empty());
        };
        "limited_skip errors"_test = [] {
            const auto bytes = uint8_vector::from_hex("ff01");
            decoder dec { bytes };
            const auto ex = catch_skip_error(dec, [](auto &d) { d.limited_skip(); });
            test_same(error_kind::type_mismatch, ex.kind());
            expect(dec.empty());
            // a huge map length saturates and then runs out of input
            const auto huge = uint8_vector::from_hex("bbffffffffffffffff01");
            decoder huge_dec { huge };
            test_same(error_kind::end_of_input, catch_skip_error(huge_dec, [](auto &d) { d.limited_skip(); }).kind());
        };
    };
};
