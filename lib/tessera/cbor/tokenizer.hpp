/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_TOKENIZER_HPP
#define TESSERA_CBOR_TOKENIZER_HPP

#include <iterator>
#include <optional>
#include <variant>
#include "decoder.hpp"

namespace tessera::cbor {
    struct begin_array {
        std::optional<uint64_t> size {};
        bool operator==(const begin_array &) const noexcept =default;
    };

    struct begin_map {
        std::optional<uint64_t> size {};
        bool operator==(const begin_map &) const noexcept =default;
    };

    struct begin_bytes {
        bool operator==(const begin_bytes &) const noexcept =default;
    };

    struct begin_text {
        bool operator==(const begin_text &) const noexcept =default;
    };

    struct tag_token {
        uint64_t id = 0;
        bool operator==(const tag_token &) const noexcept =default;
    };

    struct break_token {
        bool operator==(const break_token &) const noexcept =default;
    };

    struct simple_token {
        uint8_t value = 0;
        bool operator==(const simple_token &) const noexcept =default;
    };

    struct null_token {
        bool operator==(const null_token &) const noexcept =default;
    };

    struct undefined_token {
        bool operator==(const undefined_token &) const noexcept =default;
    };

    // a half-precision float widened to float, kept apart from f32 values
    struct f16_token {
        float value = 0;
        bool operator==(const f16_token &) const noexcept =default;
    };

    using token = std::variant<bool, uint8_t, uint16_t, uint32_t, uint64_t, int8_t, int16_t, int32_t, int64_t, integer,
        f16_token, float, double, buffer, std::string_view,
        begin_array, begin_map, begin_bytes, begin_text, tag_token, break_token, simple_token, null_token, undefined_token>;

    /*
     * A schema-free pre-order walk over one or more CBOR items.
     * After a decode error the tokenizer moves to the end of its input and rethrows,
     * so the following call returns std::nullopt instead of failing at the same byte again.
     */
    struct tokenizer {
        struct iterator {
            using value_type = token;
            using difference_type = std::ptrdiff_t;

            const token &operator*() const noexcept
            {
                return *_parent->_cur;
            }

            iterator &operator++()
            {
                _parent->_cur = _parent->next();
                return *this;
            }

            void operator++(int)
            {
                ++*this;
            }

            bool operator==(std::default_sentinel_t) const noexcept
            {
                return !_parent->_cur;
            }

            tokenizer *_parent;
        };

        explicit tokenizer(const buffer bytes) noexcept:
            _dec { bytes }
        {
        }

        explicit tokenizer(const decoder &dec) noexcept:
            _dec { dec }
        {
        }

        std::optional<token> next();

        iterator begin()
        {
            _cur = next();
            return { this };
        }

        std::default_sentinel_t end() const noexcept
        {
            return {};
        }

        size_t position() const noexcept
        {
            return _dec.position();
        }
    private:
        cbor::decoder _dec;
        std::optional<token> _cur {};

        token _read();
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::token>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace tessera::cbor;
            return std::visit([&ctx](const auto &t) {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, bool>) {
                    return fmt::format_to(ctx.out(), "{}", t ? "true" : "false");
                } else if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, int8_t>) {
                    return fmt::format_to(ctx.out(), "{}", static_cast<int>(t));
                } else if constexpr (std::is_same_v<T, f16_token>) {
                    return fmt::format_to(ctx.out(), "{}_1", t.value);
                } else if constexpr (std::is_same_v<T, tessera::buffer>) {
                    return fmt::format_to(ctx.out(), "h'{}'", t);
                } else if constexpr (std::is_same_v<T, std::string_view>) {
                    return fmt::format_to(ctx.out(), "\"{}\"", t);
                } else if constexpr (std::is_same_v<T, begin_array>) {
                    return t.size ? fmt::format_to(ctx.out(), "A{}", *t.size) : fmt::format_to(ctx.out(), "[_");
                } else if constexpr (std::is_same_v<T, begin_map>) {
                    return t.size ? fmt::format_to(ctx.out(), "M{}", *t.size) : fmt::format_to(ctx.out(), "{{_");
                } else if constexpr (std::is_same_v<T, begin_bytes>) {
                    return fmt::format_to(ctx.out(), "(_ bytes");
                } else if constexpr (std::is_same_v<T, begin_text>) {
                    return fmt::format_to(ctx.out(), "(_ text");
                } else if constexpr (std::is_same_v<T, tag_token>) {
                    return fmt::format_to(ctx.out(), "T{}", t.id);
                } else if constexpr (std::is_same_v<T, break_token>) {
                    return fmt::format_to(ctx.out(), "]");
                } else if constexpr (std::is_same_v<T, simple_token>) {
                    return fmt::format_to(ctx.out(), "simple({})", static_cast<int>(t.value));
                } else if constexpr (std::is_same_v<T, null_token>) {
                    return fmt::format_to(ctx.out(), "null");
                } else if constexpr (std::is_same_v<T, undefined_token>) {
                    return fmt::format_to(ctx.out(), "undefined");
                } else {
                    return fmt::format_to(ctx.out(), "{}", t);
                }
            }, v);
        }
    };
}

#endif // !TESSERA_CBOR_TOKENIZER_HPP
