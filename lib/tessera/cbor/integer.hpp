/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_INTEGER_HPP
#define TESSERA_CBOR_INTEGER_HPP

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <tessera/common/format.hpp>

namespace tessera::cbor {
    /*
     * A CBOR integer in the full wire range [-2^64, 2^64 - 1].
     * The magnitude is kept exactly as it appears on the wire: for a negative value the stored raw number is n
     * where the value is -1 - n.
     */
    struct integer {
        static constexpr integer from_raw(const bool negative, const uint64_t raw) noexcept
        {
            return integer { negative, raw };
        }

        constexpr integer() noexcept =default;

        template<std::unsigned_integral T>
        constexpr integer(const T val) noexcept:
            _raw { val }
        {
        }

        template<std::signed_integral T>
        constexpr integer(const T val) noexcept:
            _neg { val < 0 },
            _raw { val < 0 ? static_cast<uint64_t>(-1 - static_cast<int64_t>(val)) : static_cast<uint64_t>(val) }
        {
        }

        constexpr bool negative() const noexcept
        {
            return _neg;
        }

        constexpr uint64_t raw() const noexcept
        {
            return _raw;
        }

        constexpr std::optional<uint64_t> as_u64() const noexcept
        {
            if (_neg)
                return {};
            return _raw;
        }

        constexpr std::optional<int64_t> as_i64() const noexcept
        {
            if (_raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return {};
            const auto v = static_cast<int64_t>(_raw);
            return _neg ? -1 - v : v;
        }

        constexpr std::strong_ordering operator<=>(const integer &o) const noexcept
        {
            if (_neg != o._neg)
                return _neg ? std::strong_ordering::less : std::strong_ordering::greater;
            if (_neg)
                return o._raw <=> _raw;
            return _raw <=> o._raw;
        }

        constexpr bool operator==(const integer &o) const noexcept =default;
    private:
        bool _neg = false;
        uint64_t _raw = 0;

        constexpr integer(const bool neg, const uint64_t raw) noexcept:
            _neg { neg }, _raw { raw }
        {
        }
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::integer>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (!v.negative())
                return fmt::format_to(ctx.out(), "{}", v.raw());
            if (v.raw() == std::numeric_limits<uint64_t>::max())
                return fmt::format_to(ctx.out(), "-18446744073709551616");
            return fmt::format_to(ctx.out(), "-{}", v.raw() + 1);
        }
    };
}

#endif // !TESSERA_CBOR_INTEGER_HPP
