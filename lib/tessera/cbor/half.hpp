/* This file is part of Tessera project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_HALF_HPP
#define TESSERA_CBOR_HALF_HPP

#include <bit>
#include <cstdint>

namespace tessera::cbor {
    // IEEE 754 binary16 bits to a float; exact since every half value is representable as a float
    inline float half_to_float(const uint16_t h) noexcept
    {
        const uint32_t sign = static_cast<uint32_t>(h & 0x8000U) << 16;
        const uint32_t exp = (h >> 10) & 0x1FU;
        uint32_t frac = h & 0x3FFU;
        if (exp == 0) {
            if (frac == 0)
                return std::bit_cast<float>(sign);
            // subnormal: renormalize into the float's wider exponent range
            uint32_t e = 127 - 15 + 1;
            while ((frac & 0x400U) == 0) {
                frac <<= 1;
                --e;
            }
            frac &= 0x3FFU;
            return std::bit_cast<float>(sign | (e << 23) | (frac << 13));
        }
        if (exp == 0x1F)
            return std::bit_cast<float>(sign | 0x7F800000U | (frac << 13));
        return std::bit_cast<float>(sign | ((exp + 127 - 15) << 23) | (frac << 13));
    }

    // float to binary16 bits with round-to-nearest-even; out-of-range values become infinities
    inline uint16_t float_to_half(const float f) noexcept
    {
        const uint32_t x = std::bit_cast<uint32_t>(f);
        const uint16_t sign = static_cast<uint16_t>((x >> 16) & 0x8000U);
        const uint32_t exp = (x >> 23) & 0xFFU;
        const uint32_t frac = x & 0x7FFFFFU;
        if (exp == 0xFF) {
            if (frac == 0)
                return sign | 0x7C00U;
            // keep the NaN quiet and its top payload bits
            return sign | 0x7E00U | static_cast<uint16_t>(frac >> 13);
        }
        const int32_t half_exp = static_cast<int32_t>(exp) - 127 + 15;
        if (half_exp >= 0x1F)
            return sign | 0x7C00U;
        if (half_exp <= 0) {
            if (half_exp < -10)
                return sign;
            const uint32_t m = frac | 0x800000U;
            const uint32_t shift = static_cast<uint32_t>(14 - half_exp);
            uint32_t half_frac = m >> shift;
            const uint32_t rem = m & ((1U << shift) - 1);
            const uint32_t mid = 1U << (shift - 1);
            if (rem > mid || (rem == mid && (half_frac & 1U)))
                ++half_frac;
            return sign | static_cast<uint16_t>(half_frac);
        }
        uint32_t res = (static_cast<uint32_t>(half_exp) << 10) | (frac >> 13);
        const uint32_t rem = frac & 0x1FFFU;
        if (rem > 0x1000U || (rem == 0x1000U && (res & 1U)))
            ++res;
        // a carry out of the mantissa correctly bumps the exponent, possibly up to infinity
        return sign | static_cast<uint16_t>(res);
    }
}

#endif // !TESSERA_CBOR_HALF_HPP
