// Implementation of the sample storage conversions
#include "Numeric.hxx"

#include <cmath>
#include <cstring>

namespace {
template <class Fixed, class Storage>
Fixed fixedFromFloat(float f) {
    // Negative values and NaN both land on zero
    if (!(f > 0.0f)) return Fixed::fromRaw(0);
    const float scaled = f * Fixed::kScale;
    const float top = static_cast<float>(std::numeric_limits<Storage>::max());
    if (scaled >= top) return Fixed::fromRaw(std::numeric_limits<Storage>::max());
    return Fixed::fromRaw(static_cast<Storage>(std::floor(scaled + 0.5f)));
}

static inline std::uint32_t floatBits(float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

static inline float bitsFloat(std::uint32_t u) {
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}
}

UFix8 NumericTraits<UFix8>::fromFloat(float f) {
    return fixedFromFloat<UFix8, std::uint8_t>(f);
}

UFix16 NumericTraits<UFix16>::fromFloat(float f) {
    return fixedFromFloat<UFix16, std::uint16_t>(f);
}

SignedByte NumericTraits<SignedByte>::fromFloat(float f) {
    if (std::isnan(f)) return 0;
    if (f >= 127.0f) return 127;
    if (f <= -128.0f) return -128;
    return static_cast<SignedByte>(f); // truncates toward zero
}

Half Half::fromFloat(float f) {
    const std::uint32_t x = floatBits(f);
    const std::uint32_t sign = (x >> 16) & 0x8000u;
    const std::uint32_t exp = (x >> 23) & 0xffu;
    std::uint32_t mant = x & 0x7fffffu;

    if (exp == 0xffu) {
        // Infinity stays infinity, NaN keeps a quiet payload bit
        const std::uint32_t nan = mant ? (0x200u | (mant >> 13)) : 0u;
        return fromBits(static_cast<std::uint16_t>(sign | 0x7c00u | nan));
    }

    const int e = static_cast<int>(exp) - 127 + 15;
    if (e >= 31) return fromBits(static_cast<std::uint16_t>(sign | 0x7c00u));

    if (e <= 0) {
        // Subnormal half (or underflow to signed zero)
        if (e < -10) return fromBits(static_cast<std::uint16_t>(sign));
        mant |= 0x800000u;
        const int shift = 14 - e;
        std::uint32_t halfMant = mant >> shift;
        const std::uint32_t rem = mant & ((1u << shift) - 1u);
        const std::uint32_t halfway = 1u << (shift - 1);
        if (rem > halfway || (rem == halfway && (halfMant & 1u))) ++halfMant;
        return fromBits(static_cast<std::uint16_t>(sign | halfMant));
    }

    std::uint32_t h = sign | (static_cast<std::uint32_t>(e) << 10) | (mant >> 13);
    const std::uint32_t rem = mant & 0x1fffu;
    // A carry out of the mantissa bumps the exponent, up to infinity
    if (rem > 0x1000u || (rem == 0x1000u && (h & 1u))) ++h;
    return fromBits(static_cast<std::uint16_t>(h));
}

float Half::toFloat() const {
    const std::uint32_t sign = static_cast<std::uint32_t>(bits_ & 0x8000u) << 16;
    const std::uint32_t exp = (bits_ >> 10) & 0x1fu;
    const std::uint32_t mant = bits_ & 0x3ffu;

    if (exp == 0) {
        const float mag = std::ldexp(static_cast<float>(mant), -24);
        return sign ? -mag : mag;
    }
    if (exp == 0x1fu) return bitsFloat(sign | 0x7f800000u | (mant << 13));
    return bitsFloat(sign | ((exp + 112u) << 23) | (mant << 13));
}
