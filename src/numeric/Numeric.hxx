#ifndef PROPCURVES_NUMERIC_HXX
#define PROPCURVES_NUMERIC_HXX

#include <cstdint>
#include <limits>

// Sample storage types and their conversion to/from the canonical float.
//
// Curves store their x and y values in one of these types, but every
// interpolation is computed in float. NumericTraits<T> is the single
// conversion interface; it is specialised once per storage type.
// All conversions are total: narrow types saturate at their limits and
// NaN maps to zero (except for Half, which keeps NaN).

// Unsigned fixed-point fraction with FracBits fractional bits.
// UFixed<std::uint8_t, 7> holds [0, 255/128] in steps of 1/128.
template <class Storage, int FracBits>
class UFixed {
public:
    static_assert(std::numeric_limits<Storage>::is_integer && !std::numeric_limits<Storage>::is_signed,
                  "UFixed storage must be an unsigned integer");
    static_assert(FracBits > 0 && FracBits < std::numeric_limits<Storage>::digits,
                  "UFixed needs at least one integer bit");

    static constexpr float kScale = static_cast<float>(Storage(1) << FracBits);

    constexpr UFixed() = default;

    static constexpr UFixed fromRaw(Storage raw) {
        UFixed v;
        v.raw_ = raw;
        return v;
    }

    constexpr Storage raw() const { return raw_; }

    friend constexpr bool operator==(UFixed a, UFixed b) { return a.raw_ == b.raw_; }
    friend constexpr bool operator!=(UFixed a, UFixed b) { return a.raw_ != b.raw_; }
    friend constexpr bool operator<(UFixed a, UFixed b) { return a.raw_ < b.raw_; }
    friend constexpr bool operator<=(UFixed a, UFixed b) { return a.raw_ <= b.raw_; }
    friend constexpr bool operator>(UFixed a, UFixed b) { return a.raw_ > b.raw_; }
    friend constexpr bool operator>=(UFixed a, UFixed b) { return a.raw_ >= b.raw_; }

private:
    Storage raw_{0};
};

using UFix8 = UFixed<std::uint8_t, 7>;
using UFix16 = UFixed<std::uint16_t, 15>;

// IEEE 754 binary16. Only conversion and comparison are provided.
class Half {
public:
    constexpr Half() = default;

    static constexpr Half fromBits(std::uint16_t bits) {
        Half h;
        h.bits_ = bits;
        return h;
    }

    constexpr std::uint16_t bits() const { return bits_; }

    // Round to nearest even; overflow becomes infinity.
    static Half fromFloat(float f);
    float toFloat() const;

    friend bool operator==(Half a, Half b) { return a.toFloat() == b.toFloat(); }
    friend bool operator!=(Half a, Half b) { return !(a == b); }
    friend bool operator<(Half a, Half b) { return a.toFloat() < b.toFloat(); }
    friend bool operator<=(Half a, Half b) { return a.toFloat() <= b.toFloat(); }
    friend bool operator>(Half a, Half b) { return a.toFloat() > b.toFloat(); }
    friend bool operator>=(Half a, Half b) { return a.toFloat() >= b.toFloat(); }

private:
    std::uint16_t bits_{0};
};

using SignedByte = std::int8_t;

// Conversion interface. Specialisations below.
template <class T>
struct NumericTraits;

template <>
struct NumericTraits<float> {
    static float toFloat(float v) { return v; }
    static float fromFloat(float f) { return f; }
    static const char* name() { return "float"; }
};

template <>
struct NumericTraits<UFix8> {
    static float toFloat(UFix8 v) { return static_cast<float>(v.raw()) / UFix8::kScale; }
    static UFix8 fromFloat(float f);
    static const char* name() { return "ufix8"; }
};

template <>
struct NumericTraits<UFix16> {
    static float toFloat(UFix16 v) { return static_cast<float>(v.raw()) / UFix16::kScale; }
    static UFix16 fromFloat(float f);
    static const char* name() { return "ufix16"; }
};

template <>
struct NumericTraits<Half> {
    static float toFloat(Half v) { return v.toFloat(); }
    static Half fromFloat(float f) { return Half::fromFloat(f); }
    static const char* name() { return "half"; }
};

// Truncates toward zero and saturates, like a checked float-to-byte cast.
template <>
struct NumericTraits<SignedByte> {
    static float toFloat(SignedByte v) { return static_cast<float>(v); }
    static SignedByte fromFloat(float f);
    static const char* name() { return "i8"; }
};

template <class T>
inline float toFloat(T v) { return NumericTraits<T>::toFloat(v); }

template <class T>
inline T fromFloat(float f) { return NumericTraits<T>::fromFloat(f); }

#endif // PROPCURVES_NUMERIC_HXX
