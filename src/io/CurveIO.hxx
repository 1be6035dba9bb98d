#ifndef PROPCURVES_CURVE_IO_HXX
#define PROPCURVES_CURVE_IO_HXX

#include "BreakpointCurve.hxx"
#include "CurveCollection.hxx"
#include "FixedStepCurve.hxx"

#include <cstdint>
#include <string>
#include <vector>

namespace CurveIO {

// Text is the self-describing PCV format below; Compact stores breakpoint
// curves in their quantized byte form (see BreakpointCurve::encode()).
enum class Format { Text, Compact };

struct Options {
    Format format = Format::Text;
    int precision = 9; // significant digits written in Text format
};

//
// PCV text format
// Lines starting with '*' are comments. Inline comments after '#' are ignored.
// Whitespace separated tokens. Blocks:
//    breakpoint
//    points <x0> <y0>  <x1> <y1> ...
//    endcurve
//
//    fixedstep step <s> origin <o>
//    samples <y0> <y1> ...
//    endcurve
//
//    collection
//    key <k0>
//    breakpoint ... endcurve
//    key <k1>
//    ...
//    endcollection
//
// Compact format
//    breakpoint curves: their encode() bytes, back to back
//    collections: 'P' 'C' 'S' 1, curve count (uint8), then per curve
//                 key (float32 LE), byte length (uint16 LE), encode() bytes
//    fixed-step curves have no compact form
//

// Serialize to a byte buffer. Throw std::invalid_argument / std::length_error
// when a value cannot be represented in the requested format.
std::vector<std::uint8_t> serialize(const std::vector<BreakpointCurve<>>& curves, const Options& opts = Options());
std::vector<std::uint8_t> serialize(const std::vector<FixedStepCurve<>>& curves, const Options& opts = Options());
std::vector<std::uint8_t> serialize(const std::vector<CurveCollection<>>& collections, const Options& opts = Options());

// Parse a buffer and append its values to `out`; nothing is appended on
// failure. Throw std::runtime_error on malformed input or on blocks of another
// curve type, std::invalid_argument when a compact record fails to decode.
void deserialize(const std::vector<std::uint8_t>& bytes, std::vector<BreakpointCurve<>>& out, const Options& opts = Options());
void deserialize(const std::vector<std::uint8_t>& bytes, std::vector<FixedStepCurve<>>& out, const Options& opts = Options());
void deserialize(const std::vector<std::uint8_t>& bytes, std::vector<CurveCollection<>>& out, const Options& opts = Options());

// File variants. Return true on success; on failure return false and fill
// errorMessage when given.
bool writeFile(const std::string& path, const std::vector<BreakpointCurve<>>& curves,
               const Options& opts = Options(), std::string* errorMessage = nullptr);
bool writeFile(const std::string& path, const std::vector<FixedStepCurve<>>& curves,
               const Options& opts = Options(), std::string* errorMessage = nullptr);
bool writeFile(const std::string& path, const std::vector<CurveCollection<>>& collections,
               const Options& opts = Options(), std::string* errorMessage = nullptr);

bool readFile(const std::string& path, std::vector<BreakpointCurve<>>& out,
              const Options& opts = Options(), std::string* errorMessage = nullptr);
bool readFile(const std::string& path, std::vector<FixedStepCurve<>>& out,
              const Options& opts = Options(), std::string* errorMessage = nullptr);
bool readFile(const std::string& path, std::vector<CurveCollection<>>& out,
              const Options& opts = Options(), std::string* errorMessage = nullptr);

} // namespace CurveIO

#endif // PROPCURVES_CURVE_IO_HXX
