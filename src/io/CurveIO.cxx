#include "CurveIO.hxx"
#include "Log.hxx"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
}

static float parseFloat(const std::string& tok) {
    std::size_t used = 0;
    float v = 0.0f;
    try {
        v = std::stof(tok, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("PCV: invalid number '" + tok + "'");
    }
    if (used != tok.size()) throw std::runtime_error("PCV: invalid number '" + tok + "'");
    return v;
}

static void appendFloatLE(std::vector<std::uint8_t>& out, float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<std::uint8_t>(u >> shift));
}

static float readFloatLE(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    std::uint32_t u = 0;
    for (int k = 0; k < 4; ++k) u |= static_cast<std::uint32_t>(bytes[offset + k]) << (8 * k);
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

static std::vector<std::uint8_t> toBytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

const std::uint8_t kCollectionMagic[4] = {'P', 'C', 'S', 1};

// Everything a PCV text buffer may contain.
struct Document {
    std::vector<BreakpointCurve<>> breakpoints;
    std::vector<FixedStepCurve<>> fixedSteps;
    std::vector<CurveCollection<>> collections;
};

static BreakpointCurve<> finishBreakpointOrThrow(const std::vector<CurvePoint>& points) {
    try {
        return BreakpointCurve<>(points);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("PCV: invalid breakpoint curve: ") + e.what());
    }
}

static FixedStepCurve<> finishFixedStepOrThrow(bool haveStep, float step, bool haveOrigin, float origin,
                                               const std::vector<float>& samples) {
    if (!haveStep || !haveOrigin) throw std::runtime_error("PCV: fixedstep requires step and origin");
    try {
        return FixedStepCurve<>(step, origin, samples);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("PCV: invalid fixed-step curve: ") + e.what());
    }
}

static void parseText(const std::vector<std::uint8_t>& bytes, Document& doc) {
    std::istringstream iss(std::string(bytes.begin(), bytes.end()));
    std::string line;
    std::vector<std::string> toks;
    enum class State { Idle, InBreakpoint, InFixedStep, InCollection };
    State st = State::Idle;

    std::vector<CurvePoint> points;
    std::vector<float> samples;
    float step = 0.0f, origin = 0.0f;
    bool haveStep = false, haveOrigin = false;

    bool inCollection = false;
    bool haveKey = false;
    float key = 0.0f;
    CurveCollection<> collection;

    while (std::getline(iss, line)) {
        auto hashPos = line.find('#');
        if (hashPos != std::string::npos) line = line.substr(0, hashPos);
        std::string t = trim(line);
        if (t.empty() || t[0] == '*') continue;

        splitTokens(t, toks);
        if (toks.empty()) continue;
        if (st == State::Idle || st == State::InCollection) {
            if (toks[0] == "breakpoint") {
                if (inCollection && !haveKey) throw std::runtime_error("PCV: collection curve without key");
                st = State::InBreakpoint;
                points.clear();
            } else if (toks[0] == "fixedstep") {
                if (inCollection) throw std::runtime_error("PCV: collections hold breakpoint curves only");
                st = State::InFixedStep;
                samples.clear();
                haveStep = haveOrigin = false;
                for (std::size_t i = 1; i + 1 < toks.size(); i += 2) {
                    if (toks[i] == "step") { step = parseFloat(toks[i+1]); haveStep = true; }
                    else if (toks[i] == "origin") { origin = parseFloat(toks[i+1]); haveOrigin = true; }
                    else throw std::runtime_error("PCV: unknown fixedstep attribute '" + toks[i] + "'");
                }
            } else if (toks[0] == "collection" && !inCollection) {
                inCollection = true;
                haveKey = false;
                collection = CurveCollection<>();
                st = State::InCollection;
            } else if (toks[0] == "key" && inCollection) {
                if (toks.size() < 2) throw std::runtime_error("PCV: key requires a value");
                if (haveKey) throw std::runtime_error("PCV: key without curve");
                key = parseFloat(toks[1]);
                haveKey = true;
            } else if (toks[0] == "endcollection" && inCollection) {
                if (haveKey) throw std::runtime_error("PCV: key without curve");
                doc.collections.push_back(std::move(collection));
                collection = CurveCollection<>();
                inCollection = false;
                st = State::Idle;
            } else {
                throw std::runtime_error("PCV: unexpected token '" + toks[0] + "'");
            }
        } else if (st == State::InBreakpoint) {
            if (toks[0] == "points") {
                if ((toks.size()-1) % 2 != 0) throw std::runtime_error("PCV: points requires pairs of x y");
                for (std::size_t i = 1; i+1 < toks.size(); i += 2) {
                    points.push_back(CurvePoint{parseFloat(toks[i]), parseFloat(toks[i+1])});
                }
            } else if (toks[0] == "endcurve") {
                BreakpointCurve<> c = finishBreakpointOrThrow(points);
                if (inCollection) {
                    try {
                        collection.addCurve(key, std::move(c));
                    } catch (const std::invalid_argument& e) {
                        throw std::runtime_error(std::string("PCV: ") + e.what());
                    }
                    haveKey = false;
                    st = State::InCollection;
                } else {
                    doc.breakpoints.push_back(std::move(c));
                    st = State::Idle;
                }
            } else {
                throw std::runtime_error("PCV: unknown token in breakpoint curve");
            }
        } else if (st == State::InFixedStep) {
            if (toks[0] == "samples") {
                for (std::size_t i = 1; i < toks.size(); ++i) samples.push_back(parseFloat(toks[i]));
            } else if (toks[0] == "endcurve") {
                doc.fixedSteps.push_back(finishFixedStepOrThrow(haveStep, step, haveOrigin, origin, samples));
                st = State::Idle;
            } else {
                throw std::runtime_error("PCV: unknown token in fixedstep curve");
            }
        }
    }
    if (st != State::Idle) throw std::runtime_error("PCV: unterminated block");
}

static void writePoints(std::ostream& os, const BreakpointCurve<>& c) {
    os << "breakpoint\npoints";
    for (const auto& p : c.valuesAsPairs()) os << ' ' << p[0] << ' ' << p[1];
    os << "\nendcurve\n";
}

static std::ostringstream textStream(const CurveIO::Options& opts) {
    std::ostringstream os;
    os << std::setprecision(opts.precision);
    os << "* PropCurves PCV text format v1\n";
    return os;
}

static void requireCompactRecord(const std::vector<std::uint8_t>& bytes, std::size_t offset, std::size_t len) {
    if (offset + len > bytes.size()) throw std::runtime_error("PCV compact: truncated record");
}

static BreakpointCurve<> decodeRecord(const std::vector<std::uint8_t>& bytes, std::size_t offset, std::size_t& consumed) {
    requireCompactRecord(bytes, offset, kCompactHeaderBytes);
    const std::size_t len = kCompactHeaderBytes + 2 * static_cast<std::size_t>(bytes[offset + 9]);
    requireCompactRecord(bytes, offset, len);
    consumed = len;
    std::vector<std::uint8_t> rec(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                  bytes.begin() + static_cast<std::ptrdiff_t>(offset + len));
    return BreakpointCurve<>::decode(rec);
}
}

namespace CurveIO {

std::vector<std::uint8_t> serialize(const std::vector<BreakpointCurve<>>& curves, const Options& opts) {
    if (opts.format == Format::Compact) {
        std::vector<std::uint8_t> out;
        for (const auto& c : curves) {
            const auto rec = c.encode();
            out.insert(out.end(), rec.begin(), rec.end());
        }
        return out;
    }
    std::ostringstream os = textStream(opts);
    for (const auto& c : curves) {
        writePoints(os, c);
        os << '\n';
    }
    return toBytes(os.str());
}

std::vector<std::uint8_t> serialize(const std::vector<FixedStepCurve<>>& curves, const Options& opts) {
    if (opts.format == Format::Compact) {
        throw std::invalid_argument("CurveIO: fixed-step curves have no compact form");
    }
    std::ostringstream os = textStream(opts);
    for (const auto& c : curves) {
        os << "fixedstep step " << c.step() << " origin " << c.origin() << "\nsamples";
        for (float y : c.valuesAsVectors().second) os << ' ' << y;
        os << "\nendcurve\n\n";
    }
    return toBytes(os.str());
}

std::vector<std::uint8_t> serialize(const std::vector<CurveCollection<>>& collections, const Options& opts) {
    if (opts.format == Format::Compact) {
        std::vector<std::uint8_t> out;
        for (const auto& set : collections) {
            if (set.size() > 255) throw std::length_error("CurveIO: compact collections hold at most 255 curves");
            out.insert(out.end(), std::begin(kCollectionMagic), std::end(kCollectionMagic));
            out.push_back(static_cast<std::uint8_t>(set.size()));
            for (const auto& e : set.entries()) {
                const auto rec = e.second.encode();
                appendFloatLE(out, e.first);
                out.push_back(static_cast<std::uint8_t>(rec.size() & 0xffu));
                out.push_back(static_cast<std::uint8_t>(rec.size() >> 8));
                out.insert(out.end(), rec.begin(), rec.end());
            }
        }
        return out;
    }
    std::ostringstream os = textStream(opts);
    for (const auto& set : collections) {
        os << "collection\n";
        for (const auto& e : set.entries()) {
            os << "key " << e.first << '\n';
            writePoints(os, e.second);
        }
        os << "endcollection\n\n";
    }
    return toBytes(os.str());
}

void deserialize(const std::vector<std::uint8_t>& bytes, std::vector<BreakpointCurve<>>& out, const Options& opts) {
    std::vector<BreakpointCurve<>> read;
    if (opts.format == Format::Compact) {
        std::size_t offset = 0;
        while (offset < bytes.size()) {
            std::size_t consumed = 0;
            read.push_back(decodeRecord(bytes, offset, consumed));
            offset += consumed;
        }
    } else {
        Document doc;
        parseText(bytes, doc);
        if (!doc.fixedSteps.empty() || !doc.collections.empty()) {
            throw std::runtime_error("PCV: expected only breakpoint curves");
        }
        read = std::move(doc.breakpoints);
    }
    out.insert(out.end(), std::make_move_iterator(read.begin()), std::make_move_iterator(read.end()));
}

void deserialize(const std::vector<std::uint8_t>& bytes, std::vector<FixedStepCurve<>>& out, const Options& opts) {
    if (opts.format == Format::Compact) {
        throw std::invalid_argument("CurveIO: fixed-step curves have no compact form");
    }
    Document doc;
    parseText(bytes, doc);
    if (!doc.breakpoints.empty() || !doc.collections.empty()) {
        throw std::runtime_error("PCV: expected only fixedstep curves");
    }
    out.insert(out.end(), std::make_move_iterator(doc.fixedSteps.begin()), std::make_move_iterator(doc.fixedSteps.end()));
}

void deserialize(const std::vector<std::uint8_t>& bytes, std::vector<CurveCollection<>>& out, const Options& opts) {
    std::vector<CurveCollection<>> read;
    if (opts.format == Format::Compact) {
        std::size_t offset = 0;
        while (offset < bytes.size()) {
            requireCompactRecord(bytes, offset, sizeof(kCollectionMagic) + 1);
            if (!std::equal(std::begin(kCollectionMagic), std::end(kCollectionMagic), bytes.begin() + static_cast<std::ptrdiff_t>(offset))) {
                throw std::runtime_error("PCV compact: bad collection header");
            }
            const std::size_t count = bytes[offset + sizeof(kCollectionMagic)];
            offset += sizeof(kCollectionMagic) + 1;
            CurveCollection<> set;
            for (std::size_t i = 0; i < count; ++i) {
                requireCompactRecord(bytes, offset, 6);
                const float key = readFloatLE(bytes, offset);
                const std::size_t len = static_cast<std::size_t>(bytes[offset + 4]) |
                                        (static_cast<std::size_t>(bytes[offset + 5]) << 8);
                offset += 6;
                requireCompactRecord(bytes, offset, len);
                std::size_t consumed = 0;
                BreakpointCurve<> c = decodeRecord(bytes, offset, consumed);
                if (consumed != len) throw std::runtime_error("PCV compact: curve length mismatch");
                set.addCurve(key, std::move(c));
                offset += len;
            }
            read.push_back(std::move(set));
        }
    } else {
        Document doc;
        parseText(bytes, doc);
        if (!doc.breakpoints.empty() || !doc.fixedSteps.empty()) {
            throw std::runtime_error("PCV: expected only collections");
        }
        read = std::move(doc.collections);
    }
    out.insert(out.end(), std::make_move_iterator(read.begin()), std::make_move_iterator(read.end()));
}

namespace {
template <class T>
bool writeFileImpl(const std::string& path, const std::vector<T>& values, const Options& opts,
                   std::string* errorMessage) {
    try {
        const std::vector<std::uint8_t> bytes = serialize(values, opts);
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) throw std::runtime_error("Could not open curve file for writing");
        ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!ofs) throw std::runtime_error("Could not write curve file");
        PROPCURVES_LOG_INFO("wrote %zu values (%zu bytes) to %s", values.size(), bytes.size(), path.c_str());
        return true;
    } catch (const std::exception& e) {
        PROPCURVES_LOG_WARN("%s: %s", path.c_str(), e.what());
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

template <class T>
bool readFileImpl(const std::string& path, std::vector<T>& out, const Options& opts,
                  std::string* errorMessage) {
    try {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) throw std::runtime_error("Could not open curve file for reading");
        const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        const std::size_t before = out.size();
        deserialize(bytes, out, opts);
        PROPCURVES_LOG_DEBUG("read %zu values from %s", out.size() - before, path.c_str());
        return true;
    } catch (const std::exception& e) {
        PROPCURVES_LOG_WARN("%s: %s", path.c_str(), e.what());
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}
}

bool writeFile(const std::string& path, const std::vector<BreakpointCurve<>>& curves,
               const Options& opts, std::string* errorMessage) {
    return writeFileImpl(path, curves, opts, errorMessage);
}

bool writeFile(const std::string& path, const std::vector<FixedStepCurve<>>& curves,
               const Options& opts, std::string* errorMessage) {
    return writeFileImpl(path, curves, opts, errorMessage);
}

bool writeFile(const std::string& path, const std::vector<CurveCollection<>>& collections,
               const Options& opts, std::string* errorMessage) {
    return writeFileImpl(path, collections, opts, errorMessage);
}

bool readFile(const std::string& path, std::vector<BreakpointCurve<>>& out,
              const Options& opts, std::string* errorMessage) {
    return readFileImpl(path, out, opts, errorMessage);
}

bool readFile(const std::string& path, std::vector<FixedStepCurve<>>& out,
              const Options& opts, std::string* errorMessage) {
    return readFileImpl(path, out, opts, errorMessage);
}

bool readFile(const std::string& path, std::vector<CurveCollection<>>& out,
              const Options& opts, std::string* errorMessage) {
    return readFileImpl(path, out, opts, errorMessage);
}

} // namespace CurveIO
