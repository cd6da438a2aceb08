#include "SpatialObjectAnalyzer.hpp"
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

// Known spat5 attributes and their accepted ranges
static const std::map<std::string, std::pair<float, float>> kAttributeRanges = {
    {"inputs",   {1.0f, 128.0f}},
    {"outputs",  {1.0f, 128.0f}},
    {"sources",  {1.0f, 128.0f}},
    {"speakers", {1.0f, 128.0f}},
    {"order",    {1.0f, 7.0f}},
    {"gain",     {-144.0f, 24.0f}},    // dB
    {"distance", {0.0f, 100.0f}}       // meters
};

static constexpr int kMaxOrder = 7;
static constexpr int kMaxSpeakers = 128;

// Non-negative integer token; digits past the long long range saturate
static std::optional<long long> parseCount(const std::string &token) {
    try {
        size_t used = 0;
        long long v = std::stoll(token, &used);
        if (used != token.size() || v < 0) return std::nullopt;
        return v;
    } catch (const std::out_of_range &) {
        if (token.empty() || token[0] == '-') return std::nullopt;
        return std::numeric_limits<long long>::max();
    } catch (const std::logic_error &) {
        return std::nullopt;
    }
}

static std::optional<float> parseNumber(const std::string &token) {
    try {
        size_t used = 0;
        float v = std::stof(token, &used);
        if (used != token.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error &) {
        return std::nullopt;
    }
}

// Positional count from the first argument, else the @attribute, else fallback.
// Counts above maxCount are clamped to it.
static int countArgument(const ObjectKind &kind, const std::vector<SpatialParameter> &params,
                         const std::string &attribute, int fallback, int maxCount) {
    std::optional<double> raw;
    if (!kind.args.empty()) {
        if (auto v = parseCount(kind.args[0])) raw = double(*v);
    }
    if (!raw) {
        for (const auto &p : params) {
            if (p.name == attribute) {
                raw = p.value;
                break;
            }
        }
    }
    if (!raw) return fallback;

    if (*raw > maxCount) {
        std::cerr << "[SpatialAnalyzer] Warning: " << kind.name << " " << attribute << " " << *raw
                  << " clamped to " << maxCount << "\n";
        return maxCount;
    }
    if (*raw < 0.0) return 0;
    return static_cast<int>(*raw);
}

std::vector<SpatialParameter> SpatialObjectAnalyzer::extractParameters(const ObjectKind &kind) {
    std::vector<SpatialParameter> params;

    for (size_t i = 0; i < kind.args.size(); i++) {
        const std::string &tok = kind.args[i];
        if (tok.size() < 2 || tok[0] != '@') continue;

        std::string name = tok.substr(1);
        auto range = kAttributeRanges.find(name);
        if (range == kAttributeRanges.end()) continue;
        if (i + 1 >= kind.args.size()) continue;

        auto value = parseNumber(kind.args[i + 1]);
        if (!value) continue;

        SpatialParameter p;
        p.name = name;
        p.value = *value;
        p.minValue = range->second.first;
        p.maxValue = range->second.second;
        if (!p.inRange()) {
            std::cerr << "[SpatialAnalyzer] Warning: " << kind.name << " @" << name << " "
                      << p.value << " outside [" << p.minValue << ", " << p.maxValue << "]\n";
        }
        params.push_back(p);
        i++;
    }
    return params;
}

bool SpatialObjectAnalyzer::analyzeBox(const PatchBox &box, SpatialObject &out) {
    if (!box.text) return false;

    ObjectKind kind = ObjectLexer::lex(box.maxclass, box.text);
    if (!isSpatFamily(kind)) return false;

    out = SpatialObject{};
    out.id = box.id;
    out.inputs = box.numInlets;
    out.outputs = box.numOutlets;
    out.parameters = extractParameters(kind);

    switch (kind.category) {
        case ObjectCategory::Panoramix:
            out.type = SpatialObjectType::panoramix();
            out.format = AudioFormat::multichannel(box.numOutlets);
            break;
        case ObjectCategory::HoaEncoder: {
            int order = countArgument(kind, out.parameters, "order", 1, kMaxOrder);
            out.type = SpatialObjectType::hoaEncoder(order);
            out.format = AudioFormat::ambisonic(order, 3);
            break;
        }
        case ObjectCategory::HoaDecoder: {
            int order = countArgument(kind, out.parameters, "order", 1, kMaxOrder);
            out.type = SpatialObjectType::hoaDecoder(order);
            out.format = AudioFormat::multichannel(box.numOutlets);
            break;
        }
        case ObjectCategory::Vbap: {
            int n = countArgument(kind, out.parameters, "speakers", 8, kMaxSpeakers);
            out.type = SpatialObjectType::vbap(n);
            out.format = AudioFormat::multichannel(n);
            break;
        }
        default:
            // spat5.spat~, spat5.osc.route and every other spat5 object
            out.type = SpatialObjectType::generic(kind.name);
            out.format = AudioFormat::multichannel(box.numOutlets);
            break;
    }
    return true;
}

std::vector<SpatialObject> SpatialObjectAnalyzer::analyzeSpatialObjects(const PatchData &patch, bool verbose) {
    std::vector<SpatialObject> objects;

    for (const auto &box : patch.boxes) {
        SpatialObject obj;
        if (!analyzeBox(box, obj)) continue;

        if (verbose) {
            std::cout << "[SpatialAnalyzer]   " << obj.id << ": " << *box.text
                      << " (" << obj.format.channels << " ch)\n";
        }
        objects.push_back(std::move(obj));
    }
    return objects;
}
