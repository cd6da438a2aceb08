#include "MultichannelConverter.hpp"
#include "BoxArguments.hpp"
#include "../ConversionErrors.hpp"
#include <cmath>

static constexpr float kGainLagSeconds = 0.1f;

static int channelCount(const ObjectKind &kind) {
    int n = BoxArguments::intAt(kind, 0, "channels", 2);
    if (n < 1) throw ConversionError::invalidParameter("channels", float(n));
    return n;
}

// Explicit channel arguments, else one channel per connection
static std::vector<SCValue> busChannels(const ObjectKind &kind, int connections) {
    std::vector<int> channels = BoxArguments::channelList(kind);
    if (channels.empty()) {
        if (connections < 1) throw ConversionError::missingAttribute("channels");
        for (int i = 0; i < connections; i++) channels.push_back(i);
    }
    return std::vector<SCValue>(channels.begin(), channels.end());
}

std::optional<SCObject> MultichannelConverter::convert(const ObjectKind &kind, const PatchBox &box) {
    if (kind.name == "mc.pack~") return convertPack(kind);
    if (kind.name == "mc.unpack~") return convertUnpack(kind);
    if (kind.name == "mc.dac~") return convertDac(kind, box.numInlets);
    if (kind.name == "mc.adc~") return convertAdc(kind, box.numOutlets);
    if (kind.name == "mc.live.gain~") return convertLiveGain(kind);
    return std::nullopt;
}

SCObject MultichannelConverter::convertPack(const ObjectKind &kind) {
    int n = channelCount(kind);
    return SCObject("Array")
        .prop("channels", n)
        .prop("comment", "mc.pack~ " + std::to_string(n) + " channels");
}

SCObject MultichannelConverter::convertUnpack(const ObjectKind &kind) {
    int n = channelCount(kind);
    return SCObject("ArrayIndex")
        .prop("channels", n)
        .prop("comment", "mc.unpack~ " + std::to_string(n) + " channels");
}

SCObject MultichannelConverter::convertDac(const ObjectKind &kind, int numInlets) {
    return SCObject("Out")
        .withMethod("ar")
        .arg(busChannels(kind, numInlets))
        .arg(SCValue::symbol("input"));
}

SCObject MultichannelConverter::convertAdc(const ObjectKind &kind, int numOutlets) {
    return SCObject("In")
        .withMethod("ar")
        .arg(busChannels(kind, numOutlets));
}

float MultichannelConverter::dbToLinear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

SCObject MultichannelConverter::convertLiveGain(const ObjectKind &kind) {
    float db = BoxArguments::floatAt(kind, 0, 0.0f);
    if (!std::isfinite(db)) throw ConversionError::invalidParameter("gain", db);

    return SCObject("*")
        .arg(SCValue::symbol("input"))
        .arg(dbToLinear(db))
        .prop("lag", kGainLagSeconds)
        .prop("comment", "mc.live.gain~");
}
