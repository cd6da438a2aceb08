#include "ObjectLexer.hpp"
#include <map>
#include <set>
#include <sstream>

static const std::string kSpatPrefix = "spat5";

// Interactive UI boxes: always control rate whatever their text says
static const std::set<std::string> kControlWidgets = {
    "flonum", "number", "slider", "dial", "toggle", "button", "kslider",
    "multislider", "rslider", "nslider", "umenu", "textbutton",
    "live.dial", "live.slider", "live.numbox", "live.toggle", "live.button"
};

static const std::map<std::string, ObjectCategory> kNamedObjects = {
    {"cycle~",  ObjectCategory::Oscillator},
    {"saw~",    ObjectCategory::Oscillator},
    {"phasor~", ObjectCategory::Oscillator},
    {"tri~",    ObjectCategory::Oscillator},
    {"rect~",   ObjectCategory::Oscillator},
    {"noise~",  ObjectCategory::Noise},
    {"pink~",   ObjectCategory::Noise},
    {"adc~",    ObjectCategory::AudioInput},
    {"ezadc~",  ObjectCategory::AudioInput},
    {"mc.adc~", ObjectCategory::AudioInput},
    {"dac~",    ObjectCategory::AudioOutput},
    {"ezdac~",  ObjectCategory::AudioOutput},
    {"mc.dac~", ObjectCategory::AudioOutput},
    {"spat5.panoramix~",   ObjectCategory::Panoramix},
    {"spat5.hoa.encoder~", ObjectCategory::HoaEncoder},
    {"spat5.hoa.decoder~", ObjectCategory::HoaDecoder},
    {"spat5.vbap~",        ObjectCategory::Vbap},
    {"spat5.spat~",        ObjectCategory::SpatRenderer},
    {"spat5.osc.route",    ObjectCategory::SpatOscRoute},
    {"pan~",  ObjectCategory::StereoPanner},
    {"pan2~", ObjectCategory::StereoPanner},
    {"pan4~", ObjectCategory::StereoPanner},
    {"pan8~", ObjectCategory::StereoPanner},
    {"line",   ObjectCategory::RampGenerator},
    {"line~",  ObjectCategory::RampGenerator},
    {"curve",  ObjectCategory::RampGenerator},
    {"curve~", ObjectCategory::RampGenerator}
};

static bool startsWith(const std::string &s, const std::string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> ObjectLexer::tokenize(const std::string &text) {
    std::vector<std::string> tokens;
    std::istringstream ss(text);
    std::string tok;
    while (ss >> tok) tokens.push_back(tok);
    return tokens;
}

ObjectKind ObjectLexer::lex(const std::string &maxclass, const std::optional<std::string> &text) {
    ObjectKind kind;
    kind.text = text.value_or("");

    if (kControlWidgets.count(maxclass)) {
        kind.category = ObjectCategory::ControlWidget;
        kind.name = maxclass;
        kind.args = tokenize(kind.text);
        return kind;
    }

    std::vector<std::string> tokens = tokenize(kind.text);
    if (tokens.empty()) {
        kind.category = ObjectCategory::Generic;
        kind.name = maxclass;
        return kind;
    }

    kind.name = tokens[0];
    kind.args.assign(tokens.begin() + 1, tokens.end());

    auto it = kNamedObjects.find(kind.name);
    if (it != kNamedObjects.end()) {
        kind.category = it->second;
    } else if (startsWith(kind.name, kSpatPrefix)) {
        kind.category = ObjectCategory::SpatGeneric;
    } else if (kind.name.back() == '~') {
        kind.category = ObjectCategory::SignalProcessor;
    } else {
        kind.category = ObjectCategory::Message;
    }
    return kind;
}

std::string ObjectLexer::categoryName(ObjectCategory category) {
    switch (category) {
        case ObjectCategory::ControlWidget:   return "control-widget";
        case ObjectCategory::Oscillator:      return "oscillator";
        case ObjectCategory::Noise:           return "noise";
        case ObjectCategory::AudioInput:      return "audio-input";
        case ObjectCategory::AudioOutput:     return "audio-output";
        case ObjectCategory::Panoramix:       return "panoramix";
        case ObjectCategory::HoaEncoder:      return "hoa-encoder";
        case ObjectCategory::HoaDecoder:      return "hoa-decoder";
        case ObjectCategory::Vbap:            return "vbap";
        case ObjectCategory::SpatRenderer:    return "spat-renderer";
        case ObjectCategory::SpatOscRoute:    return "spat-osc-route";
        case ObjectCategory::SpatGeneric:     return "spat-generic";
        case ObjectCategory::StereoPanner:    return "stereo-panner";
        case ObjectCategory::RampGenerator:   return "ramp";
        case ObjectCategory::SignalProcessor: return "signal";
        case ObjectCategory::Message:         return "message";
        case ObjectCategory::Generic:         return "generic";
    }
    return "generic";
}

bool isAudioBearing(const ObjectKind &kind) {
    if (kind.category == ObjectCategory::ControlWidget) return false;
    return kind.text.find('~') != std::string::npos || startsWith(kind.text, kSpatPrefix);
}

bool isSpatFamily(const ObjectKind &kind) {
    switch (kind.category) {
        case ObjectCategory::Panoramix:
        case ObjectCategory::HoaEncoder:
        case ObjectCategory::HoaDecoder:
        case ObjectCategory::Vbap:
        case ObjectCategory::SpatRenderer:
        case ObjectCategory::SpatOscRoute:
        case ObjectCategory::SpatGeneric:
            return true;
        default:
            return false;
    }
}

bool isSourceCategory(ObjectCategory category) {
    return category == ObjectCategory::Oscillator
        || category == ObjectCategory::Noise
        || category == ObjectCategory::AudioInput;
}

bool isSinkCategory(ObjectCategory category) {
    return category == ObjectCategory::AudioOutput
        || category == ObjectCategory::Panoramix
        || category == ObjectCategory::SpatRenderer;
}
