// SpatialTypes.hpp - spatial analysis results shared by analyzers and converters
//
// SpatialObject   one recognized spat5 box and its signal format
// SpeakerArray    one classified speaker layout (from the speaker config file)
// SpatialConfig   everything above plus the processing method chosen for the run
//
// Built once per conversion run and read-only afterwards.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../ConversionTypes.hpp"

enum class SpatialObjectKind {
    Panoramix,
    HoaEncoder,
    HoaDecoder,
    Vbap,
    Generic
};

struct SpatialObjectType {
    SpatialObjectKind kind = SpatialObjectKind::Generic;
    int order = 0;              // HoaEncoder / HoaDecoder
    int numSpeakers = 0;        // Vbap
    std::string genericName;    // Generic: original object name

    static SpatialObjectType panoramix() { return {SpatialObjectKind::Panoramix, 0, 0, ""}; }
    static SpatialObjectType hoaEncoder(int order) { return {SpatialObjectKind::HoaEncoder, order, 0, ""}; }
    static SpatialObjectType hoaDecoder(int order) { return {SpatialObjectKind::HoaDecoder, order, 0, ""}; }
    static SpatialObjectType vbap(int n) { return {SpatialObjectKind::Vbap, 0, n, ""}; }
    static SpatialObjectType generic(const std::string &name) { return {SpatialObjectKind::Generic, 0, 0, name}; }

    bool isHoa() const {
        return kind == SpatialObjectKind::HoaEncoder || kind == SpatialObjectKind::HoaDecoder;
    }
};

// "@gain -6" style attribute pulled out of the box text
struct SpatialParameter {
    std::string name;
    float value = 0.0f;
    float minValue = 0.0f;
    float maxValue = 0.0f;

    bool inRange() const { return value >= minValue && value <= maxValue; }
};

struct SpatialObject {
    std::string id;
    SpatialObjectType type;
    int inputs  = 0;
    int outputs = 0;
    AudioFormat format;
    std::vector<SpatialParameter> parameters;
};

struct Speaker {
    int id = 0;
    SphericalCoord position;
    float delay = 0.0f;   // seconds
    float gain  = 0.0f;   // dB as read from config, linear where a converter says so
};

enum class SpeakerArrayKind {
    Ring,
    Wfs,
    Irregular
};

struct SpeakerArrayType {
    SpeakerArrayKind kind = SpeakerArrayKind::Irregular;
    float radius  = 0.0f;   // Ring
    float length  = 0.0f;   // Wfs
    float spacing = 0.0f;   // Wfs

    static SpeakerArrayType ring(float radius) { return {SpeakerArrayKind::Ring, radius, 0.0f, 0.0f}; }
    static SpeakerArrayType wfs(float length, float spacing) { return {SpeakerArrayKind::Wfs, 0.0f, length, spacing}; }
    static SpeakerArrayType irregular() { return {SpeakerArrayKind::Irregular, 0.0f, 0.0f, 0.0f}; }

    bool operator==(const SpeakerArrayType &o) const {
        return kind == o.kind && radius == o.radius && length == o.length && spacing == o.spacing;
    }
    bool operator!=(const SpeakerArrayType &o) const { return !(*this == o); }
};

struct WfsConfig {
    float prefilterCutoff = 0.0f;     // Hz
    bool distanceCompensation = false;
    bool amplitudeCorrection = false;
    float aliasingFrequency = 0.0f;   // Hz
};

struct SpeakerArray {
    std::string id;                   // array name, "bus N" when unnamed
    int busId = 0;
    std::string declaredFormat;       // label from the config file, informational only
    SpeakerArrayType type;
    std::vector<Speaker> speakers;
    std::optional<WfsConfig> wfsConfig;   // set only for Wfs arrays
};

enum class SpatialProcessingMethod {
    Stereo,
    Vbap,
    Hoa,
    Wfs
};

struct SpatialConfig {
    std::vector<SpatialObject> spatialObjects;
    std::vector<SpeakerArray> speakerArrays;
    SpatialProcessingMethod processingMethod = SpatialProcessingMethod::Stereo;
};

inline std::string processingMethodName(SpatialProcessingMethod m) {
    switch (m) {
        case SpatialProcessingMethod::Stereo: return "stereo";
        case SpatialProcessingMethod::Vbap:   return "vbap";
        case SpatialProcessingMethod::Hoa:    return "hoa";
        case SpatialProcessingMethod::Wfs:    return "wfs";
    }
    return "stereo";
}

inline std::string arrayKindName(SpeakerArrayKind k) {
    switch (k) {
        case SpeakerArrayKind::Ring:      return "ring";
        case SpeakerArrayKind::Wfs:       return "wfs";
        case SpeakerArrayKind::Irregular: return "irregular";
    }
    return "irregular";
}
