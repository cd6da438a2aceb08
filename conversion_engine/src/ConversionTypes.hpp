// ConversionTypes.hpp - shared value types and run options for spatBridge
//
// Angles are always DEGREES in these structs. The speaker geometry text
// format and the patch JSON both use degrees, only the math helpers in the
// converters switch to radians internally.

#pragma once

#include <limits>
#include <string>

struct SphericalCoord {
    float azimuth   = 0.0f;   // degrees, 0 = front
    float elevation = 0.0f;   // degrees, 0 = ear level
    float distance  = 0.0f;   // meters from listening point
};

// Signal format carried by a spatial object's outlets
enum class AudioFormatType {
    Mono,
    Stereo,
    Multichannel,
    Ambisonic
};

struct AudioFormat {
    AudioFormatType type = AudioFormatType::Mono;
    int channels  = 1;    // Multichannel(n): n. Ambisonic: derived from order/dimension
    int order     = 0;    // Ambisonic only
    int dimension = 0;    // Ambisonic only (2 or 3)

    static AudioFormat mono() { return {AudioFormatType::Mono, 1, 0, 0}; }
    static AudioFormat stereo() { return {AudioFormatType::Stereo, 2, 0, 0}; }
    static AudioFormat multichannel(int n) { return {AudioFormatType::Multichannel, n, 0, 0}; }
    static AudioFormat ambisonic(int order, int dimension) {
        long long o = order;
        long long ch = (dimension == 2) ? (2 * o + 1) : (o + 1) * (o + 1);
        if (ch > std::numeric_limits<int>::max()) ch = std::numeric_limits<int>::max();
        return {AudioFormatType::Ambisonic, int(ch), order, dimension};
    }
};

// Budget for the signal-chain search (see PathAnalyzer)
struct PathSearchLimits {
    int maxDepth  = 64;     // max edges per chain
    int maxChains = 1024;   // max (source, sink) chains reported per patch
};

// Conversion run options
// These are pass-through switches decided by the CLI. Absence of a flag
// means "run everything", so every default below enables its stage.
struct ConversionOptions {
    bool skipSpatial      = false;  // no spatial object analysis, no converters
    bool skipMultichannel = false;  // ignore speaker arrays (no WFS/VBAP layouts)
    bool generateOsc      = true;   // emit OSC responders
    bool simplified       = false;  // basic HOA decoder, 2D VBAP panner
    bool verbose          = false;  // per-node / per-chain logging

    PathSearchLimits pathLimits;

    float temperatureCelsius = 20.0f;   // speed of sound for WFS math
    std::string scVersion = "3.13";     // target engine version tag
};
