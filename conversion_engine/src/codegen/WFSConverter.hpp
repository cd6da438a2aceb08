#pragma once

#include <vector>

#include "SCObject.hpp"
#include "../spatial/SpatialTypes.hpp"

// Per-speaker delay/gain source for generateWfsArray().
// Default: carry the values from the speaker records unchanged.
// useGeometry: recompute them for a virtual source at (sourceAzimuth, sourceDistance).
struct WfsGenerationOptions {
    bool useGeometry = false;
    float sourceAzimuth = 0.0f;        // degrees
    float sourceDistance = 0.0f;       // meters, <= 0 is a plane wave
    float referenceDistance = 1.0f;    // meters
    float temperatureCelsius = 20.0f;
};

class WFSConverter {
public:
    /// Array geometry + per-speaker delays and gains, by topology:
    ///   Wfs -> WFSArrayLinear, Ring -> WFSArrayCircular, Irregular -> WFSArrayIrregular
    /// Throws ConversionError::missingAttribute("speakers") for an empty array.
    static SCObject generateWfsArray(const SpeakerArray &array,
                                     const WfsGenerationOptions &options = WfsGenerationOptions{});

    static SCObject generatePrefilter(float cutoff);
    static SCObject generateFocusedSource(float sourceAzimuth, float sourceDistance, float focusDistance);
    static SCObject generatePlaneWave(float azimuth);
    static SCObject generateDistanceCompensation(float referenceDistance);

    // Delay (s) from a virtual source to a speaker, both placed on the
    // horizontal plane from azimuth/distance
    static float calculateSpeakerDelay(const SphericalCoord &speakerPos,
                                       float sourceAzimuth, float sourceDistance,
                                       float soundSpeed);

    // 1.0 for a plane wave (sourceDistance <= 0), otherwise
    // sqrt(ref / sourceDistance) * sqrt(ref / speakerDistance)
    static float calculateWfsAmplitude(const SphericalCoord &speakerPos,
                                       float sourceDistance, float referenceDistance);

private:
    static SCObject generateLinearArray(const SpeakerArray &array, const WfsConfig &cfg,
                                        std::vector<SCValue> delays, std::vector<SCValue> gains);
    static SCObject generateCircularArray(const SpeakerArray &array, const WfsConfig &cfg,
                                          std::vector<SCValue> delays, std::vector<SCValue> gains);
    static SCObject generateIrregularArray(const SpeakerArray &array, const WfsConfig &cfg,
                                           std::vector<SCValue> delays, std::vector<SCValue> gains);
};
