#pragma once

#include <vector>

#include "SpatialTypes.hpp"
#include "../SpeakerConfigLoader.hpp"

// Speed of sound in air (m/s) at the given temperature
inline float speedOfSound(float celsius) {
    return 343.0f + 0.6f * celsius;
}

// Topology heuristics for speaker layouts. Checked in priority order:
//   Wfs        >= 16 speakers, all elevations within 10 deg of the mean
//   Ring       >= 4 speakers, all distances within 0.5 m of the mean
//   Irregular  anything else
// A pure function of the speaker list, so reclassifying gives the same type.
class SpeakerArrayClassifier {
public:
    static SpeakerArrayType classifyArrayType(const std::vector<Speaker> &speakers);

    // Classify every parsed array. Wfs arrays also get a WfsConfig.
    static std::vector<SpeakerArray> classifySpeakerArrays(const std::vector<SpeakerArrayRecord> &records,
                                                           float temperatureCelsius = 20.0f,
                                                           bool verbose = false);

    // aliasing = c / (2 * spacing), prefilter cutoff at the aliasing frequency
    static WfsConfig deriveWfsConfig(const SpeakerArrayType &type, float temperatureCelsius = 20.0f);

    static float averageDistance(const std::vector<Speaker> &speakers);
    static float averageElevation(const std::vector<Speaker> &speakers);
    static float arrayLength(const std::vector<Speaker> &speakers);
    static float speakerSpacing(const std::vector<Speaker> &speakers);

private:
    static bool isLinearArray(const std::vector<Speaker> &speakers);
    static bool isCircularArray(const std::vector<Speaker> &speakers);
};
