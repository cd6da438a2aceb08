#pragma once

#include "SpatialTypes.hpp"
#include "SpatialObjectAnalyzer.hpp"
#include "SpeakerArrayClassifier.hpp"
#include "../ConversionTypes.hpp"

class SpatialAnalyzer {
public:
    /// Analyze spatial objects in the patch and the speaker arrays of the
    /// (optional) speaker configuration, then pick a processing method.
    /// options.skipSpatial leaves spatialObjects empty,
    /// options.skipMultichannel leaves speakerArrays empty.
    static SpatialConfig analyzeSpatialConfig(const PatchData &patch,
                                              const SpeakerConfigData *speakerConfig,
                                              const ConversionOptions &options = ConversionOptions{});

    /// Priority: any Wfs array > any HOA object > largest array >= 4 > stereo
    static SpatialProcessingMethod selectProcessingMethod(const SpatialConfig &config);
};
