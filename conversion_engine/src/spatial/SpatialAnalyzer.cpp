#include "SpatialAnalyzer.hpp"
#include <algorithm>
#include <iostream>

SpatialConfig SpatialAnalyzer::analyzeSpatialConfig(const PatchData &patch,
                                                    const SpeakerConfigData *speakerConfig,
                                                    const ConversionOptions &options) {
    SpatialConfig config;

    if (!options.skipSpatial) {
        config.spatialObjects = SpatialObjectAnalyzer::analyzeSpatialObjects(patch, options.verbose);
    }

    if (speakerConfig && !options.skipMultichannel) {
        config.speakerArrays = SpeakerArrayClassifier::classifySpeakerArrays(
            speakerConfig->speakerArrays, options.temperatureCelsius, options.verbose);
    }

    config.processingMethod = selectProcessingMethod(config);

    std::cout << "[SpatialAnalyzer] " << config.spatialObjects.size() << " spatial objects, "
              << config.speakerArrays.size() << " speaker arrays, method: "
              << processingMethodName(config.processingMethod) << "\n";
    return config;
}

SpatialProcessingMethod SpatialAnalyzer::selectProcessingMethod(const SpatialConfig &config) {
    bool hasWfsArray = std::any_of(config.speakerArrays.begin(), config.speakerArrays.end(),
        [](const SpeakerArray &a) { return a.type.kind == SpeakerArrayKind::Wfs; });
    if (hasWfsArray) return SpatialProcessingMethod::Wfs;

    bool hasHoa = std::any_of(config.spatialObjects.begin(), config.spatialObjects.end(),
        [](const SpatialObject &o) { return o.type.isHoa(); });
    if (hasHoa) return SpatialProcessingMethod::Hoa;

    size_t maxSpeakers = 0;
    for (const auto &a : config.speakerArrays) {
        maxSpeakers = std::max(maxSpeakers, a.speakers.size());
    }
    if (maxSpeakers >= 4) return SpatialProcessingMethod::Vbap;

    return SpatialProcessingMethod::Stereo;
}
