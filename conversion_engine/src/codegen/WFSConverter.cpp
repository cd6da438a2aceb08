#include "WFSConverter.hpp"
#include "../ConversionErrors.hpp"
#include "../spatial/SpeakerArrayClassifier.hpp"
#include <cmath>
#include <cstdio>
#include <al/math/al_Vec.hpp>

static std::string fmt2(float v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

// Horizontal-plane position from azimuth (deg) and distance
static al::Vec3f planarPosition(float azimuthDeg, float distance) {
    float az = azimuthDeg * float(M_PI) / 180.0f;
    return al::Vec3f(distance * std::cos(az), distance * std::sin(az), 0.0f);
}

float WFSConverter::calculateSpeakerDelay(const SphericalCoord &speakerPos,
                                          float sourceAzimuth, float sourceDistance,
                                          float soundSpeed) {
    al::Vec3f spk = planarPosition(speakerPos.azimuth, speakerPos.distance);
    al::Vec3f src = planarPosition(sourceAzimuth, sourceDistance);
    return (spk - src).mag() / soundSpeed;
}

float WFSConverter::calculateWfsAmplitude(const SphericalCoord &speakerPos,
                                          float sourceDistance, float referenceDistance) {
    if (sourceDistance <= 0.0f) {
        return 1.0f;  // plane wave
    }
    float distanceFactor = std::sqrt(referenceDistance / sourceDistance);
    float speakerFactor = speakerPos.distance > 0.0f
        ? std::sqrt(referenceDistance / speakerPos.distance)
        : 1.0f;
    return distanceFactor * speakerFactor;
}

SCObject WFSConverter::generateWfsArray(const SpeakerArray &array, const WfsGenerationOptions &options) {
    if (array.speakers.empty()) {
        throw ConversionError::missingAttribute("speakers");
    }

    const WfsConfig cfg = array.wfsConfig.value_or(WfsConfig{});

    std::vector<SCValue> delays;
    std::vector<SCValue> gains;
    delays.reserve(array.speakers.size());
    gains.reserve(array.speakers.size());

    if (options.useGeometry) {
        float c = speedOfSound(options.temperatureCelsius);
        for (const auto &s : array.speakers) {
            delays.push_back(calculateSpeakerDelay(s.position, options.sourceAzimuth,
                                                   options.sourceDistance, c));
            gains.push_back(calculateWfsAmplitude(s.position, options.sourceDistance,
                                                  options.referenceDistance));
        }
    } else {
        for (const auto &s : array.speakers) {
            delays.push_back(s.delay);
            gains.push_back(s.gain);
        }
    }

    switch (array.type.kind) {
        case SpeakerArrayKind::Wfs:
            return generateLinearArray(array, cfg, std::move(delays), std::move(gains));
        case SpeakerArrayKind::Ring:
            return generateCircularArray(array, cfg, std::move(delays), std::move(gains));
        case SpeakerArrayKind::Irregular:
            break;
    }
    return generateIrregularArray(array, cfg, std::move(delays), std::move(gains));
}

SCObject WFSConverter::generateLinearArray(const SpeakerArray &array, const WfsConfig &cfg,
                                           std::vector<SCValue> delays, std::vector<SCValue> gains) {
    int n = int(array.speakers.size());
    return SCObject("WFSArrayLinear")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("source_azimuth"))
        .arg(SCValue::symbol("source_distance"))
        .arg(n)
        .arg(array.type.length)
        .arg(array.type.spacing)
        .arg(std::move(delays))
        .arg(std::move(gains))
        .prop("prefilter_cutoff", cfg.prefilterCutoff)
        .prop("distance_compensation", cfg.distanceCompensation)
        .prop("amplitude_correction", cfg.amplitudeCorrection)
        .prop("aliasing_frequency", cfg.aliasingFrequency)
        .prop("comment", "WFS linear array: " + std::to_string(n) + " speakers, "
                         + fmt2(array.type.length) + "m length");
}

SCObject WFSConverter::generateCircularArray(const SpeakerArray &array, const WfsConfig &cfg,
                                             std::vector<SCValue> delays, std::vector<SCValue> gains) {
    int n = int(array.speakers.size());
    return SCObject("WFSArrayCircular")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("source_azimuth"))
        .arg(SCValue::symbol("source_distance"))
        .arg(n)
        .arg(array.type.radius)
        .arg(std::move(delays))
        .arg(std::move(gains))
        .prop("prefilter_cutoff", cfg.prefilterCutoff)
        .prop("distance_compensation", cfg.distanceCompensation)
        .prop("amplitude_correction", cfg.amplitudeCorrection)
        .prop("comment", "WFS circular array: " + std::to_string(n) + " speakers, "
                         + fmt2(array.type.radius) + "m radius");
}

SCObject WFSConverter::generateIrregularArray(const SpeakerArray &array, const WfsConfig &cfg,
                                              std::vector<SCValue> delays, std::vector<SCValue> gains) {
    int n = int(array.speakers.size());

    std::vector<SCValue> azimuths, elevations, distances;
    for (const auto &s : array.speakers) {
        azimuths.push_back(s.position.azimuth);
        elevations.push_back(s.position.elevation);
        distances.push_back(s.position.distance);
    }

    return SCObject("WFSArrayIrregular")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("source_azimuth"))
        .arg(SCValue::symbol("source_distance"))
        .arg(n)
        .arg(std::move(azimuths))
        .arg(std::move(elevations))
        .arg(std::move(distances))
        .arg(std::move(delays))
        .arg(std::move(gains))
        .prop("prefilter_cutoff", cfg.prefilterCutoff)
        .prop("distance_compensation", cfg.distanceCompensation)
        .prop("comment", "WFS irregular array: " + std::to_string(n) + " speakers");
}

SCObject WFSConverter::generatePrefilter(float cutoff) {
    return SCObject("WFSPrefilter")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(cutoff)
        .prop("comment", "WFS prefilter for spatial aliasing reduction");
}

SCObject WFSConverter::generateFocusedSource(float sourceAzimuth, float sourceDistance, float focusDistance) {
    return SCObject("WFSFocusedSource")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(sourceAzimuth)
        .arg(sourceDistance)
        .arg(focusDistance)
        .prop("comment", "WFS focused source with virtual distance");
}

SCObject WFSConverter::generatePlaneWave(float azimuth) {
    return SCObject("WFSPlaneWave")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(azimuth)
        .prop("comment", "WFS plane wave synthesis");
}

SCObject WFSConverter::generateDistanceCompensation(float referenceDistance) {
    return SCObject("WFSDistanceCompensation")
        .withMethod("ar")
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("source_distance"))
        .arg(referenceDistance)
        .prop("comment", "WFS distance-based amplitude compensation");
}
