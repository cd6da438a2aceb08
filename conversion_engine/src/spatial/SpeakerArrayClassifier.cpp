#include "SpeakerArrayClassifier.hpp"
#include "../ConversionErrors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

static constexpr size_t kWfsMinSpeakers  = 16;
static constexpr size_t kRingMinSpeakers = 4;
static constexpr float kElevationTolerance = 10.0f;  // degrees
static constexpr float kDistanceTolerance  = 0.5f;   // meters

static float toRadians(float deg) { return deg * float(M_PI) / 180.0f; }

float SpeakerArrayClassifier::averageDistance(const std::vector<Speaker> &speakers) {
    if (speakers.empty()) return 0.0f;
    float sum = 0.0f;
    for (const auto &s : speakers) sum += s.position.distance;
    return sum / speakers.size();
}

float SpeakerArrayClassifier::averageElevation(const std::vector<Speaker> &speakers) {
    if (speakers.empty()) return 0.0f;
    float sum = 0.0f;
    for (const auto &s : speakers) sum += s.position.elevation;
    return sum / speakers.size();
}

bool SpeakerArrayClassifier::isLinearArray(const std::vector<Speaker> &speakers) {
    if (speakers.size() < 3) return false;
    float avgEl = averageElevation(speakers);
    return std::all_of(speakers.begin(), speakers.end(), [&](const Speaker &s) {
        return std::fabs(s.position.elevation - avgEl) < kElevationTolerance;
    });
}

bool SpeakerArrayClassifier::isCircularArray(const std::vector<Speaker> &speakers) {
    float avgDist = averageDistance(speakers);
    return std::all_of(speakers.begin(), speakers.end(), [&](const Speaker &s) {
        return std::fabs(s.position.distance - avgDist) < kDistanceTolerance;
    });
}

// Angular span converted to an arc length at the mean distance
float SpeakerArrayClassifier::arrayLength(const std::vector<Speaker> &speakers) {
    if (speakers.empty()) return 0.0f;
    auto [minIt, maxIt] = std::minmax_element(speakers.begin(), speakers.end(),
        [](const Speaker &a, const Speaker &b) { return a.position.azimuth < b.position.azimuth; });
    return averageDistance(speakers) * toRadians(maxIt->position.azimuth - minIt->position.azimuth);
}

float SpeakerArrayClassifier::speakerSpacing(const std::vector<Speaker> &speakers) {
    if (speakers.size() < 2) return 0.0f;

    std::vector<float> angles;
    angles.reserve(speakers.size());
    for (const auto &s : speakers) angles.push_back(s.position.azimuth);
    std::sort(angles.begin(), angles.end());

    float span = angles.back() - angles.front();
    return averageDistance(speakers) * toRadians(span / float(speakers.size() - 1));
}

SpeakerArrayType SpeakerArrayClassifier::classifyArrayType(const std::vector<Speaker> &speakers) {
    for (const auto &s : speakers) {
        if (!std::isfinite(s.position.azimuth) || !std::isfinite(s.position.elevation)
            || !std::isfinite(s.position.distance)) {
            throw AnalysisError(AnalysisError::Kind::UnsupportedSpatial,
                                "speaker " + std::to_string(s.id) + " has a non-finite position");
        }
    }

    const size_t n = speakers.size();
    if (n >= kWfsMinSpeakers && isLinearArray(speakers)) {
        return SpeakerArrayType::wfs(arrayLength(speakers), speakerSpacing(speakers));
    }
    if (n >= kRingMinSpeakers && isCircularArray(speakers)) {
        return SpeakerArrayType::ring(averageDistance(speakers));
    }
    return SpeakerArrayType::irregular();
}

WfsConfig SpeakerArrayClassifier::deriveWfsConfig(const SpeakerArrayType &type, float temperatureCelsius) {
    WfsConfig cfg;
    if (type.spacing > 0.0f) {
        cfg.aliasingFrequency = speedOfSound(temperatureCelsius) / (2.0f * type.spacing);
    }
    cfg.prefilterCutoff = cfg.aliasingFrequency;
    cfg.distanceCompensation = true;
    cfg.amplitudeCorrection = true;
    return cfg;
}

std::vector<SpeakerArray> SpeakerArrayClassifier::classifySpeakerArrays(const std::vector<SpeakerArrayRecord> &records,
                                                                        float temperatureCelsius,
                                                                        bool verbose) {
    std::vector<SpeakerArray> arrays;
    arrays.reserve(records.size());

    for (const auto &rec : records) {
        SpeakerArray array;
        array.id = rec.name.empty() ? "bus " + std::to_string(rec.busId) : rec.name;
        array.busId = rec.busId;
        array.declaredFormat = rec.format;

        for (const auto &spk : rec.speakers) {
            array.speakers.push_back({spk.id, spk.position, spk.delay, spk.gain});
        }

        array.type = classifyArrayType(array.speakers);
        if (array.type.kind == SpeakerArrayKind::Wfs) {
            array.wfsConfig = deriveWfsConfig(array.type, temperatureCelsius);
        }

        if (array.speakers.empty()) {
            std::cerr << "[SpeakerClassifier] Warning: array '" << array.id << "' has no speakers\n";
        }

        std::cout << "[SpeakerClassifier] " << array.id << ": " << array.speakers.size()
                  << " speakers, " << arrayKindName(array.type.kind);
        if (array.type.kind == SpeakerArrayKind::Ring) {
            std::cout << " (radius " << array.type.radius << " m)";
        } else if (array.type.kind == SpeakerArrayKind::Wfs) {
            std::cout << " (length " << array.type.length << " m, spacing " << array.type.spacing << " m)";
        }
        std::cout << "\n";

        if (verbose) {
            for (const auto &s : array.speakers) {
                std::cout << "[SpeakerClassifier]   #" << s.id << " az " << s.position.azimuth
                          << " el " << s.position.elevation << " d " << s.position.distance << "\n";
            }
        }

        arrays.push_back(std::move(array));
    }
    return arrays;
}
