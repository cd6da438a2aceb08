#include "VBAPConverter.hpp"
#include "../ConversionErrors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <al/io/al_AudioIOData.hpp>
#include <al/sound/al_Vbap.hpp>

static constexpr float kMinSeparationDeg = 10.0f;
static constexpr float kHorizontalSpanDeg = 3.0f;
static constexpr float kDetEpsilon = 1e-4f;
static constexpr float kGainEpsilon = -1e-4f;
static constexpr double kGainSampleRate = 48000.0;

static float toRadians(float deg) { return deg * float(M_PI) / 180.0f; }

static al::Vec3f unitDirection(float azimuthDeg, float elevationDeg) {
    return VBAPConverter::sphericalToCartesian({azimuthDeg, elevationDeg, 1.0f});
}

static al::Vec3f speakerDirection(const Speaker &s) {
    return unitDirection(s.position.azimuth, s.position.elevation);
}

// Smallest angle between two azimuths, in [0, 180]
static float wrappedSeparation(float a, float b) {
    float d = std::fmod(std::fabs(a - b), 360.0f);
    return d > 180.0f ? 360.0f - d : d;
}

al::Vec3f VBAPConverter::sphericalToCartesian(const SphericalCoord &pos) {
    float az = toRadians(pos.azimuth);
    float el = toRadians(pos.elevation);
    return al::Vec3f(pos.distance * std::cos(el) * std::cos(az),
                     pos.distance * std::cos(el) * std::sin(az),
                     pos.distance * std::sin(el));
}

// ============================================================================
// Speaker setup and panners
// ============================================================================

SCObject VBAPConverter::generateSpeakerSetup(const SpeakerArray &array) {
    if (array.speakers.empty()) {
        throw ConversionError::missingAttribute("speakers");
    }

    int n = int(array.speakers.size());

    switch (array.type.kind) {
        case SpeakerArrayKind::Ring: {
            std::vector<float> sorted;
            for (const auto &s : array.speakers) sorted.push_back(s.position.azimuth);
            std::sort(sorted.begin(), sorted.end());

            std::vector<SCValue> angles(sorted.begin(), sorted.end());

            char radius[32];
            std::snprintf(radius, sizeof(radius), "%.2f", array.type.radius);

            return SCObject("VBAPSpeakerSetup")
                .withMethod("new")
                .arg(n)
                .arg("ring")
                .arg(array.type.radius)
                .arg(std::move(angles))
                .prop("dimension", "2D")
                .prop("buffer_size", 512)
                .prop("comment", "VBAP ring setup: " + std::to_string(n) + " speakers, "
                                 + radius + "m radius");
        }
        case SpeakerArrayKind::Wfs: {
            // linear WFS arrays double as VBAP layouts
            std::vector<SCValue> positions;
            for (const auto &s : array.speakers) {
                positions.push_back(std::vector<SCValue>{s.position.azimuth, s.position.elevation,
                                                         s.position.distance});
            }
            return SCObject("VBAPSpeakerSetup")
                .withMethod("new")
                .arg(n)
                .arg("linear")
                .arg(std::move(positions))
                .prop("dimension", "3D")
                .prop("comment", "VBAP linear setup: " + std::to_string(n) + " speakers");
        }
        case SpeakerArrayKind::Irregular:
            break;
    }

    std::vector<SCValue> positions;
    for (const auto &s : array.speakers) {
        al::Vec3f p = sphericalToCartesian(s.position);
        positions.push_back(std::vector<SCValue>{p.x, p.y, p.z});
    }
    return SCObject("VBAPSpeakerSetup")
        .withMethod("new")
        .arg(n)
        .arg("irregular")
        .arg(std::move(positions))
        .prop("dimension", "3D")
        .prop("triangulation", "auto")
        .prop("comment", "VBAP irregular setup: " + std::to_string(n) + " speakers");
}

SCObject VBAPConverter::generatePanner(int numChannels, const std::string &speakerSetup, bool use3D) {
    return SCObject(use3D ? "VBAP3D" : "VBAP")
        .withMethod("ar")
        .arg(numChannels)
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("azimuth"))
        .arg(SCValue::symbol("elevation"))
        .arg(SCValue::symbol("spread"))
        .arg(SCValue::symbol("gain"))
        .prop("speaker_setup", speakerSetup)
        .prop("comment", "VBAP panner: " + std::to_string(numChannels) + " channels, "
                         + (use3D ? "3D" : "2D"));
}

SCObject VBAPConverter::generateDistancePanner(int numChannels, DistanceCompensation compensation) {
    float factor = 0.0f;
    const char *name = "None";
    switch (compensation) {
        case DistanceCompensation::None:          factor = 0.0f; name = "None"; break;
        case DistanceCompensation::Linear:        factor = 1.0f; name = "Linear"; break;
        case DistanceCompensation::InverseSquare: factor = 2.0f; name = "InverseSquare"; break;
    }

    return SCObject("VBAPDistance")
        .withMethod("ar")
        .arg(numChannels)
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("azimuth"))
        .arg(SCValue::symbol("elevation"))
        .arg(SCValue::symbol("distance"))
        .arg(SCValue::symbol("spread"))
        .arg(factor)
        .prop("reference_distance", 2.0f)
        .prop("comment", "Distance VBAP: " + std::to_string(numChannels) + " channels, "
                         + name + " compensation");
}

SCObject VBAPConverter::generateSpreadPanner(int numChannels, SpreadType spread) {
    std::string method = "linear";
    switch (spread) {
        case SpreadType::Linear:   method = "linear"; break;
        case SpreadType::Gaussian: method = "gaussian"; break;
        case SpreadType::Uniform:  method = "uniform"; break;
    }

    return SCObject("VBAPSpread")
        .withMethod("ar")
        .arg(numChannels)
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("azimuth"))
        .arg(SCValue::symbol("elevation"))
        .arg(SCValue::symbol("spread_amount"))
        .arg(method)
        .prop("comment", "VBAP with " + method + " spread: " + std::to_string(numChannels) + " channels");
}

// ============================================================================
// Validation
// ============================================================================

float VBAPConverter::calculateOptimalSpread(const SpeakerArray &array) {
    if (array.speakers.size() < 2) return 0.0f;

    std::vector<float> angles;
    for (const auto &s : array.speakers) angles.push_back(s.position.azimuth);
    std::sort(angles.begin(), angles.end());

    float total = 0.0f;
    for (size_t i = 1; i < angles.size(); i++) {
        total += angles[i] - angles[i - 1];
    }
    total += std::fmod(360.0f + angles.front() - angles.back(), 360.0f);

    return total / float(angles.size());
}

VbapValidationResult VBAPConverter::validateSpeakerSetup(const SpeakerArray &array) {
    VbapValidationResult result;

    if (array.speakers.size() < 3) {
        result.isValid = false;
        result.errors.push_back("VBAP requires at least 3 speakers");
        return result;
    }

    for (size_t i = 0; i < array.speakers.size(); i++) {
        for (size_t j = i + 1; j < array.speakers.size(); j++) {
            float sep = wrappedSeparation(array.speakers[i].position.azimuth,
                                          array.speakers[j].position.azimuth);
            if (sep < kMinSeparationDeg) {
                char buf[128];
                std::snprintf(buf, sizeof(buf), "Speakers %zu and %zu are very close (%.1f deg)", i, j, sep);
                result.warnings.push_back(buf);
            }
        }
    }

    result.optimalSpread = calculateOptimalSpread(array);
    return result;
}

// ============================================================================
// Gain solve
// ============================================================================

// Unnormalized Cramer's rule solution; false if the triangle is degenerate
static bool solveTriangle(const al::Vec3f &p, const al::Vec3f &l1, const al::Vec3f &l2,
                          const al::Vec3f &l3, std::array<float, 3> &g) {
    float det = l1.dot(l2.cross(l3));
    if (std::fabs(det) < kDetEpsilon) return false;
    g[0] = p.dot(l2.cross(l3)) / det;
    g[1] = l1.dot(p.cross(l3)) / det;
    g[2] = l1.dot(l2.cross(p)) / det;
    return true;
}

static void clampAndNormalize(std::array<float, 3> &g) {
    float power = 0.0f;
    for (float &v : g) {
        v = std::max(0.0f, v);
        power += v * v;
    }
    if (power <= 0.0f) return;
    float norm = std::sqrt(power);
    for (float &v : g) v /= norm;
}

// Speaker channels are consecutive 0-based indices into the vector
static al::Speakers buildLayout(const std::vector<Speaker> &speakers) {
    al::Speakers layout;
    for (size_t i = 0; i < speakers.size(); i++) {
        const auto &pos = speakers[i].position;
        layout.emplace_back(al::Speaker(
            i,
            pos.azimuth,
            pos.elevation,
            0,                                        // group id
            pos.distance > 0.0f ? pos.distance : 1.0f
        ));
    }
    return layout;
}

// Unit direction in AlloLib's speaker frame (y front, x right, z up)
static al::Vec3f panningDirection(float azimuthDeg, float elevationDeg) {
    float az = toRadians(azimuthDeg);
    float el = toRadians(elevationDeg);
    float cosEl = std::cos(el);
    return al::Vec3f(std::sin(az) * cosEl, std::cos(az) * cosEl, std::sin(el));
}

std::optional<SpeakerTriangle> VBAPConverter::findOptimalTriangle(float azimuth, float elevation,
                                                                  const std::vector<Speaker> &speakers) {
    if (speakers.size() < 3) return std::nullopt;

    // compile builds the non-overlapping speaker triplet mesh
    al::Vbap vbap(buildLayout(speakers), true);
    vbap.compile();

    al::Vec3f p = panningDirection(azimuth, elevation);

    std::optional<SpeakerTriangle> best;
    float bestMin = kGainEpsilon;

    for (const auto &triple : vbap.triplets()) {
        SpeakerTriangle tri{size_t(triple.s1), size_t(triple.s2), size_t(triple.s3)};
        if (tri[0] >= speakers.size() || tri[1] >= speakers.size() || tri[2] >= speakers.size()) continue;

        std::array<float, 3> g;
        if (!solveTriangle(p,
                           panningDirection(speakers[tri[0]].position.azimuth, speakers[tri[0]].position.elevation),
                           panningDirection(speakers[tri[1]].position.azimuth, speakers[tri[1]].position.elevation),
                           panningDirection(speakers[tri[2]].position.azimuth, speakers[tri[2]].position.elevation),
                           g)) {
            continue;
        }
        float minGain = std::min({g[0], g[1], g[2]});
        if (minGain >= bestMin) {
            bestMin = minGain;
            std::sort(tri.begin(), tri.end());
            best = tri;
        }
    }
    return best;
}

std::array<float, 3> VBAPConverter::calculateVbapGains(float azimuth, float elevation,
                                                       const SpeakerTriangle &triangle,
                                                       const std::vector<Speaker> &speakers) {
    for (size_t idx : triangle) {
        if (idx >= speakers.size()) {
            throw ConversionError::invalidParameter("speaker_index", float(idx));
        }
    }

    std::array<float, 3> g;
    if (!solveTriangle(unitDirection(azimuth, elevation),
                       speakerDirection(speakers[triangle[0]]),
                       speakerDirection(speakers[triangle[1]]),
                       speakerDirection(speakers[triangle[2]]), g)) {
        throw ConversionError::invalidParameter("speaker_triangle", 0.0f);
    }
    clampAndNormalize(g);
    return g;
}

bool VBAPConverter::isHorizontalLayout(const std::vector<Speaker> &speakers) {
    if (speakers.empty()) return true;
    auto [lo, hi] = std::minmax_element(speakers.begin(), speakers.end(),
        [](const Speaker &a, const Speaker &b) { return a.position.elevation < b.position.elevation; });
    return hi->position.elevation - lo->position.elevation < kHorizontalSpanDeg;
}

std::vector<float> VBAPConverter::computePanningGains(float azimuth, float elevation,
                                                      const std::vector<Speaker> &speakers) {
    if (speakers.empty()) {
        throw ConversionError::missingAttribute("speakers");
    }

    int numSpeakers = int(speakers.size());
    std::vector<float> gains(speakers.size(), 0.0f);
    if (numSpeakers == 1) {
        gains[0] = 1.0f;
        return gains;
    }

    // 2D layouts pan between adjacent pairs; flatten the source onto the ring
    bool is3D = !isHorizontalLayout(speakers);
    al::Vec3f dir = panningDirection(azimuth, is3D ? elevation : 0.0f);

    al::Vbap vbap(buildLayout(speakers), is3D);
    vbap.compile();

    // Render a unit sample at the direction and read the gains off the outputs
    al::AudioIOData tempAudio;
    tempAudio.framesPerBuffer(1);
    tempAudio.framesPerSecond(kGainSampleRate);
    tempAudio.channelsIn(0);
    tempAudio.channelsOut(numSpeakers);
    tempAudio.zeroOut();

    float unitSample = 1.0f;
    tempAudio.frame(0);
    vbap.renderBuffer(tempAudio, dir, &unitSample, 1);

    tempAudio.frame(0);
    float power = 0.0f;
    for (int ch = 0; ch < numSpeakers; ch++) {
        gains[ch] = tempAudio.out(ch, 0);
        power += gains[ch] * gains[ch];
    }
    if (power > 0.0f) return gains;

    // Coverage gap: snap to the nearest speaker
    size_t nearest = 0;
    float bestDot = -2.0f;
    for (size_t i = 0; i < speakers.size(); i++) {
        float d = dir.dot(panningDirection(speakers[i].position.azimuth, speakers[i].position.elevation));
        if (d > bestDot) {
            bestDot = d;
            nearest = i;
        }
    }
    std::fill(gains.begin(), gains.end(), 0.0f);
    gains[nearest] = 1.0f;
    return gains;
}
