#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include <al/math/al_Vec.hpp>

#include "SCObject.hpp"
#include "../spatial/SpatialTypes.hpp"

struct VbapValidationResult {
    bool isValid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    float optimalSpread = 0.0f;   // degrees
};

enum class DistanceCompensation {
    None,
    Linear,
    InverseSquare
};

enum class SpreadType {
    Linear,
    Gaussian,
    Uniform
};

using SpeakerTriangle = std::array<size_t, 3>;

class VBAPConverter {
public:
    /// Speaker setup by topology:
    ///   Ring      -> 2D, sorted azimuths
    ///   Wfs       -> 3D, [az, el, dist] per speaker
    ///   Irregular -> 3D, cartesian per speaker, auto triangulation
    /// Throws ConversionError::missingAttribute("speakers") for an empty array.
    static SCObject generateSpeakerSetup(const SpeakerArray &array);

    static SCObject generatePanner(int numChannels, const std::string &speakerSetup, bool use3D);
    static SCObject generateDistancePanner(int numChannels, DistanceCompensation compensation);
    static SCObject generateSpreadPanner(int numChannels, SpreadType spread);

    /// Invalid with fewer than 3 speakers. Warns for speaker pairs closer
    /// than 10 degrees in azimuth (wrapped, so 359 and 1 are 2 apart).
    static VbapValidationResult validateSpeakerSetup(const SpeakerArray &array);

    // Mean gap between azimuth-sorted speakers, wrap-around gap included
    static float calculateOptimalSpread(const SpeakerArray &array);

    static al::Vec3f sphericalToCartesian(const SphericalCoord &pos);

    // ---- gain solve ----

    /// 3D: the triplet of al::Vbap's compiled speaker mesh enclosing
    /// (azimuth, elevation), indices ascending.
    /// nullopt with fewer than 3 speakers or when no mesh triplet encloses the direction.
    static std::optional<SpeakerTriangle> findOptimalTriangle(float azimuth, float elevation,
                                                              const std::vector<Speaker> &speakers);

    /// Solve p = g1*l1 + g2*l2 + g3*l3, clamp negatives, normalize to unit power.
    /// Throws ConversionError::invalidParameter for an out-of-range index or a
    /// degenerate (coplanar with the origin) triangle.
    static std::array<float, 3> calculateVbapGains(float azimuth, float elevation,
                                                   const SpeakerTriangle &triangle,
                                                   const std::vector<Speaker> &speakers);

    /// One gain per speaker for a source direction, rendered through al::Vbap.
    /// Horizontal layouts (elevation span under 3 deg) compile in 2D mode,
    /// others in 3D; a direction outside the mesh goes to the nearest speaker.
    static std::vector<float> computePanningGains(float azimuth, float elevation,
                                                  const std::vector<Speaker> &speakers);

    static bool isHorizontalLayout(const std::vector<Speaker> &speakers);
};
