#pragma once

#include <string>
#include <vector>

#include "SCObject.hpp"
#include "../spatial/SpatialTypes.hpp"

enum class HoaDecoderType {
    Basic,
    MaxRe,
    InPhase,
    Controlled
};

enum class HrtfType {
    Diffuse,
    Spherical,
    Cipic,
    Listen
};

enum class HoaMirrorAxis {
    X,
    Y,
    Z,
    XY,
    YZ,
    XZ
};

enum class HoaFocusType {
    Push,
    Press,
    Zoom
};

struct HoaValidationResult {
    bool isValid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    int recommendedOrder = 1;
};

// Decoder gains, one row per speaker and one column per ambisonic channel
// (ACN order). Passed explicitly to generateDecoder(); an empty matrix
// leaves the matrix as a symbolic \decoder_matrix argument.
struct HoaDecoderMatrix {
    int order = 1;
    std::vector<std::vector<float>> rows;

    bool empty() const { return rows.empty(); }
};

class HOAConverter {
public:
    /// (1, 2) -> FoaEncode 2D (3 ch), (1, 3) -> FoaEncode 3D (4 ch),
    /// (N, 3) -> HoaEncode, (N+1)^2 channels.
    /// Throws ConversionError: invalidParameter for order outside [1, 7] or a dimension
    /// other than 2/3, unsupportedObject for order > 1 in 2D.
    static SCObject generateEncoder(int order, int dimension);

    /// FoaDecode for order 1, HoaDecode otherwise
    static SCObject generateDecoder(int order, const SpeakerArray &array, HoaDecoderType type,
                                    const HoaDecoderMatrix &matrix = HoaDecoderMatrix{});

    static SCObject generateRotation(int order);
    static SCObject generateBinauralDecoder(int order, HrtfType hrtf);

    // Sound field transforms, FoaX for order 1 and HoaX above
    static SCObject generateMirror(int order, HoaMirrorAxis axis);
    static SCObject generateFocus(int order, HoaFocusType type);
    static SCObject generateNearFieldCompensation(int order);

    /// Through.ar pass-through when both orders match, HoaConvert otherwise.
    /// Both orders must be in [1, 7].
    static SCObject generateOrderConverter(int fromOrder, int toOrder);

    // First order sampling decoder: row i = (1/N) * [W, Y, Z, X] toward speaker i
    static HoaDecoderMatrix computeFoaDecoderMatrix(const SpeakerArray &array);

    // floor(sqrt(n / 4)) clamped to [1, 7]
    static int calculateOptimalOrder(const SpeakerArray &array);
    static int calculateOptimalOrder(size_t numSpeakers);

    /// Invalid above order 7 or when numSpeakers < (order+1)^2, warning below twice that.
    /// recommendedOrder = floor(sqrt(n / 8)) clamped to [1, 5]
    static HoaValidationResult validateHoaConfig(int order, size_t numSpeakers);

    static int calculateRecommendedOrder(size_t numSpeakers);

    static std::string decoderTypeName(HoaDecoderType type);
    static std::string hrtfTypeName(HrtfType type);
    static std::string mirrorAxisName(HoaMirrorAxis axis);
    static std::string focusTypeName(HoaFocusType type);

    // Throws ConversionError::invalidParameter("order") outside [1, 7]
    static void checkOrder(int order);
};
