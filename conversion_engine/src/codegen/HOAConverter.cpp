#include "HOAConverter.hpp"
#include "../ConversionErrors.hpp"
#include <algorithm>
#include <cmath>

static constexpr int kMaxOrder = 7;

// Only called with a checked order (1..7)
static int channelCount3D(int order) {
    return (order + 1) * (order + 1);
}

void HOAConverter::checkOrder(int order) {
    if (order < 1 || order > kMaxOrder) {
        throw ConversionError::invalidParameter("order", float(order));
    }
}

std::string HOAConverter::decoderTypeName(HoaDecoderType type) {
    switch (type) {
        case HoaDecoderType::Basic:      return "basic";
        case HoaDecoderType::MaxRe:      return "maxRe";
        case HoaDecoderType::InPhase:    return "inPhase";
        case HoaDecoderType::Controlled: return "controlled";
    }
    return "basic";
}

std::string HOAConverter::hrtfTypeName(HrtfType type) {
    switch (type) {
        case HrtfType::Diffuse:   return "diffuse";
        case HrtfType::Spherical: return "spherical";
        case HrtfType::Cipic:     return "cipic";
        case HrtfType::Listen:    return "listen";
    }
    return "diffuse";
}

std::string HOAConverter::mirrorAxisName(HoaMirrorAxis axis) {
    switch (axis) {
        case HoaMirrorAxis::X:  return "x";
        case HoaMirrorAxis::Y:  return "y";
        case HoaMirrorAxis::Z:  return "z";
        case HoaMirrorAxis::XY: return "xy";
        case HoaMirrorAxis::YZ: return "yz";
        case HoaMirrorAxis::XZ: return "xz";
    }
    return "x";
}

std::string HOAConverter::focusTypeName(HoaFocusType type) {
    switch (type) {
        case HoaFocusType::Push:  return "push";
        case HoaFocusType::Press: return "press";
        case HoaFocusType::Zoom:  return "zoom";
    }
    return "push";
}

// ============================================================================
// Encoders
// ============================================================================

SCObject HOAConverter::generateEncoder(int order, int dimension) {
    checkOrder(order);
    if (dimension != 2 && dimension != 3) {
        throw ConversionError::invalidParameter("dimension", float(dimension));
    }

    if (order == 1 && dimension == 2) {
        return SCObject("FoaEncode")
            .withMethod("ar")
            .arg(SCValue::symbol("input"))
            .arg(SCValue::symbol("azimuth"))
            .prop("encoder_type", "omni")
            .prop("dimension", "2D")
            .prop("order", 1)
            .prop("channels", 3)   // W, X, Y
            .prop("comment", "FOA 2D encoder");
    }

    if (order == 1) {
        return SCObject("FoaEncode")
            .withMethod("ar")
            .arg(SCValue::symbol("input"))
            .arg(SCValue::symbol("azimuth"))
            .arg(SCValue::symbol("elevation"))
            .prop("encoder_type", "omni")
            .prop("dimension", "3D")
            .prop("order", 1)
            .prop("channels", 4)   // W, X, Y, Z
            .prop("comment", "FOA 3D encoder");
    }

    if (dimension == 2) {
        throw ConversionError::unsupportedObject("2D HOA encoder of order " + std::to_string(order));
    }

    int channels = channelCount3D(order);
    return SCObject("HoaEncode")
        .withMethod("ar")
        .arg(order)
        .arg(SCValue::symbol("input"))
        .arg(SCValue::symbol("azimuth"))
        .arg(SCValue::symbol("elevation"))
        .prop("dimension", "3D")
        .prop("order", order)
        .prop("channels", channels)
        .prop("comment", "HOA 3D encoder, order " + std::to_string(order) + ", "
                         + std::to_string(channels) + " channels");
}

// ============================================================================
// Decoders
// ============================================================================

static SCValue matrixArgument(const HoaDecoderMatrix &matrix) {
    if (matrix.empty()) {
        return SCValue::symbol("decoder_matrix");
    }
    std::vector<SCValue> rows;
    for (const auto &row : matrix.rows) {
        rows.push_back(std::vector<SCValue>(row.begin(), row.end()));
    }
    return rows;
}

SCObject HOAConverter::generateDecoder(int order, const SpeakerArray &array, HoaDecoderType type,
                                       const HoaDecoderMatrix &matrix) {
    checkOrder(order);
    if (array.speakers.empty()) {
        throw ConversionError::missingAttribute("speakers");
    }

    if (!matrix.empty()) {
        if (matrix.order != order) {
            throw ConversionError::invalidParameter("decoder_matrix_order", float(matrix.order));
        }
        if (matrix.rows.size() != array.speakers.size()) {
            throw ConversionError::invalidParameter("decoder_matrix_rows", float(matrix.rows.size()));
        }
        for (const auto &row : matrix.rows) {
            if (row.size() != size_t(channelCount3D(order))) {
                throw ConversionError::invalidParameter("decoder_matrix_columns", float(row.size()));
            }
        }
    }

    int numSpeakers = int(array.speakers.size());
    std::string method = decoderTypeName(type);

    if (order == 1) {
        std::vector<SCValue> positions;
        for (const auto &s : array.speakers) {
            positions.push_back(std::vector<SCValue>{s.position.azimuth, s.position.elevation,
                                                     s.position.distance});
        }
        return SCObject("FoaDecode")
            .withMethod("ar")
            .arg(SCValue::symbol("encoded_input"))
            .arg(matrixArgument(matrix))
            .prop("decoder_type", method)
            .prop("num_speakers", numSpeakers)
            .prop("speaker_positions", std::move(positions))
            .prop("order", 1)
            .prop("comment", "FOA decoder: " + method + " method, "
                             + std::to_string(numSpeakers) + " speakers");
    }

    return SCObject("HoaDecode")
        .withMethod("ar")
        .arg(order)
        .arg(numSpeakers)
        .arg(SCValue::symbol("encoded_input"))
        .arg(matrixArgument(matrix))
        .prop("decoder_type", method)
        .prop("channels", channelCount3D(order))
        .prop("comment", "HOA decoder: order " + std::to_string(order) + ", " + method
                         + " method, " + std::to_string(numSpeakers) + " speakers");
}

HoaDecoderMatrix HOAConverter::computeFoaDecoderMatrix(const SpeakerArray &array) {
    if (array.speakers.empty()) {
        throw ConversionError::missingAttribute("speakers");
    }

    HoaDecoderMatrix m;
    m.order = 1;

    const float scale = 1.0f / float(array.speakers.size());
    for (const auto &s : array.speakers) {
        float az = s.position.azimuth * float(M_PI) / 180.0f;
        float el = s.position.elevation * float(M_PI) / 180.0f;
        m.rows.push_back({
            scale,                                   // W
            scale * std::sin(az) * std::cos(el),     // Y
            scale * std::sin(el),                    // Z
            scale * std::cos(az) * std::cos(el)      // X
        });
    }
    return m;
}

// ============================================================================
// Transforms
// ============================================================================

SCObject HOAConverter::generateRotation(int order) {
    checkOrder(order);

    if (order == 1) {
        return SCObject("FoaRotate")
            .withMethod("ar")
            .arg(SCValue::symbol("encoded_input"))
            .arg(SCValue::symbol("azimuth"))
            .arg(SCValue::symbol("elevation"))
            .arg(SCValue::symbol("roll"))
            .prop("order", 1)
            .prop("comment", "FOA rotation transform");
    }

    return SCObject("HoaRotate")
        .withMethod("ar")
        .arg(order)
        .arg(SCValue::symbol("encoded_input"))
        .arg(SCValue::symbol("azimuth"))
        .arg(SCValue::symbol("elevation"))
        .arg(SCValue::symbol("roll"))
        .prop("order", order)
        .prop("comment", "HOA rotation transform, order " + std::to_string(order));
}

SCObject HOAConverter::generateBinauralDecoder(int order, HrtfType hrtf) {
    checkOrder(order);
    std::string method = hrtfTypeName(hrtf);

    if (order == 1) {
        return SCObject("FoaDecode")
            .withMethod("ar")
            .arg(SCValue::symbol("encoded_input"))
            .arg("binaural")
            .prop("hrtf_type", method)
            .prop("order", 1)
            .prop("channels", 2)
            .prop("comment", "FOA binaural decoder: " + method);
    }

    return SCObject("HoaBinaural")
        .withMethod("ar")
        .arg(order)
        .arg(SCValue::symbol("encoded_input"))
        .prop("hrtf_type", method)
        .prop("order", order)
        .prop("channels", 2)
        .prop("comment", "HOA binaural decoder: " + method + ", order " + std::to_string(order));
}

SCObject HOAConverter::generateMirror(int order, HoaMirrorAxis axis) {
    checkOrder(order);
    std::string name = mirrorAxisName(axis);

    if (order == 1) {
        return SCObject("FoaMirror")
            .withMethod("ar")
            .arg(SCValue::symbol("encoded_input"))
            .arg(name)
            .prop("order", 1)
            .prop("comment", "FOA mirror transform: " + name + " axis");
    }

    return SCObject("HoaMirror")
        .withMethod("ar")
        .arg(order)
        .arg(SCValue::symbol("encoded_input"))
        .arg(name)
        .prop("order", order)
        .prop("comment", "HOA mirror transform: " + name + " axis, order " + std::to_string(order));
}

SCObject HOAConverter::generateFocus(int order, HoaFocusType type) {
    checkOrder(order);
    std::string method = focusTypeName(type);

    SCObject focus(order == 1 ? "FoaFocus" : "HoaFocus");
    focus.withMethod("ar");
    if (order > 1) focus.arg(order);
    focus.arg(SCValue::symbol("encoded_input"))
        .arg(SCValue::symbol("azimuth"))
        .arg(SCValue::symbol("elevation"))
        .arg(SCValue::symbol("focus_amount"))
        .prop("focus_type", method)
        .prop("order", order);

    if (order == 1) return focus.prop("comment", "FOA focus transform: " + method);
    return focus.prop("comment", "HOA focus transform: " + method + ", order " + std::to_string(order));
}

SCObject HOAConverter::generateNearFieldCompensation(int order) {
    checkOrder(order);

    if (order == 1) {
        return SCObject("FoaNFC")
            .withMethod("ar")
            .arg(SCValue::symbol("encoded_input"))
            .arg(SCValue::symbol("distance"))
            .prop("order", 1)
            .prop("comment", "FOA near-field compensation");
    }

    return SCObject("HoaNFC")
        .withMethod("ar")
        .arg(order)
        .arg(SCValue::symbol("encoded_input"))
        .arg(SCValue::symbol("distance"))
        .prop("order", order)
        .prop("comment", "HOA near-field compensation, order " + std::to_string(order));
}

SCObject HOAConverter::generateOrderConverter(int fromOrder, int toOrder) {
    checkOrder(fromOrder);
    checkOrder(toOrder);

    if (fromOrder == toOrder) {
        return SCObject("Through")
            .withMethod("ar")
            .arg(SCValue::symbol("input"))
            .prop("comment", "Pass-through (same order)");
    }

    return SCObject("HoaConvert")
        .withMethod("ar")
        .arg(fromOrder)
        .arg(toOrder)
        .arg(SCValue::symbol("encoded_input"))
        .prop("from_order", fromOrder)
        .prop("to_order", toOrder)
        .prop("channels", channelCount3D(toOrder))
        .prop("comment", "HOA format converter: order " + std::to_string(fromOrder) + " to "
                         + std::to_string(toOrder));
}

// ============================================================================
// Order selection and validation
// ============================================================================

int HOAConverter::calculateOptimalOrder(size_t numSpeakers) {
    int order = int(std::sqrt(float(numSpeakers) / 4.0f));
    return std::clamp(order, 1, 7);
}

int HOAConverter::calculateOptimalOrder(const SpeakerArray &array) {
    return calculateOptimalOrder(array.speakers.size());
}

int HOAConverter::calculateRecommendedOrder(size_t numSpeakers) {
    int order = int(std::sqrt(float(numSpeakers) / 8.0f));
    return std::clamp(order, 1, 5);
}

HoaValidationResult HOAConverter::validateHoaConfig(int order, size_t numSpeakers) {
    HoaValidationResult result;
    result.recommendedOrder = calculateRecommendedOrder(numSpeakers);

    size_t o = size_t(std::max(order, 0));
    size_t minSpeakers = (o + 1) * (o + 1);
    size_t recommendedSpeakers = minSpeakers * 2;

    if (order > kMaxOrder) {
        result.isValid = false;
        result.errors.push_back("Order " + std::to_string(order) + " exceeds the maximum order "
                                + std::to_string(kMaxOrder));
    } else if (numSpeakers < minSpeakers) {
        result.isValid = false;
        result.errors.push_back("Order " + std::to_string(order) + " requires at least "
                                + std::to_string(minSpeakers) + " speakers, but only "
                                + std::to_string(numSpeakers) + " available");
    } else if (numSpeakers < recommendedSpeakers) {
        result.warnings.push_back("Order " + std::to_string(order) + " works best with "
                                  + std::to_string(recommendedSpeakers) + " speakers, only "
                                  + std::to_string(numSpeakers) + " available");
    }
    return result;
}
