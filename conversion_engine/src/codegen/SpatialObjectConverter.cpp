#include "SpatialObjectConverter.hpp"
#include "BoxArguments.hpp"
#include "../ConversionErrors.hpp"

static const std::string kPlaceholderClass = "SPAT5_Placeholder";
static constexpr int kMaxCount = 128;

static SCValue sym(const std::string &name) {
    return SCValue::symbol(name);
}

// Positional count, else the @attribute, else fallback; valid range [1, 128]
static int countArgument(const ObjectKind &kind, size_t index, const std::string &name, int fallback) {
    float n = float(fallback);
    if (index < BoxArguments::positional(kind).size()) {
        n = float(BoxArguments::intAt(kind, index, name, fallback));
    } else if (auto attr = BoxArguments::attribute(kind, name)) {
        n = *attr;
    }
    if (!(n >= 1.0f && n <= float(kMaxCount))) throw ConversionError::invalidParameter(name, n);
    return int(n);
}

std::optional<SCObject> SpatialObjectConverter::convert(const ObjectKind &kind, const PatchBox &box) {
    const std::string &name = kind.name;

    if (name == "pan~" || name == "pan2~") return convertPan(kind);
    if (name == "pan4~") return convertPan4(kind);
    if (name == "pan8~") return convertPan8(kind);
    if (name == "stereo~") return convertStereo();
    if (name == "matrix~") return convertMatrix(kind, box.numInlets, box.numOutlets);

    if (!isSpatFamily(kind)) return std::nullopt;

    if (name == "spat5.osc.route") return std::nullopt;
    if (name == "spat5.panoramix~") return convertPanoramix(kind);
    if (name == "spat5.pan~") return convertSpatPan(kind);
    if (name == "spat5.stereo~") return convertSpatStereo();
    if (name == "spat5.hoa.encoder~") return convertHoaEncoder(kind);
    if (name == "spat5.hoa.decoder~") return convertHoaDecoder(kind);
    if (name == "spat5.hoa.rotate~" || name == "spat5.hoa.mirror~" || name == "spat5.hoa.focus~"
        || name == "spat5.hoa.nfc~" || name == "spat5.hoa.converter~") {
        return convertHoaTransform(kind);
    }
    if (name == "spat5.vbap~") return convertVbap(kind);
    if (name == "spat5.reverb~") return convertReverb(kind);
    if (name == "spat5.early~") return convertEarlyReflections(kind);

    return placeholder(name, box.numOutlets);
}

// ============================================================================
// Classic panners
// ============================================================================

SCObject SpatialObjectConverter::convertPan(const ObjectKind &kind) {
    float pos = BoxArguments::floatAt(kind, 0, 0.5f);
    return SCObject("Pan2")
        .withMethod("ar")
        .arg(sym("input"))
        .arg(pos * 2.0f - 1.0f)
        .arg(1.0f)
        .prop("comment", kind.name);
}

SCObject SpatialObjectConverter::convertPan4(const ObjectKind &kind) {
    return SCObject("Pan4")
        .withMethod("ar")
        .arg(sym("input"))
        .arg(BoxArguments::floatAt(kind, 0, 0.0f))
        .arg(BoxArguments::floatAt(kind, 1, 0.0f))
        .arg(1.0f)
        .prop("comment", "pan4~");
}

// 8-channel circular panning; PanAz position 0..2 covers the circle
SCObject SpatialObjectConverter::convertPan8(const ObjectKind &kind) {
    float pos = BoxArguments::floatAt(kind, 0, 0.0f);
    return SCObject("PanAz")
        .withMethod("ar")
        .arg(8)
        .arg(sym("input"))
        .arg(pos * 2.0f)
        .arg(1.0f)     // level
        .arg(2.0f)     // width
        .arg(0)        // orientation
        .prop("comment", "pan8~");
}

SCObject SpatialObjectConverter::convertStereo() {
    return SCObject("Array")
        .arg(sym("inputL"))
        .arg(sym("inputR"))
        .prop("comment", "stereo~");
}

SCObject SpatialObjectConverter::convertMatrix(const ObjectKind &kind, int numInlets, int numOutlets) {
    int ins = BoxArguments::intAt(kind, 0, "matrix_inputs", numInlets);
    int outs = BoxArguments::intAt(kind, 1, "matrix_outputs", numOutlets);
    if (ins < 1) throw ConversionError::invalidParameter("matrix_inputs", float(ins));
    if (outs < 1) throw ConversionError::invalidParameter("matrix_outputs", float(outs));

    return SCObject("Matrix")
        .withMethod("ar")
        .arg(ins)
        .arg(outs)
        .arg(sym("input"))
        .prop("comment", "matrix~ " + std::to_string(ins) + "x" + std::to_string(outs));
}

// ============================================================================
// spat5
// ============================================================================

SCObject SpatialObjectConverter::convertPanoramix(const ObjectKind &kind) {
    int inputs = countArgument(kind, 0, "inputs", 1);
    int outputs = countArgument(kind, 1, "outputs", 8);

    return SCObject("SpatPanoramix")
        .withMethod("ar")
        .arg(sym("input"))
        .arg(inputs)
        .arg(outputs)
        .arg(std::vector<SCValue>{sym("azimuth"), sym("elevation"), sym("distance")})
        .prop("format", "VBAP")
        .prop("room_model", "basic")
        .prop("reverb_enable", true)
        .prop("early_reflections", true)
        .prop("comment", "spat5.panoramix~ - main spatialization engine");
}

SCObject SpatialObjectConverter::convertSpatPan(const ObjectKind &kind) {
    int outputs = countArgument(kind, 0, "outputs", 8);
    return SCObject("VBAP")
        .withMethod("ar")
        .arg(outputs)
        .arg(sym("input"))
        .arg(sym("azimuth"))
        .arg(sym("elevation"))
        .arg(sym("spread"))
        .prop("comment", "spat5.pan~");
}

SCObject SpatialObjectConverter::convertSpatStereo() {
    return SCObject("Splay")
        .withMethod("ar")
        .arg(sym("input"))
        .arg(1.0f)    // spread
        .arg(1.0f)    // level
        .arg(0.0f)    // center
        .prop("comment", "spat5.stereo~");
}

SCObject SpatialObjectConverter::convertHoaEncoder(const ObjectKind &kind) {
    return HOAConverter::generateEncoder(BoxArguments::intAt(kind, 0, "order", 1), 3);
}

// Layout-free decoder: the matrix stays symbolic
SCObject SpatialObjectConverter::convertHoaDecoder(const ObjectKind &kind) {
    int order = BoxArguments::intAt(kind, 0, "order", 1);
    int speakers = countArgument(kind, 1, "speakers", 8);
    HOAConverter::checkOrder(order);

    if (order == 1) {
        return SCObject("FoaDecode")
            .withMethod("ar")
            .arg(sym("encoded_input"))
            .arg(sym("decoder_matrix"))
            .prop("num_speakers", speakers)
            .prop("comment", "spat5.hoa.decoder~ (FOA)");
    }

    return SCObject("HoaDecode")
        .withMethod("ar")
        .arg(order)
        .arg(speakers)
        .arg(sym("encoded_input"))
        .prop("comment", "spat5.hoa.decoder~ (order " + std::to_string(order) + ")");
}

//   spat5.hoa.rotate~ [order]
//   spat5.hoa.mirror~ [order] [axis]
//   spat5.hoa.focus~ [order] [push|press|zoom]
//   spat5.hoa.nfc~ [order]
//   spat5.hoa.converter~ [from] [to]
SCObject SpatialObjectConverter::convertHoaTransform(const ObjectKind &kind) {
    int order = BoxArguments::intAt(kind, 0, "order", 1);

    if (kind.name == "spat5.hoa.mirror~") {
        return HOAConverter::generateMirror(order, parseMirrorAxis(BoxArguments::wordAt(kind, 1, "x")));
    }
    if (kind.name == "spat5.hoa.focus~") {
        return HOAConverter::generateFocus(order, parseFocusType(BoxArguments::wordAt(kind, 1, "push")));
    }
    if (kind.name == "spat5.hoa.nfc~") {
        return HOAConverter::generateNearFieldCompensation(order);
    }
    if (kind.name == "spat5.hoa.converter~") {
        return HOAConverter::generateOrderConverter(order, BoxArguments::intAt(kind, 1, "to_order", order));
    }
    return HOAConverter::generateRotation(order);
}

SCObject SpatialObjectConverter::convertVbap(const ObjectKind &kind) {
    int speakers = countArgument(kind, 0, "speakers", 8);
    return SCObject("VBAP")
        .withMethod("ar")
        .arg(speakers)
        .arg(sym("input"))
        .arg(sym("azimuth"))
        .arg(sym("elevation"))
        .arg(sym("spread"))
        .prop("speaker_setup", "ring")
        .prop("comment", "spat5.vbap~");
}

SCObject SpatialObjectConverter::convertReverb(const ObjectKind &kind) {
    int outputs = countArgument(kind, 0, "outputs", 2);

    SCObject reverb("JPverb");
    reverb.withMethod("ar").arg(sym("input"));
    for (const char *control : {"rt60", "damping", "size", "early_diff", "mod_depth", "mod_freq",
                                "low", "mid", "high", "hf_damping"}) {
        reverb.arg(sym(control));
    }
    return reverb.prop("num_outputs", outputs).prop("comment", "spat5.reverb~");
}

SCObject SpatialObjectConverter::convertEarlyReflections(const ObjectKind &kind) {
    int taps = countArgument(kind, 0, "taps", 8);
    return SCObject("EarlyReflections")
        .withMethod("ar")
        .arg(sym("input"))
        .arg(taps)
        .arg(sym("room_size"))
        .arg(sym("damping"))
        .arg(std::vector<SCValue>{sym("delay_times"), sym("gains"), sym("pan_positions")})
        .prop("comment", "spat5.early~ - early reflections");
}

SCObject SpatialObjectConverter::placeholder(const std::string &name, int channels) {
    return SCObject(kPlaceholderClass)
        .arg(name)
        .prop("channels", channels)
        .prop("comment", name + " - needs implementation");
}

HoaMirrorAxis SpatialObjectConverter::parseMirrorAxis(const std::string &word) {
    if (word == "x") return HoaMirrorAxis::X;
    if (word == "y") return HoaMirrorAxis::Y;
    if (word == "z") return HoaMirrorAxis::Z;
    if (word == "xy") return HoaMirrorAxis::XY;
    if (word == "yz") return HoaMirrorAxis::YZ;
    if (word == "xz") return HoaMirrorAxis::XZ;
    throw ConversionError::invalidParameter("mirror_axis", 0.0f);
}

HoaFocusType SpatialObjectConverter::parseFocusType(const std::string &word) {
    if (word == "push") return HoaFocusType::Push;
    if (word == "press") return HoaFocusType::Press;
    if (word == "zoom") return HoaFocusType::Zoom;
    throw ConversionError::invalidParameter("focus_type", 0.0f);
}
