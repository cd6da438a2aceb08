// SpatialObjectConverter - per-box translation of panners and spat5 objects
//
// Covers the classic Max panners (pan~ ... pan8~, stereo~, matrix~) and the
// spat5 family one box at a time. The layout-driven WFS / VBAP / HOA
// converters still own the speaker setup; ConversionPipeline skips the
// boxes they already handle. Unknown spat5 objects become SPAT5_Placeholder.

#pragma once

#include <optional>

#include "SCObject.hpp"
#include "HOAConverter.hpp"
#include "../ObjectLexer.hpp"
#include "../PatchLoader.hpp"

class SpatialObjectConverter {
public:
    /// nullopt for objects outside the panner / spat5 set and for spat5.osc.route.
    /// Throws ConversionError for an invalid order, count or transform name.
    static std::optional<SCObject> convert(const ObjectKind &kind, const PatchBox &box);

    // ---- classic panners ----

    // Max position 0..1 (left..right) -> Pan2 position -1..1
    static SCObject convertPan(const ObjectKind &kind);
    static SCObject convertPan4(const ObjectKind &kind);
    static SCObject convertPan8(const ObjectKind &kind);
    static SCObject convertStereo();
    static SCObject convertMatrix(const ObjectKind &kind, int numInlets, int numOutlets);

    // ---- spat5 ----

    static SCObject convertPanoramix(const ObjectKind &kind);
    static SCObject convertSpatPan(const ObjectKind &kind);
    static SCObject convertSpatStereo();
    static SCObject convertHoaEncoder(const ObjectKind &kind);
    static SCObject convertHoaDecoder(const ObjectKind &kind);
    static SCObject convertHoaTransform(const ObjectKind &kind);
    static SCObject convertVbap(const ObjectKind &kind);
    static SCObject convertReverb(const ObjectKind &kind);
    static SCObject convertEarlyReflections(const ObjectKind &kind);
    static SCObject placeholder(const std::string &name, int channels);

    /// "x", "y", "z", "xy", "yz", "xz"; throws ConversionError::invalidParameter("mirror_axis") otherwise
    static HoaMirrorAxis parseMirrorAxis(const std::string &word);
    /// "push", "press", "zoom"; throws ConversionError::invalidParameter("focus_type") otherwise
    static HoaFocusType parseFocusType(const std::string &word);
};
