// AudioIOConverter - hardware and subpatch I/O boxes
//
//   dac~ 1 2    -> Out.ar(0, [\inputL, \inputR])
//   dac~ 3      -> Out.ar(2, \input)
//   adc~ 1 3 5  -> SoundIn.ar([0, 2, 4])
//   out~ 2      -> Out.ar(1, \signal)
//
// Max channel numbers are 1-based, the generated ones 0-based.

#pragma once

#include <optional>

#include "SCObject.hpp"
#include "../ObjectLexer.hpp"

class AudioIOConverter {
public:
    /// nullopt for anything that is not dac~, adc~, ezdac~, ezadc~, out~ or in~.
    /// Throws ConversionError::invalidParameter for a channel, inlet or outlet below 1.
    static std::optional<SCObject> convert(const ObjectKind &kind);

    static SCObject convertDac(const ObjectKind &kind);
    static SCObject convertAdc(const ObjectKind &kind);
    static SCObject convertEzDac();
    static SCObject convertEzAdc();
    static SCObject convertOutlet(const ObjectKind &kind);
    static SCObject convertInlet(const ObjectKind &kind);
};
