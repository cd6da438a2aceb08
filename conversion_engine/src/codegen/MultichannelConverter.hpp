// MultichannelConverter - mc.* boxes
//
// A multichannel patch cord becomes a plain channel array on the generated
// side: mc.pack~ / mc.unpack~ mark where arrays are built and indexed,
// mc.dac~ / mc.adc~ address one bus per channel.

#pragma once

#include <optional>

#include "SCObject.hpp"
#include "../ObjectLexer.hpp"
#include "../PatchLoader.hpp"

class MultichannelConverter {
public:
    /// nullopt for anything other than mc.pack~, mc.unpack~, mc.dac~, mc.adc~ and mc.live.gain~.
    /// Throws ConversionError: invalidParameter for a bad channel or count,
    /// missingAttribute("channels") for mc.dac~ / mc.adc~ with neither arguments nor connections.
    static std::optional<SCObject> convert(const ObjectKind &kind, const PatchBox &box);

    static SCObject convertPack(const ObjectKind &kind);
    static SCObject convertUnpack(const ObjectKind &kind);
    static SCObject convertDac(const ObjectKind &kind, int numInlets);
    static SCObject convertAdc(const ObjectKind &kind, int numOutlets);
    static SCObject convertLiveGain(const ObjectKind &kind);

    static float dbToLinear(float db);
};
