#include "AudioIOConverter.hpp"
#include "BoxArguments.hpp"
#include "../ConversionErrors.hpp"

static std::vector<SCValue> channelArray(const std::vector<int> &channels) {
    return std::vector<SCValue>(channels.begin(), channels.end());
}

static SCValue stereoPair() {
    return std::vector<SCValue>{SCValue::symbol("inputL"), SCValue::symbol("inputR")};
}

static bool isDefaultStereo(const std::vector<int> &channels) {
    return channels.size() == 2 && channels[0] == 0 && channels[1] == 1;
}

std::optional<SCObject> AudioIOConverter::convert(const ObjectKind &kind) {
    if (kind.name == "dac~") return convertDac(kind);
    if (kind.name == "adc~") return convertAdc(kind);
    if (kind.name == "ezdac~") return convertEzDac();
    if (kind.name == "ezadc~") return convertEzAdc();
    if (kind.name == "out~") return convertOutlet(kind);
    if (kind.name == "in~") return convertInlet(kind);
    return std::nullopt;
}

SCObject AudioIOConverter::convertDac(const ObjectKind &kind) {
    std::vector<int> channels = BoxArguments::channelList(kind);
    if (channels.empty()) channels = {0, 1};

    if (channels.size() == 1) {
        return SCObject("Out").withMethod("ar").arg(channels[0]).arg(SCValue::symbol("input"));
    }
    if (isDefaultStereo(channels)) {
        return SCObject("Out").withMethod("ar").arg(0).arg(stereoPair());
    }
    return SCObject("Out").withMethod("ar").arg(channelArray(channels)).arg(SCValue::symbol("input"));
}

SCObject AudioIOConverter::convertAdc(const ObjectKind &kind) {
    std::vector<int> channels = BoxArguments::channelList(kind);
    if (channels.empty()) channels = {0, 1};

    if (channels.size() == 1) {
        return SCObject("SoundIn").withMethod("ar").arg(channels[0]);
    }
    return SCObject("SoundIn").withMethod("ar").arg(channelArray(channels));
}

SCObject AudioIOConverter::convertEzDac() {
    return SCObject("Out")
        .withMethod("ar")
        .arg(0)
        .arg(stereoPair())
        .prop("comment", "ezdac~ - simple stereo output");
}

SCObject AudioIOConverter::convertEzAdc() {
    return SCObject("SoundIn")
        .withMethod("ar")
        .arg(std::vector<SCValue>{0, 1})
        .prop("comment", "ezadc~ - simple stereo input");
}

SCObject AudioIOConverter::convertOutlet(const ObjectKind &kind) {
    int outlet = BoxArguments::intAt(kind, 0, "outlet", 1);
    if (outlet < 1) throw ConversionError::invalidParameter("outlet", float(outlet));

    return SCObject("Out")
        .withMethod("ar")
        .arg(outlet - 1)
        .arg(SCValue::symbol("signal"))
        .prop("comment", "out~ " + std::to_string(outlet));
}

SCObject AudioIOConverter::convertInlet(const ObjectKind &kind) {
    int inlet = BoxArguments::intAt(kind, 0, "inlet", 1);
    if (inlet < 1) throw ConversionError::invalidParameter("inlet", float(inlet));

    return SCObject("In")
        .withMethod("ar")
        .arg(inlet - 1)
        .prop("comment", "in~ " + std::to_string(inlet));
}
