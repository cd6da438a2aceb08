#include "OSCResponderGen.hpp"
#include "../ObjectLexer.hpp"
#include <cctype>
#include <iostream>
#include <set>

static OSCResponder sourceResponder() {
    return {"/source/*/xyz",
R"({ |msg|
    var sourceID = msg[0].asString.split($/).at(2).asInteger;
    if(~sources.notNil and: { ~sources[sourceID].notNil }, {
        ~sources[sourceID].set(\x, msg[1], \y, msg[2], \z, msg[3]);
    });
})"};
}

static OSCResponder speakerResponder() {
    return {"/speaker/*/gain",
R"({ |msg|
    var speakerID = msg[0].asString.split($/).at(2).asInteger;
    if(~speakers.notNil and: { ~speakers[speakerID].notNil }, {
        ~speakers[speakerID].set(\gain, msg[1].dbamp);
    });
})"};
}

static OSCResponder masterResponder() {
    return {"/master/*",
R"({ |msg|
    var param = msg[0].asString.split($/).last;
    switch(param,
        "gain", { ~masterBus.set(\gain, msg[1].dbamp) },
        "mute", { ~masterBus.set(\mute, msg[1]) },
        "bypass", { ~masterBus.set(\bypass, msg[1]) }
    );
})"};
}

std::string OSCResponderGen::sanitizeId(const std::string &id) {
    std::string out = id;
    for (char &c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    }
    return out;
}

std::vector<OSCResponder> OSCResponderGen::generateResponders(const PatchData &patch) {
    std::vector<OSCResponder> responders = {sourceResponder(), speakerResponder(), masterResponder()};

    std::set<std::string> seen;
    for (const auto &r : responders) seen.insert(r.address);

    for (const auto &box : patch.boxes) {
        ObjectKind kind = ObjectLexer::lex(box.maxclass, box.text);
        if (kind.category != ObjectCategory::SpatOscRoute) continue;

        for (const auto &arg : kind.args) {
            if (arg.empty() || arg[0] != '/') continue;
            if (!seen.insert(arg).second) {
                std::cerr << "[OSCGen] Warning: address " << arg << " routed twice, keeping the first\n";
                continue;
            }
            responders.push_back({arg, "{ |msg| ~handle_" + sanitizeId(box.id) + ".value(msg) }"});
        }
    }

    std::cout << "[OSCGen] " << responders.size() << " OSC responders\n";
    return responders;
}

std::string OSCResponderGen::renderSetupCode(const std::vector<OSCResponder> &responders, int port) {
    std::string code =
        "(\n"
        "    if(~oscResponders.notNil, { ~oscResponders.do(_.free) });\n"
        "    ~oscResponders = List.new;\n";

    for (const auto &r : responders) {
        code += "    ~oscResponders.add(OSCFunc(" + r.action + ", '" + r.address
              + "', recvPort: " + std::to_string(port) + "));\n";
    }

    code += ")\n";
    return code;
}
