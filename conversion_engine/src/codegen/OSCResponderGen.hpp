#pragma once

#include <string>
#include <vector>

#include "../PatchLoader.hpp"

struct OSCResponder {
    std::string address;   // OSC path pattern, e.g. "/source/*/xyz"
    std::string action;    // handler function body in the target language
};

// Remote-control responders: the built-in source/speaker/master set plus one
// per address routed by a spat5.osc.route box.
class OSCResponderGen {
public:
    static std::vector<OSCResponder> generateResponders(const PatchData &patch);

    // OSCFunc registration block for a list of responders
    static std::string renderSetupCode(const std::vector<OSCResponder> &responders, int port = 57120);

    // Box id made safe for a variable name ("obj-3" -> "obj_3")
    static std::string sanitizeId(const std::string &id);
};
