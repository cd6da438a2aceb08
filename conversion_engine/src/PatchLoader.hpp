#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PatchBox {
    std::string id;                   // unique within the patch ("obj-1")
    std::string maxclass = "newobj";  // object type tag
    std::optional<std::string> text;  // object name + arguments, absent for UI widgets
    int numInlets  = 0;
    int numOutlets = 0;
    std::optional<std::array<float, 4>> patchingRect;   // x, y, w, h
};

// Cable endpoints stay loosely typed: ["obj-1", 0] in a well-formed patch.
// SignalFlowGraphBuilder validates them, the loader does not.
struct PatchLine {
    nlohmann::json source;
    nlohmann::json destination;
};

struct PatchData {
    std::vector<PatchBox> boxes;
    std::vector<PatchLine> lines;
};

class PatchLoader {
public:
    /// Load a patch JSON file ({"patcher": {"boxes": [...], "lines": [...]}}).
    /// Throws std::runtime_error if the file can't be opened or isn't JSON.
    static PatchData loadPatch(const std::string &path);

    /// Same as loadPatch() but from an in-memory JSON string.
    static PatchData parsePatch(const std::string &jsonText);

    /// Build PatchData from an already parsed document.
    /// Boxes without a string id are dropped with a warning.
    static PatchData fromJson(const nlohmann::json &doc);
};
