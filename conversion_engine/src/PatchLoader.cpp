#include "PatchLoader.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <iostream>

using json = nlohmann::json;

// Helper to read an integer field that may be missing, mistyped or out of int range
static int intField(const json &obj, const char *key, int fallback) {
    if (!obj.contains(key) || !obj[key].is_number()) return fallback;
    double v = obj[key].get<double>();
    if (!std::isfinite(v) || v < double(std::numeric_limits<int>::min())
        || v > double(std::numeric_limits<int>::max())) {
        std::cerr << "[PatchLoader] Warning: " << key << " " << v << " out of range, using "
                  << fallback << "\n";
        return fallback;
    }
    return static_cast<int>(v);
}

static bool parseBox(const json &content, PatchBox &box) {
    if (!content.contains("id") || !content["id"].is_string()) {
        return false;
    }
    box.id = content["id"].get<std::string>();

    if (content.contains("maxclass") && content["maxclass"].is_string()) {
        box.maxclass = content["maxclass"].get<std::string>();
    }

    if (content.contains("text") && content["text"].is_string()) {
        box.text = content["text"].get<std::string>();
    }

    box.numInlets = intField(content, "numinlets", 0);
    box.numOutlets = intField(content, "numoutlets", 0);

    if (content.contains("patching_rect") && content["patching_rect"].is_array()
        && content["patching_rect"].size() == 4) {
        std::array<float, 4> rect{};
        bool ok = true;
        for (size_t i = 0; i < 4; i++) {
            if (!content["patching_rect"][i].is_number()) { ok = false; break; }
            rect[i] = content["patching_rect"][i].get<float>();
        }
        if (ok) box.patchingRect = rect;
    }
    return true;
}

PatchData PatchLoader::fromJson(const json &doc) {
    PatchData d;

    // Accept both a full document and a bare "patcher" object
    const json &patcher = doc.contains("patcher") ? doc["patcher"] : doc;

    if (!patcher.is_object()) {
        std::cerr << "[PatchLoader] Warning: document has no 'patcher' object\n";
        return d;
    }

    int droppedBoxes = 0;

    if (patcher.contains("boxes") && patcher["boxes"].is_array()) {
        for (auto &entry : patcher["boxes"]) {
            // Boxes are wrapped: {"box": {...}}
            const json &content = entry.contains("box") ? entry["box"] : entry;
            PatchBox box;
            if (!content.is_object() || !parseBox(content, box)) {
                droppedBoxes++;
                continue;
            }
            d.boxes.push_back(box);
        }
    } else {
        std::cerr << "[PatchLoader] Warning: patcher has no 'boxes' array\n";
    }

    if (patcher.contains("lines") && patcher["lines"].is_array()) {
        for (auto &entry : patcher["lines"]) {
            const json &content = entry.contains("patchline") ? entry["patchline"] : entry;
            PatchLine line;
            // keep missing endpoints as null so routing validation reports them
            if (content.is_object()) {
                if (content.contains("source")) line.source = content["source"];
                if (content.contains("destination")) line.destination = content["destination"];
            }
            d.lines.push_back(line);
        }
    }

    if (droppedBoxes > 0) {
        std::cerr << "[PatchLoader] Warning: " << droppedBoxes
                  << " box(es) without a string id dropped\n";
    }

    std::cout << "[PatchLoader] Loaded patch: " << d.boxes.size() << " boxes, "
              << d.lines.size() << " lines\n";
    return d;
}

PatchData PatchLoader::parsePatch(const std::string &jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error &e) {
        throw std::runtime_error(std::string("Patch is not valid JSON: ") + e.what());
    }
    return fromJson(j);
}

PatchData PatchLoader::loadPatch(const std::string &path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot open patch JSON: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error &e) {
        throw std::runtime_error("Patch '" + path + "' is not valid JSON: " + e.what());
    }
    return fromJson(j);
}
