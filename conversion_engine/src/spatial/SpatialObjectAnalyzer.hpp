#pragma once

#include <string>
#include <vector>

#include "SpatialTypes.hpp"
#include "../ObjectLexer.hpp"
#include "../PatchLoader.hpp"

// Scans patch boxes (independently of the signal flow graph) for spat5
// objects and infers the signal format each one produces.
// Boxes that are not spat5 objects are skipped, never errors.
class SpatialObjectAnalyzer {
public:
    static std::vector<SpatialObject> analyzeSpatialObjects(const PatchData &patch, bool verbose = false);

    // Single box; returns false if the box is not a spatial object
    static bool analyzeBox(const PatchBox &box, SpatialObject &out);

    // "@name value" pairs known to the attribute table, in text order
    static std::vector<SpatialParameter> extractParameters(const ObjectKind &kind);
};
