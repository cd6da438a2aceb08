// ConversionPipeline - one conversion run, patch in, parameter objects out
//
//   PatchData ──► SignalFlowGraphBuilder ──► PathAnalyzer (chains, summary)
//       │
//       └──────► SpatialAnalyzer (+ SpeakerConfigData) ──► method
//                                                         │
//                         WFSConverter / VBAPConverter / HOAConverter
//                                                         │
//       per box: AudioIO / Multichannel / SpatialObject ──┤
//                                                         │
//                                        OSCResponderGen ─┴─► ConversionResult
//
// AnalysisError from graph construction propagates to the caller.
// ConversionError from a converter is recorded in result.errors and the
// run continues with the next object.

#pragma once

#include <string>
#include <vector>

#include "ConversionTypes.hpp"
#include "PatchLoader.hpp"
#include "SpeakerConfigLoader.hpp"
#include "graph/SignalFlowGraph.hpp"
#include "graph/PathAnalyzer.hpp"
#include "spatial/SpatialAnalyzer.hpp"
#include "codegen/SCObject.hpp"
#include "codegen/VBAPConverter.hpp"
#include "codegen/HOAConverter.hpp"
#include "codegen/OSCResponderGen.hpp"

// One box translated on its own (I/O, panners, mc.*, spat5 objects)
struct BoxConversion {
    std::string boxId;
    SCObject object;
};

struct ConversionResult {
    SignalFlowGraph graph;
    GraphSummary summary;
    std::vector<SignalChain> chains;
    SpatialConfig spatialConfig;

    std::vector<SCObject> objects;              // layout-driven converter output, in emission order
    std::vector<BoxConversion> boxObjects;      // per-box translations, in patch order
    std::vector<VbapValidationResult> vbapValidation;
    std::vector<HoaValidationResult> hoaValidation;
    std::vector<OSCResponder> oscResponders;

    std::vector<std::string> warnings;
    std::vector<std::string> errors;            // recorded ConversionErrors and failed validations
};

class ConversionPipeline {
public:
    static ConversionResult run(const PatchData &patch,
                                const SpeakerConfigData *speakerConfig,
                                const ConversionOptions &options = ConversionOptions{});

    // One line per generated object, then per box, then the OSC setup block (if any)
    static std::string render(const ConversionResult &result);

private:
    static void convertWfs(const ConversionOptions &options, ConversionResult &result);
    static void convertVbap(const ConversionOptions &options, ConversionResult &result);
    static void convertHoa(const ConversionOptions &options, ConversionResult &result);
    static void convertBoxes(const PatchData &patch, const ConversionOptions &options,
                             ConversionResult &result);
};
