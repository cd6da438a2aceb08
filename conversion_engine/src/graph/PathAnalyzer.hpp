// PathAnalyzer - audio sources, sinks and signal chains over a built graph
//
// Only edges classified ConnectionType::Audio take part in chain search.
// Search is one bounded BFS per source: every sink reachable within
// PathSearchLimits::maxDepth audio edges gets its shortest path reported.

#pragma once

#include <vector>

#include "SignalFlowGraph.hpp"
#include "../ConversionTypes.hpp"

struct SignalChain {
    NodeIndex source;
    NodeIndex sink;
    std::vector<NodeIndex> path;   // source ... sink inclusive, every hop an Audio edge
};

struct GraphSummary {
    size_t nodes = 0;
    size_t edges = 0;
    size_t audioSources = 0;
    size_t audioSinks = 0;
    size_t controlObjects = 0;     // UI widgets plus message-rate objects
    size_t audioEdges = 0;
    size_t controlEdges = 0;
    size_t messageEdges = 0;
};

class PathAnalyzer {
public:
    // Generator/input objects with no incoming Audio edge
    static std::vector<NodeIndex> getAudioSources(const SignalFlowGraph &graph);

    // Output objects with no outgoing Audio edge
    static std::vector<NodeIndex> getAudioSinks(const SignalFlowGraph &graph);

    // spat5 objects and stereo panners
    static std::vector<NodeIndex> getSpatialNodes(const SignalFlowGraph &graph);

    /// Enumerate (source, sink) chains connected by Audio edges only.
    /// Chains come out ordered by source, then by BFS discovery order of the sink.
    /// Stops (with a warning) once limits.maxChains chains have been found.
    static std::vector<SignalChain> analyzeSignalChains(const SignalFlowGraph &graph,
                                                        const PathSearchLimits &limits = PathSearchLimits{},
                                                        bool verbose = false);

    static GraphSummary summarize(const SignalFlowGraph &graph);
};
