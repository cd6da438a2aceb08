// SignalFlowGraph - typed directed graph of patch objects and cables
//
// Nodes are AudioNode (one per box), edges carry an AudioConnection (one per
// cable). Both are created once by SignalFlowGraphBuilder::build() and never
// mutated or removed afterwards; the graph only hands out const access.
//
// Node handles are plain indices into the node vector, stable for the
// lifetime of the graph. Edge order follows cable order in the patch.

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../ObjectLexer.hpp"
#include "../PatchLoader.hpp"

using NodeIndex = size_t;
using EdgeIndex = size_t;

enum class ConnectionType {
    Audio,
    Control,
    Message,
    Unknown
};

struct LayoutRect {
    float x = 0.0f, y = 0.0f, width = 0.0f, height = 0.0f;
};

struct AudioNode {
    std::string id;
    std::string objectType;               // maxclass
    std::optional<std::string> text;
    int numInlets  = 0;
    int numOutlets = 0;
    std::optional<LayoutRect> rect;
    ObjectKind kind;                      // lexed once from objectType + text
};

struct AudioConnection {
    int sourceOutlet = 0;
    int destInlet    = 0;
    ConnectionType connectionType = ConnectionType::Unknown;
};

struct GraphEdge {
    NodeIndex source;
    NodeIndex dest;
    AudioConnection connection;
};

class SignalFlowGraph {
public:
    size_t nodeCount() const { return mNodes.size(); }
    size_t edgeCount() const { return mEdges.size(); }

    const AudioNode &node(NodeIndex i) const { return mNodes.at(i); }
    const std::vector<AudioNode> &nodes() const { return mNodes; }

    const GraphEdge &edge(EdgeIndex e) const { return mEdges.at(e); }
    const std::vector<GraphEdge> &edges() const { return mEdges; }

    // Edge indices leaving / entering a node, in insertion order
    const std::vector<EdgeIndex> &outgoing(NodeIndex i) const { return mOutgoing.at(i); }
    const std::vector<EdgeIndex> &incoming(NodeIndex i) const { return mIncoming.at(i); }

    // Linear lookup by box id (analysis helper, not used during construction)
    std::optional<NodeIndex> findNode(const std::string &id) const;

    bool hasIncoming(NodeIndex i, ConnectionType type) const;
    bool hasOutgoing(NodeIndex i, ConnectionType type) const;

private:
    friend class SignalFlowGraphBuilder;

    NodeIndex addNode(const AudioNode &node);
    EdgeIndex addEdge(NodeIndex source, NodeIndex dest, const AudioConnection &conn);

    std::vector<AudioNode> mNodes;
    std::vector<GraphEdge> mEdges;
    std::vector<std::vector<EdgeIndex>> mOutgoing;
    std::vector<std::vector<EdgeIndex>> mIncoming;
};

class SignalFlowGraphBuilder {
public:
    /// Build the graph from a loaded patch.
    /// Pass 1 creates one node per box, pass 2 one classified edge per cable.
    /// Throws AnalysisError(InvalidRouting) for a malformed endpoint or an
    /// unknown box id; no partial graph is returned.
    static SignalFlowGraph build(const PatchData &patch, bool verbose = false);
};

class ConnectionClassifier {
public:
    /// Infer the cable type from its endpoints. Total and side-effect free:
    /// every pair maps to exactly one of Audio / Control / Message.
    static ConnectionType classify(const AudioNode &source, const AudioNode &dest);

    static std::string typeName(ConnectionType type);
};
