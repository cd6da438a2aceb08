#include "SignalFlowGraph.hpp"
#include "../ConversionErrors.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <unordered_map>

// ============================================================================
// SignalFlowGraph
// ============================================================================

NodeIndex SignalFlowGraph::addNode(const AudioNode &node) {
    mNodes.push_back(node);
    mOutgoing.emplace_back();
    mIncoming.emplace_back();
    return mNodes.size() - 1;
}

EdgeIndex SignalFlowGraph::addEdge(NodeIndex source, NodeIndex dest, const AudioConnection &conn) {
    mEdges.push_back({source, dest, conn});
    EdgeIndex e = mEdges.size() - 1;
    mOutgoing[source].push_back(e);
    mIncoming[dest].push_back(e);
    return e;
}

std::optional<NodeIndex> SignalFlowGraph::findNode(const std::string &id) const {
    for (size_t i = 0; i < mNodes.size(); i++) {
        if (mNodes[i].id == id) return i;
    }
    return std::nullopt;
}

bool SignalFlowGraph::hasIncoming(NodeIndex i, ConnectionType type) const {
    for (EdgeIndex e : mIncoming.at(i)) {
        if (mEdges[e].connection.connectionType == type) return true;
    }
    return false;
}

bool SignalFlowGraph::hasOutgoing(NodeIndex i, ConnectionType type) const {
    for (EdgeIndex e : mOutgoing.at(i)) {
        if (mEdges[e].connection.connectionType == type) return true;
    }
    return false;
}

// ============================================================================
// ConnectionClassifier
// ============================================================================

ConnectionType ConnectionClassifier::classify(const AudioNode &source, const AudioNode &dest) {
    // UI widgets are control rate no matter what is on the other side
    if (source.kind.category == ObjectCategory::ControlWidget
        || dest.kind.category == ObjectCategory::ControlWidget) {
        return ConnectionType::Control;
    }

    bool srcAudio = isAudioBearing(source.kind);
    bool dstAudio = isAudioBearing(dest.kind);

    if (srcAudio && dstAudio) {
        return ConnectionType::Audio;
    }

    if (source.kind.category == ObjectCategory::RampGenerator) {
        return ConnectionType::Control;
    }

    // Mixed audio/control edges default to control
    if (srcAudio != dstAudio) {
        return ConnectionType::Control;
    }

    return ConnectionType::Message;
}

std::string ConnectionClassifier::typeName(ConnectionType type) {
    switch (type) {
        case ConnectionType::Audio:   return "audio";
        case ConnectionType::Control: return "control";
        case ConnectionType::Message: return "message";
        case ConnectionType::Unknown: return "unknown";
    }
    return "unknown";
}

// ============================================================================
// SignalFlowGraphBuilder
// ============================================================================

struct Endpoint {
    std::string id;
    int port = 0;
};

// Validate a loosely typed [box_id, port] pair. Port must be a non-negative
// whole number; JSON may carry it as 0 or 0.0.
static Endpoint parseEndpoint(const nlohmann::json &value, size_t lineIndex, const char *which) {
    auto fail = [&](const std::string &why) -> AnalysisError {
        return AnalysisError(AnalysisError::Kind::InvalidRouting,
                             "line " + std::to_string(lineIndex) + " " + which + ": " + why);
    };

    if (!value.is_array() || value.size() != 2) {
        throw fail("endpoint is not a two-element array");
    }
    if (!value[0].is_string()) {
        throw fail("object id is not a string");
    }
    if (!value[1].is_number()) {
        throw fail("port index is not a number");
    }

    double port = value[1].get<double>();
    if (!std::isfinite(port) || port < 0.0 || std::floor(port) != port) {
        throw fail("port index is not a non-negative integer");
    }
    if (port > double(std::numeric_limits<int>::max())) {
        throw fail("port index out of range");
    }

    Endpoint ep;
    ep.id = value[0].get<std::string>();
    ep.port = static_cast<int>(port);
    return ep;
}

SignalFlowGraph SignalFlowGraphBuilder::build(const PatchData &patch, bool verbose) {
    SignalFlowGraph graph;

    // Scoped to this call: id -> node handle, used only to resolve cables
    std::unordered_map<std::string, NodeIndex> idToNode;

    // Pass 1: one node per box
    for (const auto &box : patch.boxes) {
        AudioNode node;
        node.id = box.id;
        node.objectType = box.maxclass;
        node.text = box.text;
        node.numInlets = box.numInlets;
        node.numOutlets = box.numOutlets;
        if (box.patchingRect) {
            const auto &r = *box.patchingRect;
            node.rect = LayoutRect{r[0], r[1], r[2], r[3]};
        }
        node.kind = ObjectLexer::lex(box.maxclass, box.text);

        if (idToNode.count(box.id)) {
            std::cerr << "[GraphBuilder] Warning: duplicate box id '" << box.id
                      << "', cables resolve to the later box\n";
        }
        idToNode[box.id] = graph.addNode(node);
    }

    // Pass 2: one classified edge per cable, in cable order
    for (size_t i = 0; i < patch.lines.size(); i++) {
        const auto &line = patch.lines[i];

        Endpoint src = parseEndpoint(line.source, i, "source");
        Endpoint dst = parseEndpoint(line.destination, i, "destination");

        auto srcIt = idToNode.find(src.id);
        if (srcIt == idToNode.end()) {
            throw AnalysisError(AnalysisError::Kind::InvalidRouting,
                                "line " + std::to_string(i) + " source: unknown object id '" + src.id + "'");
        }
        auto dstIt = idToNode.find(dst.id);
        if (dstIt == idToNode.end()) {
            throw AnalysisError(AnalysisError::Kind::InvalidRouting,
                                "line " + std::to_string(i) + " destination: unknown object id '" + dst.id + "'");
        }

        AudioConnection conn;
        conn.sourceOutlet = src.port;
        conn.destInlet = dst.port;
        conn.connectionType = ConnectionClassifier::classify(graph.node(srcIt->second),
                                                             graph.node(dstIt->second));

        graph.addEdge(srcIt->second, dstIt->second, conn);

        if (verbose) {
            std::cout << "[GraphBuilder]   " << src.id << ":" << src.port << " -> "
                      << dst.id << ":" << dst.port << " ("
                      << ConnectionClassifier::typeName(conn.connectionType) << ")\n";
        }
    }

    std::cout << "[GraphBuilder] Built signal flow graph: " << graph.nodeCount()
              << " nodes, " << graph.edgeCount() << " edges\n";
    return graph;
}
