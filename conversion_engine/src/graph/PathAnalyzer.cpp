#include "PathAnalyzer.hpp"
#include <algorithm>
#include <deque>
#include <iostream>
#include <limits>

std::vector<NodeIndex> PathAnalyzer::getAudioSources(const SignalFlowGraph &graph) {
    std::vector<NodeIndex> sources;
    for (NodeIndex i = 0; i < graph.nodeCount(); i++) {
        if (isSourceCategory(graph.node(i).kind.category)
            && !graph.hasIncoming(i, ConnectionType::Audio)) {
            sources.push_back(i);
        }
    }
    return sources;
}

std::vector<NodeIndex> PathAnalyzer::getAudioSinks(const SignalFlowGraph &graph) {
    std::vector<NodeIndex> sinks;
    for (NodeIndex i = 0; i < graph.nodeCount(); i++) {
        if (isSinkCategory(graph.node(i).kind.category)
            && !graph.hasOutgoing(i, ConnectionType::Audio)) {
            sinks.push_back(i);
        }
    }
    return sinks;
}

std::vector<NodeIndex> PathAnalyzer::getSpatialNodes(const SignalFlowGraph &graph) {
    std::vector<NodeIndex> nodes;
    for (NodeIndex i = 0; i < graph.nodeCount(); i++) {
        const ObjectKind &kind = graph.node(i).kind;
        if (isSpatFamily(kind) || kind.category == ObjectCategory::StereoPanner) {
            nodes.push_back(i);
        }
    }
    return nodes;
}

std::vector<SignalChain> PathAnalyzer::analyzeSignalChains(const SignalFlowGraph &graph,
                                                           const PathSearchLimits &limits,
                                                           bool verbose) {
    std::vector<SignalChain> chains;
    if (limits.maxChains <= 0) return chains;

    std::vector<NodeIndex> sources = getAudioSources(graph);
    std::vector<NodeIndex> sinks = getAudioSinks(graph);

    std::vector<bool> isSink(graph.nodeCount(), false);
    for (NodeIndex s : sinks) isSink[s] = true;

    const NodeIndex kNone = std::numeric_limits<NodeIndex>::max();
    bool truncated = false;
    bool depthLimited = false;

    for (NodeIndex src : sources) {
        // BFS over Audio edges; first visit is the shortest path, so the
        // parent tree never revisits a node and every path is simple
        std::vector<NodeIndex> parent(graph.nodeCount(), kNone);
        std::vector<int> depth(graph.nodeCount(), -1);
        std::deque<NodeIndex> queue;

        depth[src] = 0;
        queue.push_back(src);

        while (!queue.empty()) {
            NodeIndex cur = queue.front();
            queue.pop_front();

            if (cur != src && isSink[cur]) {
                SignalChain chain;
                chain.source = src;
                chain.sink = cur;
                for (NodeIndex n = cur; n != kNone; n = parent[n]) {
                    chain.path.push_back(n);
                }
                std::reverse(chain.path.begin(), chain.path.end());

                if (verbose) {
                    std::cout << "[PathAnalyzer]   " << graph.node(src).id << " -> "
                              << graph.node(cur).id << " (" << chain.path.size() << " nodes)\n";
                }
                chains.push_back(std::move(chain));

                if ((int)chains.size() >= limits.maxChains) {
                    truncated = true;
                    break;
                }
            }

            if (depth[cur] >= limits.maxDepth) {
                if (graph.hasOutgoing(cur, ConnectionType::Audio)) depthLimited = true;
                continue;
            }

            for (EdgeIndex e : graph.outgoing(cur)) {
                const GraphEdge &edge = graph.edge(e);
                if (edge.connection.connectionType != ConnectionType::Audio) continue;
                if (depth[edge.dest] != -1) continue;
                depth[edge.dest] = depth[cur] + 1;
                parent[edge.dest] = cur;
                queue.push_back(edge.dest);
            }
        }

        if (truncated) break;
    }

    if (truncated) {
        std::cerr << "[PathAnalyzer] Warning: chain limit of " << limits.maxChains
                  << " reached, remaining chains not reported\n";
    }
    if (depthLimited) {
        std::cerr << "[PathAnalyzer] Warning: search depth limit of " << limits.maxDepth
                  << " edges reached, longer chains not reported\n";
    }

    std::cout << "[PathAnalyzer] " << sources.size() << " audio sources, "
              << sinks.size() << " audio sinks, " << chains.size() << " signal chains\n";
    return chains;
}

GraphSummary PathAnalyzer::summarize(const SignalFlowGraph &graph) {
    GraphSummary s;
    s.nodes = graph.nodeCount();
    s.edges = graph.edgeCount();
    s.audioSources = getAudioSources(graph).size();
    s.audioSinks = getAudioSinks(graph).size();

    for (const auto &node : graph.nodes()) {
        ObjectCategory c = node.kind.category;
        if (c == ObjectCategory::ControlWidget || c == ObjectCategory::Message
            || c == ObjectCategory::RampGenerator) {
            s.controlObjects++;
        }
    }

    for (const auto &edge : graph.edges()) {
        switch (edge.connection.connectionType) {
            case ConnectionType::Audio:   s.audioEdges++; break;
            case ConnectionType::Control: s.controlEdges++; break;
            case ConnectionType::Message: s.messageEdges++; break;
            case ConnectionType::Unknown: break;
        }
    }
    return s;
}
