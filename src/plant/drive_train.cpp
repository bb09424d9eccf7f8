// src/plant/drive_train.cpp
#include "plant/drive_train.hpp"
#include "plant/sim_errors.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <utility>

namespace plant {

const char* to_string(NodeKind k) {
    switch (k) {
        case NodeKind::Source:    return "source";
        case NodeKind::Converter: return "converter";
        case NodeKind::Junction:  return "junction";
        case NodeKind::Body:      return "body";
    }
    return "unknown";
}

DriveTrain::DriveTrain() {
    add_node(NodeKind::Body, 0, "body", Domain::Mechanical, Domain::Mechanical);
}

NodeId DriveTrain::add_node(NodeKind kind, std::size_t index, std::string name, Domain in, Domain out) {
    Node n;
    n.kind = kind;
    n.index = index;
    n.name = std::move(name);
    n.input_domain = in;
    n.output_domain = out;
    nodes_.push_back(std::move(n));
    return nodes_.size() - 1;
}

LinkId DriveTrain::connect(NodeId from, NodeId to, double weight) {
    if (from >= nodes_.size() || to >= nodes_.size()) {
        throw ConnectivityError("link references an unknown node");
    }
    Node& up = nodes_[from];
    Node& down = nodes_[to];

    if (from == to) {
        throw ConnectivityError("'" + up.name + "' cannot be linked to itself");
    }
    if (up.kind == NodeKind::Body) {
        throw ConnectivityError("the body has no output port");
    }
    if (down.kind == NodeKind::Source) {
        throw ConnectivityError("source '" + down.name + "' has no input port");
    }
    if (up.downstream != kNoLink) {
        throw ConnectivityError("output port of '" + up.name + "' is already connected");
    }
    if (down.kind == NodeKind::Converter && !down.upstream.empty()) {
        throw ConnectivityError("input port of converter '" + down.name + "' is already connected");
    }
    if (!(weight > 0.0) || !std::isfinite(weight)) {
        throw ConnectivityError("link '" + up.name + "' -> '" + down.name + "' needs a positive weight");
    }

    Link l;
    l.id = links_.size();
    l.from = from;
    l.to = to;
    l.domain = up.output_domain;
    l.weight = weight;
    links_.push_back(l);

    up.downstream = l.id;
    down.upstream.push_back(l.id);
    return l.id;
}

void DriveTrain::validate() const {
    std::set<std::string> names;
    std::size_t source_count = 0;

    for (const auto& n : nodes_) {
        if (!names.insert(n.name).second) {
            throw ConnectivityError("duplicate component name '" + n.name + "'");
        }

        switch (n.kind) {
            case NodeKind::Body:
                if (n.upstream.empty()) {
                    throw ConnectivityError("the body is not driven by any component");
                }
                break;
            case NodeKind::Source:
                ++source_count;
                if (n.downstream == kNoLink) {
                    throw ConnectivityError("output port of source '" + n.name + "' is dangling");
                }
                break;
            case NodeKind::Converter:
                if (n.upstream.empty()) {
                    throw ConnectivityError("input port of converter '" + n.name + "' is dangling");
                }
                if (n.downstream == kNoLink) {
                    throw ConnectivityError("output port of converter '" + n.name + "' is dangling");
                }
                break;
            case NodeKind::Junction:
                if (n.input_domain == Domain::Mechanical) {
                    throw ConnectivityError("mechanical junction '" + n.name +
                                            "' not supported; link each axle to the body");
                }
                if (n.upstream.empty()) {
                    throw ConnectivityError("junction '" + n.name + "' has no inputs");
                }
                if (n.downstream == kNoLink) {
                    throw ConnectivityError("output port of junction '" + n.name + "' is dangling");
                }
                break;
        }
    }

    if (source_count == 0) {
        throw ConnectivityError("vehicle has no energy source");
    }

    for (const auto& l : links_) {
        const Node& up = nodes_[l.from];
        const Node& down = nodes_[l.to];
        if (l.domain != down.input_domain) {
            throw ConnectivityError("link '" + up.name + "' -> '" + down.name + "' carries " +
                                    to_string(l.domain) + " but '" + down.name + "' expects " +
                                    to_string(down.input_domain));
        }
        if (l.domain == Domain::Mechanical && up.kind != NodeKind::Converter) {
            throw ConnectivityError("mechanical link from '" + up.name + "' must start at a converter");
        }
        if (l.domain == Domain::Mechanical && down.output_domain != Domain::Mechanical) {
            throw ConnectivityError("'" + down.name + "' turns shaft power into " +
                                    to_string(down.output_domain) + "; generators are not supported");
        }
    }

    // Every node must reach the body by following its single output
    for (NodeId id = 1; id < nodes_.size(); ++id) {
        NodeId cur = id;
        std::size_t hops = 0;
        while (cur != body_node()) {
            if (nodes_[cur].downstream == kNoLink || ++hops > nodes_.size()) {
                throw ConnectivityError("'" + nodes_[id].name + "' does not lead to the body (cycle)");
            }
            cur = links_[nodes_[cur].downstream].to;
        }
    }
}

void DriveTrain::normalize_weights() {
    for (const auto& n : nodes_) {
        double total = 0.0;
        for (LinkId l : n.upstream) total += links_[l].weight;
        if (total <= 0.0) continue;
        for (LinkId l : n.upstream) links_[l].weight /= total;
    }
}

std::optional<NodeId> DriveTrain::find_node(const std::string& name) const {
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (nodes_[id].name == name) return id;
    }
    return std::nullopt;
}

std::optional<std::size_t> DriveTrain::find_converter(const std::string& name) const {
    for (std::size_t i = 0; i < converters_.size(); ++i) {
        if (converters_[i]->name() == name) return i;
    }
    return std::nullopt;
}

std::string DriveTrain::describe() const {
    std::ostringstream os;
    std::vector<std::pair<NodeId, int>> stack{{body_node(), 0}};
    while (!stack.empty()) {
        const auto [id, depth] = stack.back();
        stack.pop_back();
        const Node& n = nodes_[id];
        os << std::string(static_cast<std::size_t>(depth) * 2, ' ') << n.name
           << " (" << to_string(n.kind) << ", in " << to_string(n.input_domain) << ")\n";
        for (auto it = n.upstream.rbegin(); it != n.upstream.rend(); ++it) {
            stack.emplace_back(links_[*it].from, depth + 1);
        }
    }
    return os.str();
}

} // namespace plant
