// src/plant/drive_train.hpp
#pragma once

#include "plant/brakes.hpp"
#include "plant/converter.hpp"
#include "plant/quantity.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plant {

using NodeId = std::size_t;
using LinkId = std::size_t;

constexpr LinkId kNoLink = std::numeric_limits<LinkId>::max();

enum class NodeKind {
    Source,
    Converter,
    Junction,
    Body
};

const char* to_string(NodeKind k);

/**
 * Node - one vertex of the component graph
 *
 * `index` points into the arena owning the component of that kind
 * (vehicle sources, drivetrain converters, drivetrain junctions).
 * Power flows from upstream links toward the single downstream link;
 * the body is the root and has none.
 */
struct Node {
    NodeKind kind = NodeKind::Body;
    std::size_t index = 0;
    std::string name;
    Domain input_domain = Domain::Mechanical;
    Domain output_domain = Domain::Mechanical;
    std::vector<LinkId> upstream;
    LinkId downstream = kNoLink;
};

/// Link - binds the output port of `from` to an input port of `to`.
struct Link {
    LinkId id = 0;
    NodeId from = 0;
    NodeId to = 0;
    Domain domain = Domain::Mechanical;
    double weight = 1.0;   // static share of the `to` node's demand, normalized at build
};

/// Junction - lossless same-domain split of demand over its upstream links.
struct Junction {
    std::string name;
    Domain domain = Domain::Electrical;
    double bus_voltage_v = 0.0;   // 0 = take the weighted voltage of the feeding sources
};

/**
 * DriveTrain - arena of converters, junctions and links plus the brakes
 *
 * Built and validated by VehicleBuilder; the topology is frozen after
 * that. Node 0 is always the body.
 */
class DriveTrain {
public:
    DriveTrain();

    DriveTrain(const DriveTrain&) = delete;
    DriveTrain& operator=(const DriveTrain&) = delete;

    // ========================================================================
    // Topology
    // ========================================================================

    static constexpr NodeId body_node() { return 0; }

    const std::vector<Node>& nodes() const { return nodes_; }
    const Node& node(NodeId id) const { return nodes_.at(id); }
    const std::vector<Link>& links() const { return links_; }
    const Link& link(LinkId id) const { return links_.at(id); }

    std::optional<NodeId> find_node(const std::string& name) const;

    // ========================================================================
    // Components
    // ========================================================================

    std::size_t converter_count() const { return converters_.size(); }
    Converter& converter(std::size_t idx) { return *converters_.at(idx); }
    const Converter& converter(std::size_t idx) const { return *converters_.at(idx); }
    std::optional<std::size_t> find_converter(const std::string& name) const;

    std::size_t junction_count() const { return junctions_.size(); }
    const Junction& junction(std::size_t idx) const { return junctions_.at(idx); }

    Brakes& brakes() { return brakes_; }
    const Brakes& brakes() const { return brakes_; }

    /// One line per node, indented by depth from the body.
    std::string describe() const;

private:
    friend class VehicleBuilder;

    NodeId add_node(NodeKind kind, std::size_t index, std::string name, Domain in, Domain out);
    LinkId connect(NodeId from, NodeId to, double weight);

    /// Throws ConnectivityError describing the first problem found.
    void validate() const;
    void normalize_weights();

    std::vector<Node> nodes_;
    std::vector<Link> links_;
    std::vector<std::unique_ptr<Converter>> converters_;
    std::vector<Junction> junctions_;
    Brakes brakes_;
};

} // namespace plant
