// src/plant/causality_resolver.cpp
#include "plant/causality_resolver.hpp"
#include "plant/sim_errors.hpp"
#include "plant/vehicle.hpp"
#include "utils/logging.hpp"
#include "utils/units.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace plant {

namespace {
// Bisection steps when a source power limit caps the prime mover torque
constexpr int kLimitIterations = 48;
}

FlowDirection direction_of(const Quantity& q) {
    const double p = q.power();
    if (p > 0.0) return FlowDirection::Discharge;
    if (p < 0.0) return FlowDirection::Regenerate;
    if (q.domain == Domain::Mechanical && q.torque() != 0.0) return FlowDirection::Discharge;
    return FlowDirection::Idle;
}

CausalityResolver::CausalityResolver(Vehicle& vehicle)
    : vehicle_(vehicle),
      dt_(vehicle.drive_train()) {
    commands_.assign(dt_.converter_count(), ConverterCommand{});

    for (LinkId wheel_link : dt_.node(DriveTrain::body_node()).upstream) {
        Branch b;
        b.wheel_link = wheel_link;

        NodeId id = dt_.link(wheel_link).from;
        for (;;) {
            const Node& n = dt_.node(id);
            if (n.kind != NodeKind::Converter) {
                throw ConnectivityError("'" + n.name + "' cannot drive the wheels directly");
            }
            b.chain.push_back(id);
            if (converter_at(id).is_prime_mover()) break;
            if (n.input_domain != Domain::Mechanical) {
                throw ConnectivityError("wheel branch through '" + n.name + "' has no prime mover");
            }
            id = dt_.link(n.upstream.front()).from;
        }

        LOG_DEBUG("[Resolver] Branch %zu: %zu stages, prime mover '%s'", branches_.size(),
                  b.chain.size(), dt_.node(b.chain.back()).name.c_str());
        branches_.push_back(std::move(b));
    }
}

Converter& CausalityResolver::converter_at(NodeId node) {
    return dt_.converter(dt_.node(node).index);
}

ConverterCommand& CausalityResolver::command_at(NodeId node) {
    return commands_[dt_.node(node).index];
}

void CausalityResolver::set_link(LinkId id, const Quantity& q, Resolution& out) const {
    out.links[id] = LinkFlow{direction_of(q), q};
}

// ============================================================================
// Step
// ============================================================================

Resolution CausalityResolver::resolve(const CommandSet& cmd, double wheel_speed_radps) {
    if (!cmd.converters.empty() && cmd.converters.size() != commands_.size()) {
        throw ControllerError("command set addresses " + std::to_string(cmd.converters.size()) +
                              " converters, drivetrain has " + std::to_string(commands_.size()));
    }

    Resolution out;
    out.wheel_speed_radps = wheel_speed_radps;
    out.requested_torque_nm = cmd.wheel_torque_nm;
    out.source_demand_w.assign(vehicle_.source_count(), 0.0);
    out.links.reserve(dt_.links().size());
    for (const auto& l : dt_.links()) {
        out.links.push_back(LinkFlow{FlowDirection::Idle, Quantity{l.domain, 0.0, 0.0}});
    }

    // Latch commands (gear changes) before any ratio is read
    for (std::size_t i = 0; i < commands_.size(); ++i) {
        commands_[i] = cmd.converters.empty() ? ConverterCommand{} : cmd.converters[i];
        commands_[i].shaft_speed_radps = 0.0;
        commands_[i].input_effort = 0.0;
        dt_.converter(i).apply_command(commands_[i]);
    }

    for (const auto& b : branches_) {
        speed_pass(b, wheel_speed_radps, out);
    }

    std::vector<BranchState> states(branches_.size());
    for (std::size_t k = 0; k < branches_.size(); ++k) {
        const Branch& b = branches_[k];
        const double share = dt_.link(b.wheel_link).weight;
        demand_pass(b, states[k], cmd.wheel_torque_nm * share, wheel_speed_radps);
        arbitrate(b, states[k], out);
        deliver(b, states[k], out);
    }

    for (std::size_t k = 0; k < branches_.size(); ++k) {
        supply_prime(branches_[k], states[k], out);
    }

    out.converters.reserve(dt_.converter_count());
    for (std::size_t i = 0; i < dt_.converter_count(); ++i) {
        out.converters.push_back(dt_.converter(i).last_operating_point());
    }

    LOG_TRACE("[Resolver] w=%.3f rad/s, T_req=%.1f, T_dt=%.1f, T_divert=%.1f Nm, J_ref=%.3f",
              wheel_speed_radps, out.requested_torque_nm, out.drivetrain_torque_nm,
              out.diverted_brake_torque_nm, out.reflected_inertia_kgm2);
    return out;
}

// ============================================================================
// Pass 1: speed
// ============================================================================

void CausalityResolver::speed_pass(const Branch& b, double wheel_speed_radps, Resolution& out) {
    double w = wheel_speed_radps;
    double ratio_to_wheel = 1.0;

    for (NodeId id : b.chain) {
        Converter& c = converter_at(id);
        ConverterCommand& cc = command_at(id);

        c.check_speed(w, cc);
        cc.shaft_speed_radps = w;

        if (!c.is_prime_mover()) {
            const double n = c.speed_ratio();
            ratio_to_wheel *= n;
            w *= n;
        }
        // Stage inertia sits on its input shaft, prime mover inertia on its output shaft
        out.reflected_inertia_kgm2 += c.inertia_kgm2() * ratio_to_wheel * ratio_to_wheel;
    }
}

// ============================================================================
// Pass 2: demand
// ============================================================================

void CausalityResolver::demand_pass(const Branch& b, BranchState& st,
                                    double branch_torque_nm, double wheel_speed_radps) {
    Quantity q = Quantity::mechanical(branch_torque_nm, wheel_speed_radps);
    st.requested_torque_nm = branch_torque_nm;
    st.direction = direction_of(q);

    for (std::size_t i = 0; i + 1 < b.chain.size(); ++i) {
        Converter& stage = converter_at(b.chain[i]);
        const ConverterCommand& cc = command_at(b.chain[i]);
        q = (st.direction == FlowDirection::Regenerate) ? stage.backward(q, cc)
                                                        : stage.required_input(q, cc);
    }

    st.prime_demand = q;
    st.prime_speed_radps = q.speed();
}

// ============================================================================
// Pass 3: prime mover arbitration
// ============================================================================

void CausalityResolver::arbitrate(const Branch& b, BranchState& st, Resolution& out) {
    const NodeId pm_id = b.chain.back();
    Converter& pm = converter_at(pm_id);
    ConverterCommand& cc = command_at(pm_id);
    const NodeId supply_node = dt_.link(dt_.node(pm_id).upstream.front()).from;

    const double w = st.prime_speed_radps;
    const double tau = st.prime_demand.torque();
    double tau_act = 0.0;

    if (st.direction == FlowDirection::Regenerate) {
        if (!pm.reversible()) {
            const double diverted_w = std::abs(tau * w);
            out.violations.push_back(ReversibilityViolation{pm.name(), diverted_w});
            LOG_WARN("[Resolver] '%s' cannot regenerate: %.1f W diverted to the brakes",
                     pm.name().c_str(), diverted_w);
            st.absorbable = 0.0;
        } else {
            const double limited = std::min(std::abs(tau), pm.max_regen_torque(w, cc));

            st.absorbable = absorbable_fraction(supply_node);
            if (st.absorbable < 1.0) {
                record_blocked(supply_node, 1.0, limited * std::abs(w), out);
            }
            tau_act = utils::sign(tau) * limited * st.absorbable;
            tau_act = fit_to_supply(pm, cc, supply_node, tau_act, w, true);
        }
    } else {
        const double max = pm.max_drive_torque(w, cc);
        const double lo = pm.reversible() ? -max : 0.0;
        tau_act = std::clamp(tau, lo, max);
        tau_act = fit_to_supply(pm, cc, supply_node, tau_act, w, false);
    }

    if (tau_act != tau) {
        LOG_TRACE("[Resolver] '%s' %s: %.2f Nm requested, %.2f Nm granted",
                  pm.name().c_str(), to_string(st.direction), tau, tau_act);
    }
    st.prime_actual = Quantity::mechanical(tau_act, w);
}

double CausalityResolver::absorbable_fraction(NodeId node) const {
    const Node& n = dt_.node(node);
    switch (n.kind) {
        case NodeKind::Source:
            return vehicle_.source(n.index).can_absorb() ? 1.0 : 0.0;
        case NodeKind::Junction: {
            double f = 0.0;
            for (LinkId l : n.upstream) {
                f += dt_.link(l).weight * absorbable_fraction(dt_.link(l).from);
            }
            return f;
        }
        case NodeKind::Converter:
            if (!dt_.converter(n.index).reversible()) return 0.0;
            return absorbable_fraction(dt_.link(n.upstream.front()).from);
        case NodeKind::Body:
            break;
    }
    return 0.0;
}

// ============================================================================
// Source power limits
// ============================================================================

double CausalityResolver::discharge_limit_w(NodeId node) const {
    const Node& n = dt_.node(node);
    switch (n.kind) {
        case NodeKind::Source:
            return vehicle_.source(n.index).max_discharge_power_w();
        case NodeKind::Junction: {
            // Discharge splits by weight, so the tightest input bounds the output
            double limit = std::numeric_limits<double>::infinity();
            for (LinkId l : n.upstream) {
                limit = std::min(limit, discharge_limit_w(dt_.link(l).from) / dt_.link(l).weight);
            }
            return limit;
        }
        case NodeKind::Converter:
            return dt_.converter(n.index).output_power_limit(
                discharge_limit_w(dt_.link(n.upstream.front()).from));
        case NodeKind::Body:
            break;
    }
    return 0.0;
}

double CausalityResolver::charge_limit_w(NodeId node) const {
    const Node& n = dt_.node(node);
    switch (n.kind) {
        case NodeKind::Source: {
            const EnergySource& src = vehicle_.source(n.index);
            return src.can_absorb() ? src.max_charge_power_w() : 0.0;
        }
        case NodeKind::Junction: {
            // Charge splits over the inputs that can take it, see supply()
            std::vector<double> shares;
            shares.reserve(n.upstream.size());
            double total = 0.0;
            for (LinkId l : n.upstream) {
                shares.push_back(dt_.link(l).weight * absorbable_fraction(dt_.link(l).from));
                total += shares.back();
            }
            if (total <= 0.0) return 0.0;
            double limit = std::numeric_limits<double>::infinity();
            for (std::size_t i = 0; i < n.upstream.size(); ++i) {
                if (shares[i] <= 0.0) continue;
                const NodeId from = dt_.link(n.upstream[i]).from;
                limit = std::min(limit, charge_limit_w(from) * total / shares[i]);
            }
            return limit;
        }
        case NodeKind::Converter:
            return dt_.converter(n.index).absorbed_power_limit(
                charge_limit_w(dt_.link(n.upstream.front()).from));
        case NodeKind::Body:
            break;
    }
    return 0.0;
}

double CausalityResolver::fit_to_supply(Converter& pm, ConverterCommand& cc, NodeId supply_node,
                                        double torque_nm, double speed_radps, bool regenerating) {
    const double limit_w = regenerating ? charge_limit_w(supply_node) : discharge_limit_w(supply_node);
    if (!std::isfinite(limit_w) || torque_nm == 0.0) return torque_nm;

    cc.input_effort = supply_effort(supply_node);
    auto input_power = [&](double tau) {
        const Quantity shaft = Quantity::mechanical(tau, speed_radps);
        const Quantity q = regenerating ? pm.backward(shaft, cc) : pm.required_input(shaft, cc);
        return std::abs(q.power());
    };
    if (input_power(torque_nm) <= limit_w) return torque_nm;

    // Input power is monotonic in |torque|: bisect on the granted share
    double lo = 0.0;
    double hi = 1.0;
    for (int i = 0; i < kLimitIterations; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (input_power(mid * torque_nm) <= limit_w) lo = mid; else hi = mid;
    }

    LOG_DEBUG("[Resolver] '%s' held to %.2f of %.2f Nm by the supply power limit (%.1f W)",
              pm.name().c_str(), lo * torque_nm, torque_nm, limit_w);
    return lo * torque_nm;
}

void CausalityResolver::record_blocked(NodeId node, double share, double power_w, Resolution& out) const {
    const Node& n = dt_.node(node);
    switch (n.kind) {
        case NodeKind::Junction:
            for (LinkId l : n.upstream) {
                record_blocked(dt_.link(l).from, share * dt_.link(l).weight, power_w, out);
            }
            break;
        case NodeKind::Converter:
            if (!dt_.converter(n.index).reversible()) {
                const double diverted_w = share * power_w;
                out.violations.push_back(ReversibilityViolation{n.name, diverted_w});
                LOG_WARN("[Resolver] '%s' cannot regenerate: %.1f W diverted to the brakes",
                         n.name.c_str(), diverted_w);
            } else {
                record_blocked(dt_.link(n.upstream.front()).from, share, power_w, out);
            }
            break;
        case NodeKind::Source:
            if (!vehicle_.source(n.index).can_absorb()) {
                LOG_DEBUG("[Resolver] '%s' cannot absorb, %.1f W to the brakes",
                          n.name.c_str(), share * power_w);
            }
            break;
        case NodeKind::Body:
            break;
    }
}

// ============================================================================
// Pass 4: delivery
// ============================================================================

void CausalityResolver::deliver(const Branch& b, BranchState& st, Resolution& out) {
    Quantity q = st.prime_actual;

    for (std::size_t i = b.chain.size() - 1; i-- > 0;) {
        Converter& stage = converter_at(b.chain[i]);
        const ConverterCommand& cc = command_at(b.chain[i]);

        set_link(dt_.node(b.chain[i]).upstream.front(), q, out);
        q = (st.direction == FlowDirection::Regenerate) ? stage.required_output(q, cc)
                                                        : stage.forward(q, cc);
    }

    set_link(b.wheel_link, q, out);
    out.drivetrain_torque_nm += q.torque();

    if (st.direction == FlowDirection::Regenerate) {
        out.diverted_brake_torque_nm += std::abs(st.requested_torque_nm - q.torque());
    }
}

// ============================================================================
// Pass 5: supply
// ============================================================================

double CausalityResolver::supply_effort(NodeId node) const {
    const Node& n = dt_.node(node);
    switch (n.kind) {
        case NodeKind::Source:
            return vehicle_.source(n.index).output_effort();
        case NodeKind::Junction: {
            const Junction& j = dt_.junction(n.index);
            if (j.bus_voltage_v > 0.0) return j.bus_voltage_v;
            double effort = 0.0;
            for (LinkId l : n.upstream) {
                effort += dt_.link(l).weight * supply_effort(dt_.link(l).from);
            }
            return effort;
        }
        case NodeKind::Converter:
            return dt_.converter(n.index).output_effort();
        case NodeKind::Body:
            break;
    }
    return 0.0;
}

void CausalityResolver::supply_prime(const Branch& b, const BranchState& st, Resolution& out) {
    const NodeId pm_id = b.chain.back();
    Converter& pm = converter_at(pm_id);
    ConverterCommand& cc = command_at(pm_id);

    const LinkId in_link = dt_.node(pm_id).upstream.front();
    const NodeId upstream = dt_.link(in_link).from;
    cc.input_effort = supply_effort(upstream);

    const Quantity q_in = (st.direction == FlowDirection::Regenerate && pm.reversible())
                              ? pm.backward(st.prime_actual, cc)
                              : pm.required_input(st.prime_actual, cc);

    set_link(in_link, q_in, out);
    supply(upstream, q_in, out);
}

void CausalityResolver::supply(NodeId node, const Quantity& at_output, Resolution& out) {
    const Node& n = dt_.node(node);
    const double p = at_output.power();

    switch (n.kind) {
        case NodeKind::Source:
            out.source_demand_w[n.index] += p;
            break;

        case NodeKind::Junction: {
            // Discharge splits by weight; charge goes only to branches that can take it
            std::vector<double> shares;
            shares.reserve(n.upstream.size());
            double total = 0.0;
            for (LinkId l : n.upstream) {
                double w = dt_.link(l).weight;
                if (p < 0.0) w *= absorbable_fraction(dt_.link(l).from);
                shares.push_back(w);
                total += w;
            }
            for (std::size_t i = 0; i < n.upstream.size(); ++i) {
                const LinkId l = n.upstream[i];
                const NodeId from = dt_.link(l).from;
                const double share = (total > 0.0) ? shares[i] / total : 0.0;
                const Quantity q = Quantity::from_power(n.input_domain, supply_effort(from), p * share);
                set_link(l, q, out);
                supply(from, q, out);
            }
            break;
        }

        case NodeKind::Converter: {
            Converter& c = converter_at(node);
            ConverterCommand& cc = command_at(node);
            const LinkId in_link = n.upstream.front();
            const NodeId from = dt_.link(in_link).from;
            cc.input_effort = supply_effort(from);

            const Quantity q = (p < 0.0) ? c.backward(at_output, cc) : c.required_input(at_output, cc);
            set_link(in_link, q, out);
            supply(from, q, out);
            break;
        }

        case NodeKind::Body:
            throw std::logic_error("Resolver: supply walk reached the body");
    }
}

} // namespace plant
