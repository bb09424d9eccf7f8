// src/sim/step_record_visitor.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace sim {

/**
 * FieldVisitor - Infrastructure for automatic field enumeration
 *
 * Lets StepRecord expose its fields to an external results writer
 * (CSV, database, plotting) without a field-by-field mapping.
 *
 * Usage:
 *   FieldVisitor v([](const std::string& name, double value) {
 *       std::cout << name << " = " << value << "\n";
 *   });
 *   record.accept_fields(v, sim.layout());
 */
class FieldVisitor {
public:
    using Callback = std::function<void(const std::string&, double)>;

    explicit FieldVisitor(Callback cb) : callback_(std::move(cb)) {}

    // Visit methods for different types - all convert to double
    void visit(const std::string& name, double value) {
        callback_(name, value);
    }

    void visit(const std::string& name, int value) {
        callback_(name, static_cast<double>(value));
    }

    void visit(const std::string& name, std::size_t value) {
        callback_(name, static_cast<double>(value));
    }

    void visit(const std::string& name, bool value) {
        callback_(name, value ? 1.0 : 0.0);
    }

private:
    Callback callback_;
};

/**
 * Lambda-based visitor - allows direct lambda usage
 */
template<typename Lambda>
class LambdaVisitor {
public:
    explicit LambdaVisitor(Lambda&& lambda) : lambda_(std::forward<Lambda>(lambda)) {}

    template<typename T>
    void visit(const std::string& name, T value) {
        lambda_(name, static_cast<double>(value));
    }

private:
    Lambda lambda_;
};

// Helper to create lambda visitor
template<typename Lambda>
LambdaVisitor<Lambda> make_visitor(Lambda&& lambda) {
    return LambdaVisitor<Lambda>(std::forward<Lambda>(lambda));
}

} // namespace sim
