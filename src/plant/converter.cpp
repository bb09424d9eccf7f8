// src/plant/converter.cpp
#include "plant/converter.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace plant {

Converter::Converter(std::string name, Domain input_domain, Domain output_domain, bool reversible)
    : name_(std::move(name)),
      input_domain_(input_domain),
      output_domain_(output_domain),
      reversible_(reversible) {
    if (name_.empty()) {
        throw std::invalid_argument("Converter: name must not be empty");
    }
}

Quantity Converter::backward(const Quantity& input, const ConverterCommand& cmd) {
    (void)input;
    (void)cmd;
    require_reversible("backward");
    throw std::logic_error(name_ + ": backward() not implemented");
}

Quantity Converter::required_output(const Quantity& input, const ConverterCommand& cmd) {
    (void)input;
    (void)cmd;
    throw std::logic_error(name_ + ": required_output() not supported");
}

double Converter::max_drive_torque(double speed_radps, const ConverterCommand& cmd) const {
    (void)speed_radps;
    (void)cmd;
    return std::numeric_limits<double>::infinity();
}

double Converter::max_regen_torque(double speed_radps, const ConverterCommand& cmd) const {
    (void)speed_radps;
    (void)cmd;
    return 0.0;
}

void Converter::require_reversible(const char* operation) const {
    if (!reversible_) {
        throw std::logic_error(name_ + ": " + operation + "() called on a non-reversible converter");
    }
}

} // namespace plant
