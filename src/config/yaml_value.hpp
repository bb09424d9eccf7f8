// src/config/yaml_value.hpp
#pragma once

#include <yaml-cpp/yaml.h>

namespace config {

/**
 * Read an optional key from a mapping.
 *
 * An absent key yields `fallback`. A key that is present but does not
 * convert to T throws YAML::BadConversion, so a typo in a number is
 * reported instead of silently replaced by the default.
 */
template<typename T>
T yaml_value(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    return value ? value.as<T>() : fallback;
}

} // namespace config
