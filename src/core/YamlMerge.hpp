#pragma once

#include <yaml-cpp/yaml.h>

namespace mos {

// Deep merge of a user file over the built-in defaults.
// Mappings recurse, anything else in overlay replaces base.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (!base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (const auto& entry : overlay) {
        const auto key = entry.first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], entry.second)
                                  : YAML::Clone(entry.second);
    }
    return merged;
}

} // namespace mos
