#pragma once

#include "config/Config.hpp"

#include <optional>

namespace mg::config {

// Layers from lowest to highest precedence: built-in defaults, config file, command line.
// Scalars take the highest layer that sets them; `skip` is the union of every layer.
EffectiveConfig resolve(const std::optional<ConfigLayer>& file, const ConfigLayer& cli);

}
