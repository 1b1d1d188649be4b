#include "config/Resolver.hpp"
#include "logging/LogRegistry.hpp"

using namespace mg::config;
using namespace mg::logging;

namespace {

template <typename T>
void overlay(std::optional<T>& target, const std::optional<T>& value) {
    if (value) target = value;
}

template <typename T>
void overlay(T& target, const std::optional<T>& value) {
    if (value) target = *value;
}

void apply(EffectiveConfig& cfg, const ConfigLayer& layer) {
    overlay(cfg.tool, layer.tool);
    overlay(cfg.mode, layer.mode);
    overlay(cfg.log_path, layer.log_path);
    overlay(cfg.dry_run, layer.dry_run);
    overlay(cfg.no_sudo, layer.no_sudo);
    overlay(cfg.verbose, layer.verbose);
    overlay(cfg.src, layer.src);
    overlay(cfg.dst, layer.dst);

    cfg.skip.insert(layer.skip.begin(), layer.skip.end());
    for (const auto& [backend, args] : layer.extra_args) cfg.extra_args[backend] = args;
}

}

EffectiveConfig mg::config::resolve(const std::optional<ConfigLayer>& file, const ConfigLayer& cli) {
    EffectiveConfig cfg;
    if (file) apply(cfg, *file);
    apply(cfg, cli);

    if (cfg.skip.erase(SKIP_SAFETY) > 0)
        LogRegistry::config()->warn("[Config] Safety checks cannot be skipped; ignoring 'safety' in skip list");

    return cfg;
}
