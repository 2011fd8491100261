#include "rigger/configure.hpp"

#include <string>
#include <vector>

#include "logger.hpp"
#include "rigger/formatting.hpp"
#include "rigger/profiling.hpp"

namespace rigger {

action_registry configure(build_model& model, configuration& config) {
  action_registry registry;
  configure_context ctx{model, config, registry};

  std::vector<std::string> instrumented;
  for (const auto& p : model.projects)
    for (const auto& t : p.targets)
      if (t.code_profiling) instrumented.push_back(t.name);
  for (const auto& name : instrumented) instrument_target(ctx, name);

  for (const auto& p : model.projects) {
    LOG_DEBUG("Configuring project {}", p.name);
    for (const auto& opts : p.profiling) register_profiling(ctx, p, opts);
    if (p.formatting) register_formatting(ctx, p, *p.formatting);
  }

  LOG_DEBUG("Configuration defined {} action(s)", registry.size());
  return registry;
}

}  // namespace rigger
