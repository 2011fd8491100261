#pragma once

#include "rigger/action.hpp"
#include "rigger/build_model.hpp"
#include "rigger/configuration.hpp"

namespace rigger {

// One configuration pass: every profiling registration of every project,
// then its formatting registration, projects in model order.  Throws
// configuration_error on the first fatal problem, in which case nothing is
// returned.
action_registry configure(build_model& model, configuration& config);

}  // namespace rigger
