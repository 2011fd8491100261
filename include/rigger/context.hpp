#pragma once

namespace rigger {

struct build_model;
struct project;
class configuration;
class action_registry;

// What a registrar works on during the configuration pass.
struct configure_context {
  build_model& model;
  configuration& config;
  action_registry& registry;
};

}  // namespace rigger
