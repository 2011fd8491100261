#pragma once

#include <stdexcept>
#include <string>

namespace rigger {

// Fatal problem in the configuration pass: bad model, bad options, name
// collisions, missing required tools.  Nothing registered so far survives.
struct configuration_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace rigger
