#pragma once

#include <boost/json.hpp>
#include <exception>
#include <typeinfo>

#include "rigger/action.hpp"
#include "rigger/build_model.hpp"
#include "utils.hpp"

namespace rigger {

namespace json = boost::json;

inline json::object action_to_json(const action& a, bool with_steps) {
  json::object res;
  res["name"] = a.name;
  res["comment"] = a.comment;
  res["working_directory"] = a.working_directory.string();
  res["targets"] = json::array(a.targets.begin(), a.targets.end());
  res["depends"] = json::array(a.depends.begin(), a.depends.end());
  if (with_steps) {
    json::array steps;
    for (const auto& s : a.steps) steps.emplace_back(describe(s));
    res["steps"] = std::move(steps);
  }
  return res;
}

inline json::array registry_to_json(
    const action_registry& registry, bool with_steps) {
  json::array res;
  for (const auto& a : registry.actions())
    res.push_back(action_to_json(a, with_steps));
  return res;
}

inline json::object target_to_json(const target& t) {
  json::object res;
  res["name"] = t.name;
  res["type"] = to_string(t.type);
  res["artifact"] = t.artifact.string();
  res["compile_options"] =
      json::array(t.compile_options.begin(), t.compile_options.end());
  res["link_options"] =
      json::array(t.link_options.begin(), t.link_options.end());
  return res;
}

inline json::object error_to_json(const std::exception& e) {
  json::object res;
  res["error"] = utils::demangle_symbol(typeid(e).name());
  res["details"] = e.what();
  return res;
}

}  // namespace rigger
