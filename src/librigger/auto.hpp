#pragma once

// Arthur O'Dwyer's "AtScopeExit" explained in
// https://www.youtube.com/watch?v=lKG1m2NkANM
//
// AUTO(stmt...) runs the statements when the enclosing scope exits, e.g.
//
//   auto dir = make_scratch_dir();
//   AUTO(fs::remove_all(dir));

// NOLINTBEGIN(*macro-usage*)

namespace rigger::utils {
template <typename Lam>
class at_scope_exit {
  Lam lam;

 public:
  at_scope_exit(const at_scope_exit&) = delete;
  at_scope_exit(at_scope_exit&&) = delete;
  at_scope_exit& operator=(const at_scope_exit&) = delete;
  at_scope_exit& operator=(at_scope_exit&&) = delete;
  explicit at_scope_exit(Lam action) : lam(static_cast<Lam&&>(action)) {}
  ~at_scope_exit() { lam(); }
};
}  // namespace rigger::utils

#define RIGGER_TOKEN_PASTEx(x, y) x##y
#define RIGGER_TOKEN_PASTE(x, y) RIGGER_TOKEN_PASTEx(x, y)

#define RIGGER_AUTO_INTERNAL(lname, aname, ...) \
  auto lname = [&]() { __VA_ARGS__; };          \
  rigger::utils::at_scope_exit aname(lname)

#define RIGGER_AUTO_INTERNAL2(ctr, ...)                     \
  RIGGER_AUTO_INTERNAL(                                     \
      RIGGER_TOKEN_PASTE(AUTO_func, ctr),                   \
      RIGGER_TOKEN_PASTE(AUTO_instance, ctr), __VA_ARGS__)

#define AUTO(...) RIGGER_AUTO_INTERNAL2(__COUNTER__, __VA_ARGS__)
// NOLINTEND(*macro-usage*)
