#pragma once

#include <cstdint>
#include <variant>

#include "internal/util/time.hpp"

namespace inkvault::model {

/*
  Navigation protection state of one session.

    Idle     -> auto-save runs normally
    Loading  -> a historical state was requested (confirmed == false) or
                has just arrived and is inside its grace window
                (confirmed == true, issued_at re-stamped on arrival)
*/
struct Idle {};

struct Loading {
  uint64_t        target    = 0;
  util::TimePoint issued_at = {};
  bool            confirmed = false;
};

using ProtectionState = std::variant<Idle, Loading>;

inline bool IsIdle(const ProtectionState& state) {
  return std::holds_alternative<Idle>(state);
}

inline const Loading* PendingLoad(const ProtectionState& state) {
  return std::get_if<Loading>(&state);
}

} // namespace inkvault::model
