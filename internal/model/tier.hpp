#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace stash::model {

/*
  Task tiers, hottest first.

  Named after the cache hierarchy: L1 is the most urgent bucket,
  MEM is the parking lot.
*/
enum class Tier : std::uint8_t {
  kL1  = 0,
  kL2  = 1,
  kL3  = 2,
  kMem = 3,
};

// Display order, L1 first.
inline constexpr std::array<Tier, 4> kAllTiers = {Tier::kL1, Tier::kL2, Tier::kL3, Tier::kMem};

// Raw persisted value ("l1" .. "mem").
constexpr std::string_view ToString(Tier tier) {
  switch (tier) {
    case Tier::kL1:
      return "l1";
    case Tier::kL2:
      return "l2";
    case Tier::kL3:
      return "l3";
    case Tier::kMem:
    default:
      return "mem";
  }
}

constexpr std::string_view ShortLabel(Tier tier) {
  switch (tier) {
    case Tier::kL1:
      return "L1";
    case Tier::kL2:
      return "L2";
    case Tier::kL3:
      return "L3";
    case Tier::kMem:
    default:
      return "MEM";
  }
}

constexpr std::string_view Label(Tier tier) {
  switch (tier) {
    case Tier::kL1:
      return "L1 Cache";
    case Tier::kL2:
      return "L2 Cache";
    case Tier::kL3:
      return "L3 Cache";
    case Tier::kMem:
    default:
      return "Main Memory";
  }
}

constexpr int SortOrder(Tier tier) {
  return static_cast<int>(tier);
}

// Case-insensitive; accepts raw values and short labels.
std::optional<Tier> ParseTier(std::string_view value);

// ------------------------------------------------------------
// Escalation rules
// ------------------------------------------------------------

// Dwell time before a task becomes eligible for auto-escalation.
// Zero means the tier never escalates.
constexpr std::chrono::seconds EscalationThreshold(Tier tier) {
  switch (tier) {
    case Tier::kL2:
      return std::chrono::hours(2);
    case Tier::kL3:
      return std::chrono::hours(5);
    case Tier::kL1:
    case Tier::kMem:
    default:
      return std::chrono::seconds(0);
  }
}

constexpr std::optional<Tier> EscalationTarget(Tier tier) {
  switch (tier) {
    case Tier::kL2:
      return Tier::kL1;
    case Tier::kL3:
      return Tier::kL2;
    case Tier::kL1:
    case Tier::kMem:
    default:
      return std::nullopt;
  }
}

// Escalation out of `tier` is admitted only while the target holds fewer tasks than this.
constexpr int TargetTierCapacity(Tier tier) {
  switch (tier) {
    case Tier::kL2:
    case Tier::kL3:
      return 3;
    case Tier::kL1:
    case Tier::kMem:
    default:
      return 0;
  }
}

// ------------------------------------------------------------
// Manual transitions
// ------------------------------------------------------------

// Cycles L1 -> L2 -> L3 -> MEM -> L1.
constexpr Tier Next(Tier tier) {
  switch (tier) {
    case Tier::kL1:
      return Tier::kL2;
    case Tier::kL2:
      return Tier::kL3;
    case Tier::kL3:
      return Tier::kMem;
    case Tier::kMem:
    default:
      return Tier::kL1;
  }
}

// One step toward MEM (snooze). MEM has nowhere to go.
constexpr std::optional<Tier> Previous(Tier tier) {
  switch (tier) {
    case Tier::kL1:
      return Tier::kL2;
    case Tier::kL2:
      return Tier::kL3;
    case Tier::kL3:
      return Tier::kMem;
    case Tier::kMem:
    default:
      return std::nullopt;
  }
}

// One step toward L1 (promote). L1 is already the top.
constexpr std::optional<Tier> Promoted(Tier tier) {
  switch (tier) {
    case Tier::kL2:
      return Tier::kL1;
    case Tier::kL3:
      return Tier::kL2;
    case Tier::kMem:
      return Tier::kL3;
    case Tier::kL1:
    default:
      return std::nullopt;
  }
}

} // namespace stash::model
