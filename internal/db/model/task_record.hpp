#pragma once

#include <optional>
#include <string>

namespace stash::db::model {

/*
  Persistent task row.

  Mirrors the on-disk schema exactly:
  - tier is the raw string ("l1" | "l2" | "l3" | "mem")
  - timestamps are epoch seconds as doubles
*/
struct TaskRecord {
  std::string id;
  std::string title;
  std::string tier = "l1";
  bool        is_completed = false;

  double                created_at       = 0.0;
  double                tier_assigned_at = 0.0;
  std::optional<double> completed_at;
};

} // namespace stash::db::model
