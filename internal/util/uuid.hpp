#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace stash::util {

/*
  UUID helpers

  Task ids are RFC4122 version 4 UUIDs, persisted in their
  canonical upper-case string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// "XXXXXXXX-XXXX-4XXX-YXXX-XXXXXXXXXXXX", upper-case hex.
std::string ToString(const UUID& id);

// GenerateUUID() rendered with ToString().
std::string GenerateUUIDString();

} // namespace stash::util
