#include "tier.hpp"

#include "internal/util/strings.hpp"

namespace stash::model {

std::optional<Tier> ParseTier(std::string_view value) {
  const auto lowered = util::ToLower(util::Trim(value));
  for (auto tier : kAllTiers) {
    if (lowered == ToString(tier)) {
      return tier;
    }
  }
  return std::nullopt;
}

} // namespace stash::model
