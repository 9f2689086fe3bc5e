#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/model/task.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;
using stash::model::Tier;

const stash::util::TimePoint kT0{std::chrono::seconds(1'800'000'000)};

void TestMakeTask() {
  auto a = stash::model::MakeTask("write report", Tier::kL2, kT0);
  auto b = stash::model::MakeTask("write report", Tier::kL2, kT0);

  assert(a.id != b.id);
  assert(!a.id.empty());
  assert(a.title == "write report");
  assert(a.tier == Tier::kL2);
  assert(!a.is_completed);
  assert(!a.completed_at);
  assert(a.created_at == kT0);
  assert(a.tier_assigned_at == kT0);
}

void TestRelativeAge() {
  auto task = stash::model::MakeTask("t", Tier::kL1, kT0);

  assert(task.RelativeAge(kT0) == "just now");
  assert(task.RelativeAge(kT0 + 59s) == "just now");
  assert(task.RelativeAge(kT0 + 5min) == "5m ago");
  assert(task.RelativeAge(kT0 + 2h + 30min) == "2h ago");
  assert(task.RelativeAge(kT0 + 72h) == "3d ago");
}

void TestDwellTimeFollowsTierAssignment() {
  auto task             = stash::model::MakeTask("t", Tier::kL3, kT0);
  task.tier_assigned_at = kT0 + 1h;

  assert(task.DwellTime(kT0 + 3h) == 2h);
  // age is measured from creation, not from the tier change
  assert(task.RelativeAge(kT0 + 3h) == "3h ago");
}

void TestSystemClockSurvivesPersistence() {
  const stash::util::SystemClock clock;
  for (int i = 0; i < 1000; ++i) {
    const auto now = clock.Now();
    assert(stash::util::FromEpochSeconds(stash::util::ToEpochSeconds(now)) == now);
  }

  // any microsecond offset reads back unchanged, so a dwell check at
  // exactly the threshold sees the same instant that was written
  for (std::int64_t us = 1; us < 2'000'000; us += 7919) {
    const auto tp = kT0 + std::chrono::microseconds(us);
    assert(stash::util::FromEpochSeconds(stash::util::ToEpochSeconds(tp)) == tp);
  }
}

void TestEpochSecondsConversion() {
  const auto tp = kT0 + 1500ms;
  assert(stash::util::ToEpochSeconds(tp) == 1'800'000'001.5);
  assert(stash::util::FromEpochSeconds(1'800'000'001.5) == tp);
  assert(stash::util::FormatIso8601(kT0 + 1500ms) == "2027-01-15T08:00:01Z");
}

void TestUuidFormat() {
  for (int i = 0; i < 100; ++i) {
    const auto id = stash::util::GenerateUUIDString();
    assert(id.size() == 36);
    for (std::size_t pos = 0; pos < id.size(); ++pos) {
      if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
        assert(id[pos] == '-');
      } else {
        assert(std::isdigit(static_cast<unsigned char>(id[pos])) || (id[pos] >= 'A' && id[pos] <= 'F'));
      }
    }
    // version 4, RFC4122 variant
    assert(id[14] == '4');
    assert(std::string("89AB").find(id[19]) != std::string::npos);
  }

  stash::util::UUID fixed{};
  for (std::size_t i = 0; i < fixed.size(); ++i) fixed[i] = static_cast<std::uint8_t>(i * 17);
  assert(stash::util::ToString(fixed) == "00112233-4455-6677-8899-AABBCCDDEEFF");
}

} // namespace

int main() {
  TestMakeTask();
  TestRelativeAge();
  TestDwellTimeFollowsTierAssignment();
  TestEpochSecondsConversion();
  TestSystemClockSurvivesPersistence();
  TestUuidFormat();

  std::cout << "stash_unit_task: pass\n";
  return 0;
}
