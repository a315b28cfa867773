#include <catch2/catch.hpp>
#include "scan/channel_tracker.hpp"

using namespace chanscan;

TEST_CASE("Channel goes idle only after the quiet timeout") {
  ChannelStateTracker tracker(20.0);
  LockoutSet lockouts;
  PriorityList priorities;
  const int64_t f = 146520000;

  auto t0 = tracker.update({{f, -40.0f}}, 0.0, lockouts, priorities);
  REQUIRE(t0.size() == 1);
  REQUIRE(t0[0].from == ChannelState::Idle);
  REQUIRE(t0[0].to == ChannelState::Active);

  REQUIRE(tracker.update({}, 19.0, lockouts, priorities).empty());
  REQUIRE(tracker.is_active(f));

  auto t21 = tracker.update({}, 21.0, lockouts, priorities);
  REQUIRE(t21.size() == 1);
  REQUIRE(t21[0].freq_hz == f);
  REQUIRE(t21[0].to == ChannelState::Idle);
  REQUIRE_FALSE(tracker.is_active(f));
  REQUIRE(tracker.find(f) != nullptr);
}

TEST_CASE("Hearing a channel again keeps it active") {
  ChannelStateTracker tracker(12.0);
  LockoutSet lockouts;
  PriorityList priorities;
  const int64_t f = 460025000;

  tracker.update({{f, -50.0f}}, 0.0, lockouts, priorities);
  tracker.update({{f, -45.0f}}, 10.0, lockouts, priorities);
  REQUIRE(tracker.update({}, 20.0, lockouts, priorities).empty());
  const ChannelEntry *e = tracker.find(f);
  REQUIRE(e != nullptr);
  REQUIRE(e->last_seen == 10.0);
  REQUIRE(e->last_power_db == -45.0f);
  REQUIRE_FALSE(e->heard);
}

TEST_CASE("Locked out channels are tracked but not eligible") {
  ChannelStateTracker tracker(12.0);
  LockoutSet lockouts;
  lockouts.add_range(460000000, 460500000, true);
  PriorityList priorities({460600000});

  std::vector<Candidate> cands{{460200000, -40.0f}, {460600000, -50.0f}};
  tracker.update(cands, 0.0, lockouts, priorities);

  const ChannelEntry *locked = tracker.find(460200000);
  REQUIRE(locked != nullptr);
  REQUIRE(locked->is_locked_out);
  REQUIRE_FALSE(locked->is_unsaved_lockout);
  REQUIRE(tracker.find(460600000)->is_priority);

  auto eligible = tracker.eligible(cands);
  REQUIRE(eligible.size() == 1);
  REQUIRE(eligible[0].freq_hz == 460600000);
}

TEST_CASE("Flags follow runtime lockout edits") {
  ChannelStateTracker tracker(12.0);
  LockoutSet lockouts;
  PriorityList priorities;
  const int64_t f = 151000000;
  tracker.update({{f, -40.0f}}, 0.0, lockouts, priorities);
  REQUIRE_FALSE(tracker.find(f)->is_locked_out);

  lockouts.add(f);
  tracker.refresh_flags(lockouts, priorities);
  REQUIRE(tracker.find(f)->is_locked_out);
  REQUIRE(tracker.find(f)->is_unsaved_lockout);

  lockouts.clear_unsaved();
  tracker.refresh_flags(lockouts, priorities);
  REQUIRE_FALSE(tracker.find(f)->is_locked_out);
}

TEST_CASE("Long idle entries are forgotten unless recording") {
  ChannelStateTracker tracker(1.0, 30.0);
  LockoutSet lockouts;
  PriorityList priorities;
  tracker.update({{100000000, -40.0f}, {101000000, -40.0f}}, 0.0, lockouts,
                 priorities);
  tracker.begin_recording(101000000, 0.0);

  tracker.update({}, 31.0, lockouts, priorities);
  REQUIRE(tracker.find(100000000) == nullptr);
  REQUIRE(tracker.find(101000000) != nullptr);
  REQUIRE(tracker.is_recording(101000000));

  tracker.end_recording(101000000);
  tracker.update({}, 32.0, lockouts, priorities);
  REQUIRE(tracker.find(101000000) == nullptr);
}
