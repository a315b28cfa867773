#include <catch2/catch.hpp>
#include "scan/channel_activity.hpp"

using namespace chanscan;

TEST_CASE("Open channels repeat an active event each interval") {
  ChannelActivityLog log(15.0);
  auto on = log.opened(2, 146520000, 0.0);
  REQUIRE(on.kind == EventKind::Opened);
  REQUIRE(on.slot == 2);
  REQUIRE(log.open_count() == 1);

  REQUIRE(log.heartbeat(10.0).empty());
  auto beat = log.heartbeat(15.0);
  REQUIRE(beat.size() == 1);
  REQUIRE(beat[0].kind == EventKind::Active);
  REQUIRE(beat[0].freq_hz == 146520000);
  REQUIRE(log.heartbeat(20.0).empty());
  REQUIRE(log.heartbeat(30.0).size() == 1);

  auto off = log.closed(2, 146520000, 31.0, Classification::Voice);
  REQUIRE(off.kind == EventKind::Closed);
  REQUIRE(off.classification == Classification::Voice);
  REQUIRE(log.open_count() == 0);
  REQUIRE(log.heartbeat(100.0).empty());
}

TEST_CASE("Zero interval disables active events") {
  ChannelActivityLog log(0.0);
  log.opened(0, 146520000, 0.0);
  REQUIRE(log.heartbeat(1000.0).empty());
}

TEST_CASE("Event names match the channel log format") {
  REQUIRE(std::string(event_to_string(EventKind::Opened)) == "on");
  REQUIRE(std::string(event_to_string(EventKind::Active)) == "act");
  REQUIRE(std::string(event_to_string(EventKind::Closed)) == "off");
}
