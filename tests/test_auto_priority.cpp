#include <catch2/catch.hpp>
#include "scan/auto_priority.hpp"

using namespace chanscan;

TEST_CASE("Voice channels are promoted past the floor") {
  AutoPriorityPromoter promoter(1);
  PriorityList priorities;
  const int64_t f = 146520000;

  REQUIRE_FALSE(promoter.observe(f, Classification::Voice, priorities));
  REQUIRE(promoter.observe(f, Classification::Voice, priorities));
  REQUIRE(priorities.contains(f));
  REQUIRE(promoter.counts(f).voice_count == 2);
  // already listed
  REQUIRE_FALSE(promoter.observe(f, Classification::Voice, priorities));
  REQUIRE(priorities.size() == 1);
}

TEST_CASE("Mostly data channels stay unlisted") {
  AutoPriorityPromoter promoter(0);
  PriorityList priorities;
  const int64_t f = 151625000;
  REQUIRE_FALSE(promoter.observe(f, Classification::Data, priorities));
  REQUIRE_FALSE(promoter.observe(f, Classification::Skip, priorities));
  REQUIRE_FALSE(promoter.observe(f, Classification::Voice, priorities));
  REQUIRE_FALSE(promoter.observe(f, Classification::Voice, priorities));
  REQUIRE(promoter.observe(f, Classification::Voice, priorities));
  auto n = promoter.counts(f);
  REQUIRE(n.voice_count == 3);
  REQUIRE(n.non_voice_count == 2);
}

TEST_CASE("Unclassified recordings are not counted") {
  AutoPriorityPromoter promoter;
  PriorityList priorities;
  REQUIRE_FALSE(promoter.observe(1, Classification::None, priorities));
  REQUIRE(promoter.counts(1).voice_count == 0);
  REQUIRE(promoter.counts(1).non_voice_count == 0);
}

TEST_CASE("Classification labels round trip") {
  REQUIRE(std::string(classification_to_string(Classification::Voice)) == "V");
  REQUIRE(classification_from_string("D") == Classification::Data);
  REQUIRE(classification_from_string("skip") == Classification::Skip);
  REQUIRE(classification_from_string("") == Classification::None);
}
