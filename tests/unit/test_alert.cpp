#include <doctest/doctest.h>
#include "hzd/alert.hpp"
#include "../support.hpp"

using namespace hzd;
using std::chrono::milliseconds;
using test::det;

TEST_CASE("same hazard set within the debounce window is announced once"){
  AlertPolicy p;
  const auto t0 = Clock::now();
  auto first = p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0);
  REQUIRE(first);
  CHECK(*first == "Pothole ahead");
  CHECK_FALSE(p.evaluate({det(0,0,10,10,0.8f,"pothole")}, t0 + milliseconds(200)));
}

TEST_CASE("changed set after the window is announced"){
  AlertPolicy p;
  const auto t0 = Clock::now();
  REQUIRE(p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0));
  CHECK_FALSE(p.evaluate({det(0,0,10,10,0.9f,"pedestrian")}, t0 + milliseconds(2999)));
  auto m = p.evaluate({det(0,0,10,10,0.9f,"pedestrian")}, t0 + milliseconds(3000));
  REQUIRE(m);
  CHECK(*m == "Pedestrian ahead");
}

TEST_CASE("unchanged set stays quiet even after the window"){
  AlertPolicy p;
  const auto t0 = Clock::now();
  REQUIRE(p.evaluate({det(0,0,10,10,0.9f,"humps")}, t0));
  CHECK_FALSE(p.evaluate({det(5,5,20,20,0.4f,"humps")}, t0 + milliseconds(10000)));
}

TEST_CASE("several categories give the generic message"){
  AlertPolicy p;
  auto m = p.evaluate({det(0,0,10,10,0.9f,"animals"), det(0,0,10,10,0.9f,"roadworks"),
                       det(0,0,10,10,0.5f,"animals")}, Clock::now());
  REQUIRE(m);
  CHECK(*m == kMultipleHazardsMessage);
}

TEST_CASE("no detections: nothing said, state untouched"){
  AlertPolicy p;
  const auto t0 = Clock::now();
  CHECK_FALSE(p.evaluate({}, t0));
  // the empty frame must not have started a debounce window
  CHECK(p.evaluate({det(0,0,10,10,0.9f,"animals")}, t0 + milliseconds(1)));
}

TEST_CASE("phrases per category and unknown labels"){
  CHECK(alert_phrase("humps") == "Speed hump ahead");
  CHECK(alert_phrase("animals") == "Animal on road");
  CHECK(alert_phrase("roadworks") == "Road work ahead");
  CHECK(alert_phrase("cones") == "cones detected");
}

TEST_CASE("disabled policy never speaks"){
  AlertConfig cfg;
  cfg.enabled = false;
  AlertPolicy p(cfg);
  CHECK_FALSE(p.evaluate({det(0,0,10,10,0.9f,"pothole")}, Clock::now()));
}

TEST_CASE("leading-label strategy"){
  AlertConfig cfg;
  cfg.strategy = AlertStrategy::LeadingLabel;
  cfg.debounce = milliseconds(3000);
  AlertPolicy p(cfg);
  const auto t0 = Clock::now();

  auto m = p.evaluate({det(0,0,10,10,0.9f,"pedestrian"), det(0,0,10,10,0.8f,"pothole")}, t0);
  REQUIRE(m);
  CHECK(*m == "Pedestrian ahead");
  CHECK_FALSE(p.evaluate({det(0,0,10,10,0.9f,"pedestrian")}, t0 + milliseconds(500)));

  auto changed = p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0 + milliseconds(600));
  REQUIRE(changed);
  CHECK(*changed == "Pothole ahead");

  CHECK_FALSE(p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0 + milliseconds(3000)));
  CHECK(p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0 + milliseconds(3600)));
}

TEST_CASE("reset forgets the last announcement"){
  AlertPolicy p;
  const auto t0 = Clock::now();
  REQUIRE(p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0));
  p.reset();
  CHECK(p.evaluate({det(0,0,10,10,0.9f,"pothole")}, t0 + milliseconds(10)));
}

TEST_CASE("strategy names"){
  CHECK(parse_alert_strategy("leading") == AlertStrategy::LeadingLabel);
  CHECK(parse_alert_strategy("set") == AlertStrategy::HazardSet);
  CHECK(parse_alert_strategy("bogus", AlertStrategy::LeadingLabel) == AlertStrategy::LeadingLabel);
}

TEST_CASE("labels outside the hazard categories are not announced"){
  AlertPolicy p;
  const auto t0 = Clock::now();
  CHECK_FALSE(p.evaluate({det(0,0,10,10,0.9f,kUnknownLabel), det(0,0,10,10,0.8f,"cones")}, t0));
  // nothing was recorded, so a real hazard right after is still spoken
  auto m = p.evaluate({det(0,0,10,10,0.9f,"cones"), det(0,0,10,10,0.7f,"pothole")}, t0 + milliseconds(1));
  REQUIRE(m);
  CHECK(*m == "Pothole ahead");
}

TEST_CASE("label spellings of one category count as one hazard"){
  AlertPolicy p;
  auto m = p.evaluate({det(0,0,10,10,0.9f,"person"), det(0,0,10,10,0.8f,"pedestrian")}, Clock::now());
  REQUIRE(m);
  CHECK(*m == "Pedestrian ahead");

  AlertConfig cfg;
  cfg.strategy = AlertStrategy::LeadingLabel;
  AlertPolicy lead(cfg);
  const auto t0 = Clock::now();
  auto first = lead.evaluate({det(0,0,10,10,0.9f,"unknown"), det(0,0,10,10,0.8f,"humps")}, t0);
  REQUIRE(first);
  CHECK(*first == "Speed hump ahead");
  CHECK_FALSE(lead.evaluate({det(0,0,10,10,0.9f,"speed_hump")}, t0 + milliseconds(100)));
}
