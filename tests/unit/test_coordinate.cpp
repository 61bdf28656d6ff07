#include <doctest/doctest.h>
#include "hzd/coordinate.hpp"
#include "../support.hpp"

using namespace hzd;

TEST_CASE("scale maps each axis independently"){
  Box b = scale(Box{32,64,160,320}, {320,320}, {1280,720});
  CHECK(b.left == doctest::Approx(128));
  CHECK(b.right == doctest::Approx(640));
  CHECK(b.top == doctest::Approx(144));
  CHECK(b.bottom == doctest::Approx(720));
}

TEST_CASE("scale with identical spaces is identity"){
  Box b{1.5f,2.5f,30,40};
  Box s = scale(b, {640,640}, {640,640});
  CHECK(s.left == b.left); CHECK(s.bottom == b.bottom);
}

TEST_CASE("scale_all touches every detection"){
  Dets ds{test::det(0,0,10,10,0.9f), test::det(10,10,20,20,0.5f)};
  scale_all(ds, {100,100}, {200,50});
  CHECK(ds[0].box.right == doctest::Approx(20));
  CHECK(ds[1].box.bottom == doctest::Approx(10));
  CHECK(ds[1].score == 0.5f);
}

TEST_CASE("clamp keeps edges inside bounds"){
  Box c = clamp(Box{-5,-1,700,300}, {640,320});
  CHECK(c.left == 0); CHECK(c.top == 0); CHECK(c.right == 640); CHECK(c.bottom == 300);
}
