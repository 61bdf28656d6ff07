#include <doctest/doctest.h>
#include "hzd/preprocess.hpp"
#include "../support.hpp"

using namespace hzd;

TEST_CASE("prepare resizes to the model input"){
  FramePreprocessor pp;
  Tensor t;
  REQUIRE(pp.prepare(test::solid_frame(100,60), {50,40}, t));
  CHECK(t.width()==50);
  CHECK(t.height()==40);
  CHECK(t.data.type()==CV_32FC3);
  CHECK(t.data.isContinuous());
  CHECK(t.size()==50u*40u*3u);
}

TEST_CASE("prepare ignores row padding and scales to unit range"){
  FramePreprocessor pp;
  Tensor t;
  REQUIRE(pp.prepare(test::solid_frame(37,21,12,255,0,51), {16,16}, t));
  for(int y=0;y<16;++y) for(int x=0;x<16;++x){
    auto px = t.data.at<cv::Vec3f>(y,x);
    CHECK(px[0]==doctest::Approx(1.0f));
    CHECK(px[1]==doctest::Approx(0.0f));
    CHECK(px[2]==doctest::Approx(0.2f));
  }
}

TEST_CASE("BGRA frames come out as RGB"){
  RawFrame f = test::solid_frame(8,8,0,10,20,200);  // bytes: 10,20,200,255
  f.order = PixelOrder::BGRA;
  Tensor t;
  REQUIRE(FramePreprocessor().prepare(f, {4,4}, t));
  auto px = t.data.at<cv::Vec3f>(0,0);
  CHECK(px[0]==doctest::Approx(200/255.f));
  CHECK(px[2]==doctest::Approx(10/255.f));
}

TEST_CASE("mean/std normalization"){
  ModelConfig m;
  m.normalization = Normalization::MeanStd;
  FramePreprocessor pp(PreprocessOptions::from_model(m));
  Tensor t;
  REQUIRE(pp.prepare(test::solid_frame(8,8,0,255,0,0), {4,4}, t));
  auto px = t.data.at<cv::Vec3f>(1,1);
  CHECK(px[0]==doctest::Approx((1.0f-0.485f)/0.229f).epsilon(1e-3));
  CHECK(px[1]==doctest::Approx((0.0f-0.456f)/0.224f).epsilon(1e-3));
}

TEST_CASE("prepare rejects unreadable frames"){
  FramePreprocessor pp;
  Tensor t;
  RawFrame empty;
  CHECK_FALSE(pp.prepare(empty, {32,32}, t));
  CHECK(t.data.empty());

  RawFrame zero_h = test::solid_frame(10,10);
  zero_h.height = 0;
  CHECK_FALSE(pp.prepare(zero_h, {32,32}, t));

  RawFrame short_buf = test::solid_frame(10,10);
  short_buf.pixels.resize(100);
  CHECK_FALSE(pp.prepare(short_buf, {32,32}, t));

  RawFrame narrow = test::solid_frame(10,10);
  narrow.stride = 20;
  CHECK_FALSE(pp.prepare(narrow, {32,32}, t));
}
