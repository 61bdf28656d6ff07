#include <doctest/doctest.h>
#include "hzd/postprocess.hpp"
#include "../support.hpp"

using namespace hzd;
using hzd::test::det;

TEST_CASE("NMS simple"){
  Dets ds{det(0,0,10,10,0.9f), det(1,1,10,10,0.8f)};
  auto out = NMS(ds, 0.5f);
  REQUIRE(out.size()==1);
  CHECK(out[0].score==0.9f);
}

TEST_CASE("NMS keeps all disjoint boxes, ordered by score"){
  Dets ds{det(0,0,10,10,0.3f), det(20,0,30,10,0.9f), det(40,0,50,10,0.6f)};
  auto out = NMS(ds, 0.1f);
  REQUIRE(out.size()==3);
  CHECK(out[0].score==0.9f);
  CHECK(out[1].score==0.6f);
  CHECK(out[2].score==0.3f);
}

TEST_CASE("NMS identical boxes keep the higher score"){
  Dets ds{det(0,0,10,10,0.4f,"animals"), det(0,0,10,10,0.7f,"pedestrian")};
  auto out = NMS(ds, 0.45f);
  REQUIRE(out.size()==1);
  CHECK(out[0].label=="pedestrian");
}

TEST_CASE("NMS identical boxes with tied scores keep the first"){
  Dets ds{det(0,0,10,10,0.5f,"humps"), det(0,0,10,10,0.5f,"pothole")};
  auto out = NMS(ds, 0.45f);
  REQUIRE(out.size()==1);
  CHECK(out[0].label=="humps");
}

TEST_CASE("NMS output has no pair above the threshold"){
  Dets ds;
  for(int i=0;i<30;++i){
    float x = static_cast<float>((i*7)%50), y = static_cast<float>((i*13)%40);
    ds.push_back(det(x,y,x+20,y+25,0.2f+0.02f*((i*11)%30)));
  }
  const float thr = 0.3f;
  auto out = NMS(ds, thr);
  CHECK(!out.empty());
  for(size_t i=0;i<out.size();++i) for(size_t j=i+1;j<out.size();++j) CHECK(IoU(out[i].box,out[j].box) <= thr);
  for(size_t i=1;i<out.size();++i) CHECK(out[i-1].score >= out[i].score);
}

TEST_CASE("NMS is deterministic and leaves the input alone"){
  Dets ds{det(0,0,10,10,0.5f), det(2,2,12,12,0.9f), det(50,50,60,60,0.5f)};
  auto a = NMS(ds, 0.45f), b = NMS(ds, 0.45f);
  REQUIRE(a.size()==b.size());
  for(size_t i=0;i<a.size();++i){ CHECK(a[i].score==b[i].score); CHECK(a[i].box.left==b[i].box.left); }
  CHECK(ds[0].score==0.5f);
  CHECK(NMS({}, 0.5f).empty());
}
