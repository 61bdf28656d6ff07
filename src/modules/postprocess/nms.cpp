#include "hzd/postprocess.hpp"
#include <algorithm>
namespace hzd {
float IoU(const Box& a, const Box& b){
  float x1=std::max(a.left,b.left), y1=std::max(a.top,b.top);
  float x2=std::min(a.right,b.right), y2=std::min(a.bottom,b.bottom);
  float iw=x2-x1, ih=y2-y1;
  if(iw<=0.f || ih<=0.f) return 0.f;
  float inter = iw*ih;
  return inter / (a.area() + b.area() - inter + kIoUEpsilon);
}
Dets NMS(const Dets& ds, float thr){
  auto sorted=ds; std::stable_sort(sorted.begin(), sorted.end(),[](const Detection&a,const Detection&b){return a.score>b.score;});
  std::vector<size_t> keep; std::vector<char> sup(sorted.size(),0);
  for(size_t i=0;i<sorted.size();++i){ if(sup[i]) continue; keep.push_back(i);
    for(size_t j=i+1;j<sorted.size();++j){ if(!sup[j] && IoU(sorted[i].box,sorted[j].box)>thr) sup[j]=1; } }
  Dets out; out.reserve(keep.size()); for(size_t i: keep) out.push_back(sorted[i]); return out;
}
}
