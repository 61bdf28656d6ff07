#include "hzd/decoder.hpp"
#include "hzd/coordinate.hpp"
#include "hzd/logger.hpp"

namespace hzd {

FilteredDecoder::FilteredDecoder(std::vector<std::string> class_names, int native_size)
    : class_names_(std::move(class_names)), native_size_(native_size) {}

bool FilteredDecoder::decode(const RawOutput& output, float conf_threshold,
                             cv::Size target, Dets& out) const {
    out.clear();
    const auto* f = std::get_if<FilteredOutput>(&output);
    if (!f) {
        Logger::warn("decode: filtered decoder got a dense-grid output");
        return false;
    }
    const size_t n = f->scores.size();
    if (f->labels.size() != n || f->boxes.size() != n * 4) {
        Logger::warn("decode: filtered output length mismatch (boxes %zu, labels %zu, scores %zu)",
                     f->boxes.size(), f->labels.size(), n);
        return false;
    }
    if (native_size_ <= 0) {
        Logger::warn("decode: native size %d", native_size_);
        return false;
    }

    const float sx = static_cast<float>(target.width) / native_size_;
    const float sy = static_cast<float>(target.height) / native_size_;
    const auto num_classes = static_cast<std::int64_t>(class_names_.size());

    for (size_t i = 0; i < n; ++i) {
        const float score = f->scores[i];
        const std::int64_t cls = f->labels[i];
        if (score < conf_threshold) continue;
        if (cls < 0 || cls >= num_classes) continue;

        const float* b = &f->boxes[i * 4];
        Box box = clamp(Box{b[0] * sx, b[1] * sy, b[2] * sx, b[3] * sy}, target);
        if (!box.valid()) continue;

        Detection d;
        d.box = box;
        d.class_id = static_cast<int>(cls);
        d.label = class_names_[static_cast<size_t>(cls)];
        d.category = category_for_label(d.label);
        d.score = score;
        out.push_back(std::move(d));
    }
    return true;
}

}  // namespace hzd
