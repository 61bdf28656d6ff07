#include "hzd/decoder.hpp"
#include "hzd/coordinate.hpp"
#include "hzd/logger.hpp"

namespace hzd {

DenseGridDecoder::DenseGridDecoder(std::vector<std::string> class_names, DenseGridOptions opts)
    : class_names_(std::move(class_names)), opts_(opts) {}

bool DenseGridDecoder::decode(const RawOutput& output, float conf_threshold,
                              cv::Size target, Dets& out) const {
    out.clear();
    const auto* g = std::get_if<DenseGridOutput>(&output);
    if (!g) {
        Logger::warn("decode: dense-grid decoder got a filtered output");
        return false;
    }

    const int class_start = opts_.has_objectness ? 5 : 4;
    const int rows = g->channels;
    const int anchors = g->anchors;
    if (rows <= class_start || anchors < 0 ||
        g->data.size() != static_cast<size_t>(rows) * static_cast<size_t>(anchors)) {
        Logger::warn("decode: dense grid shape %dx%d with %zu values (need > %d channels)",
                     rows, anchors, g->data.size(), class_start);
        return false;
    }

    const int num_classes = rows - class_start;
    const auto tw = static_cast<float>(target.width);
    const auto th = static_cast<float>(target.height);
    auto prob = [&](float v) { return opts_.scores_are_logits ? sigmoid(v) : v; };

    for (int i = 0; i < anchors; ++i) {
        float objectness = 1.0f;
        if (opts_.has_objectness) {
            objectness = prob(g->at(4, i));
            if (objectness < opts_.objectness_gate) continue;
        }

        int best_cls = 0;
        float best_p = prob(g->at(class_start, i));
        for (int c = 1; c < num_classes; ++c) {
            float p = prob(g->at(class_start + c, i));
            if (p > best_p) {
                best_p = p;
                best_cls = c;
            }
        }

        const float score = objectness * best_p;
        if (score < conf_threshold) continue;

        const float cx = g->at(0, i);
        const float cy = g->at(1, i);
        const float bw = g->at(2, i);
        const float bh = g->at(3, i);
        Box box = clamp(Box{(cx - bw / 2.f) * tw, (cy - bh / 2.f) * th,
                            (cx + bw / 2.f) * tw, (cy + bh / 2.f) * th},
                        target);

        // Skip tiny boxes (noise).
        if (box.width() < opts_.min_box_px || box.height() < opts_.min_box_px || !box.valid()) continue;

        Detection d;
        d.box = box;
        d.class_id = best_cls;
        d.label = best_cls < static_cast<int>(class_names_.size()) ? class_names_[best_cls] : kUnknownLabel;
        d.category = category_for_label(d.label);
        d.score = score;
        out.push_back(std::move(d));
    }

    Logger::debug("decode: %zu candidates from %d anchors", out.size(), anchors);
    return true;
}

std::unique_ptr<OutputDecoder> make_decoder(const ModelConfig& model) {
    switch (model.layout) {
        case OutputLayout::Filtered:
            return std::make_unique<FilteredDecoder>(model.class_names, model.input_size);
        case OutputLayout::DenseGrid:
            return std::make_unique<DenseGridDecoder>(model.class_names, model.dense);
    }
    return nullptr;
}

}  // namespace hzd
