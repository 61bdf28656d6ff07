#pragma once
#include "hzd/interfaces.hpp"
#include "hzd/types.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace hzd::test {
inline Detection det(float l, float t, float r, float b, float score, const std::string& label = "pothole") {
    Detection d;
    d.box = Box{l, t, r, b};
    d.label = label;
    d.category = category_for_label(label);
    d.score = score;
    return d;
}

// Solid-color RGBA frame, optionally with padded rows.
inline RawFrame solid_frame(int w, int h, int pad = 0, std::uint8_t r = 255, std::uint8_t g = 0, std::uint8_t b = 0) {
    RawFrame f;
    f.width = w;
    f.height = h;
    f.stride = w * 4 + pad;
    f.order = PixelOrder::RGBA;
    f.pixels.assign(static_cast<size_t>(f.stride) * h, 0xEE);   // padding bytes are garbage
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x) {
            std::uint8_t* p = &f.pixels[static_cast<size_t>(y) * f.stride + x * 4];
            p[0] = r; p[1] = g; p[2] = b; p[3] = 255;
        }
    return f;
}

// Dense grid with every anchor far below any gate, so tests set only what they need.
inline DenseGridOutput empty_grid(int classes, int anchors) {
    DenseGridOutput g;
    g.channels = 5 + classes;
    g.anchors = anchors;
    g.data.assign(static_cast<size_t>(g.channels) * anchors, -10.f);
    return g;
}

inline void set_anchor(DenseGridOutput& g, int b, float cx, float cy, float w, float h, float obj_logit,
                       const std::vector<float>& class_logits) {
    auto at = [&](int c) -> float& { return g.data[static_cast<size_t>(c) * g.anchors + b]; };
    at(0) = cx; at(1) = cy; at(2) = w; at(3) = h; at(4) = obj_logit;
    for (size_t c = 0; c < class_logits.size(); ++c) at(5 + static_cast<int>(c)) = class_logits[c];
}

class ScriptedSource : public FrameSource {
public:
    bool accept_open = true;
    int frames_before_end = -1;   // -1: never ends
    int no_frame_every = 0;       // every Nth poll returns NoFrame
    std::atomic<int> opens{0}, closes{0}, polls{0}, delivered{0};

    bool open() override { ++opens; return accept_open; }
    FrameStatus acquire_latest_frame(RawFrame& out) override {
        int n = ++polls;
        if (frames_before_end >= 0 && delivered >= frames_before_end) return FrameStatus::Ended;
        if (no_frame_every > 0 && n % no_frame_every == 0) return FrameStatus::NoFrame;
        out = solid_frame(64, 48);
        out.id = ++delivered;
        return FrameStatus::Ready;
    }
    void close() override { ++closes; }
};

class ScriptedRuntime : public InferenceRuntime {
public:
    RawOutput output;
    bool fail = false;
    bool throw_error = false;
    bool throw_value = false;          // throws something outside std::exception
    std::atomic<bool> hold{false};     // infer parks until this is cleared
    std::atomic<bool> holding{false};
    std::atomic<int> calls{0};

    bool infer(const Tensor&, RawOutput& out) override {
        ++calls;
        if (hold) {
            holding = true;
            while (hold) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (throw_error) throw std::runtime_error("runtime exploded");
        if (throw_value) throw 42;
        if (fail) return false;
        out = output;
        return true;
    }
};

class RecordingOverlay : public OverlaySink {
public:
    std::atomic<int> updates{0}, releases{0};
    std::mutex mu;
    Dets last;

    void update(const Dets& dets) override {
        std::lock_guard<std::mutex> lk(mu);
        last = dets;
        ++updates;
    }
    void release() override { ++releases; }
};

class RecordingAlerts : public AlertSink {
public:
    std::mutex mu;
    std::vector<std::string> messages;

    void speak(const std::string& m) override {
        std::lock_guard<std::mutex> lk(mu);
        messages.push_back(m);
    }
    size_t count() {
        std::lock_guard<std::mutex> lk(mu);
        return messages.size();
    }
};
}  // namespace hzd::test
