#pragma once
#include "types.hpp"
#include <string>

namespace hzd {
enum class FrameStatus { Ready, NoFrame, Ended };

class FrameSource {
public:
    virtual ~FrameSource() = default;
    // Acquire capture resources for a session; false rejects the session.
    virtual bool open() = 0;
    // Non-blocking. NoFrame is not an error; Ended means the source went away.
    virtual FrameStatus acquire_latest_frame(RawFrame& out) = 0;
    virtual void close() = 0;
};

class InferenceRuntime {
public:
    virtual ~InferenceRuntime() = default;
    virtual bool infer(const Tensor& input, RawOutput& out) = 0;
};

class OverlaySink {
public:
    virtual ~OverlaySink() = default;
    virtual bool open() { return true; }
    // Detections already mapped to display coordinates.
    virtual void update(const Dets& dets) = 0;
    virtual void release() {}
};

class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual void speak(const std::string& message) = 0;
};
}
