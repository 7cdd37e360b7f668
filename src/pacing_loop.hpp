// pacing_loop.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "capture.hpp"
#include "compositor.hpp"
#include "frame_slot.hpp"
#include "output_sink.hpp"
#include "utils.hpp"

namespace vcamstudio {

class PacingClock {
public:
    virtual ~PacingClock() = default;
    virtual double now() const = 0;           // seconds, monotonic
    virtual void sleepFor(double seconds) = 0;
};

class SteadyPacingClock : public PacingClock {
public:
    double now() const override;
    void sleepFor(double seconds) override;
};

// Drives the frame cadence: pull the newest camera frame, compose, hand the
// result to the sink and observers, then sleep off the rest of the frame budget.
// Observers run on the pacing thread and must not block. An exception inside an
// iteration is reported and the loop carries on after a short back-off.
class PacingLoop {
public:
    using FrameCallback = std::function<void(const ComposedFrame&)>;
    using FpsCallback = std::function<void(float)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    // source and sink may be null (no camera / preview only)
    PacingLoop(FrameProvider* source, Compositor& compositor, OutputSink* sink,
               int target_fps = 30);
    PacingLoop(FrameProvider* source, Compositor& compositor, OutputSink* sink,
               int target_fps, std::shared_ptr<PacingClock> clock);
    ~PacingLoop();

    PacingLoop(const PacingLoop&) = delete;
    PacingLoop& operator=(const PacingLoop&) = delete;

    void start();
    // Bounded by the join timeout. A thread stuck in a collaborator is
    // abandoned and makes no further calls into source, compositor or sink.
    void stop();
    bool isRunning() const { return running_; }

    // One full iteration including the pacing sleep. Never throws.
    void runOnce();

    void setFrameCallback(FrameCallback cb);
    void setFpsCallback(FpsCallback cb);
    void setErrorCallback(ErrorCallback cb);

    void setTargetFps(int fps);
    int getTargetFps() const;
    void setSink(OutputSink* sink);
    void setJoinTimeoutMs(int ms) { join_timeout_ms_ = ms; }

    // Published state, safe from any thread
    bool getLatestFrame(ComposedFrame& out) const;
    float getFps() const;
    PerfSnapshot getStats() const;

    static const double kErrorBackoffSeconds;

private:
    // Everything the pacing thread touches lives in State, so an abandoned
    // thread never reaches into a destroyed PacingLoop.
    struct State;
    struct Run;

    std::shared_ptr<State> state_;
    std::shared_ptr<Run> run_;
    std::shared_ptr<Run> detached_;    // stopped from its own observer
    std::thread thread_;
    std::atomic<bool> running_{false};
    int join_timeout_ms_{2000};

    bool waitForExit(Run& run);
    static void loop(std::shared_ptr<State> state, std::shared_ptr<Run> run);
};

} // namespace vcamstudio
