// pacing_loop.cpp
#include "pacing_loop.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>

namespace vcamstudio {

const double PacingLoop::kErrorBackoffSeconds = 0.1;

double SteadyPacingClock::now() const {
    auto t = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(t).count();
}

void SteadyPacingClock::sleepFor(double seconds) {
    if (seconds > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

namespace {

// Run of the pacing thread executing on this thread, if any
thread_local const void* t_current_run = nullptr;

} // namespace

struct PacingLoop::State {
    State(FrameProvider* src, Compositor& comp, OutputSink* out, int fps,
          std::shared_ptr<PacingClock> clk)
        : source(src), compositor(comp), sink(out), clock(std::move(clk)),
          target_fps(std::max(1, fps)) {}

    FrameProvider* source;
    Compositor& compositor;
    std::atomic<OutputSink*> sink;
    std::shared_ptr<PacingClock> clock;
    std::atomic<int> target_fps;

    std::mutex callback_mutex;
    FrameCallback on_frame;
    FpsCallback on_fps;
    ErrorCallback on_error;

    // Held for a whole iteration, so an abandoned run and its successor
    // never compose at the same time
    std::mutex iteration_mutex;

    LatestSlot<ComposedFrame> published;
    PerfStats stats;
    uint64_t frame_id{0};
    int fps_frame_count{0};
    double fps_window_start{-1.0};

    // keep_running is null outside the pacing thread
    void runOnce(const std::atomic<bool>* keep_running);
    bool iterate(double start, const std::atomic<bool>* keep_running);
    void forwardToSink(const cv::Mat& composed);
    void updateFps(double now);
    void reportError(const std::string& message);
};

// One start()/stop() cycle with its own flag
struct PacingLoop::Run {
    std::atomic<bool> running{true};
    std::mutex exit_mutex;
    std::condition_variable exit_cv;
    bool exited{false};
};

PacingLoop::PacingLoop(FrameProvider* source, Compositor& compositor, OutputSink* sink,
                       int target_fps)
    : PacingLoop(source, compositor, sink, target_fps, std::make_shared<SteadyPacingClock>()) {}

PacingLoop::PacingLoop(FrameProvider* source, Compositor& compositor, OutputSink* sink,
                       int target_fps, std::shared_ptr<PacingClock> clock)
    : state_(std::make_shared<State>(source, compositor, sink, target_fps, std::move(clock))) {}

PacingLoop::~PacingLoop() {
    stop();
}

void PacingLoop::setFrameCallback(FrameCallback cb) {
    std::lock_guard<std::mutex> lock(state_->callback_mutex);
    state_->on_frame = std::move(cb);
}

void PacingLoop::setFpsCallback(FpsCallback cb) {
    std::lock_guard<std::mutex> lock(state_->callback_mutex);
    state_->on_fps = std::move(cb);
}

void PacingLoop::setErrorCallback(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(state_->callback_mutex);
    state_->on_error = std::move(cb);
}

void PacingLoop::setTargetFps(int fps) {
    state_->target_fps = std::max(1, fps);
}

int PacingLoop::getTargetFps() const {
    return state_->target_fps;
}

void PacingLoop::setSink(OutputSink* sink) {
    state_->sink = sink;
}

bool PacingLoop::getLatestFrame(ComposedFrame& out) const {
    return state_->published.get(out);
}

float PacingLoop::getFps() const {
    return state_->stats.fps;
}

PerfSnapshot PacingLoop::getStats() const {
    const PerfStats& stats = state_->stats;
    PerfSnapshot s;
    s.fps = stats.fps;
    s.frames = stats.frames;
    s.compose_time = stats.compose_time;
    s.send_time = stats.send_time;
    s.send_failures = stats.send_failures;
    s.errors = stats.errors;
    return s;
}

void PacingLoop::start() {
    if (running_) {
        return;
    }

    run_ = std::make_shared<Run>();
    running_ = true;
    thread_ = std::thread(&PacingLoop::loop, state_, run_);

    Logger::log(Logger::INFO, "Pacing loop started at " + std::to_string(getTargetFps()) + " FPS");
}

bool PacingLoop::waitForExit(Run& run) {
    std::unique_lock<std::mutex> lock(run.exit_mutex);
    return run.exit_cv.wait_for(lock, std::chrono::milliseconds(join_timeout_ms_),
                                [&run] { return run.exited; });
}

void PacingLoop::stop() {
    std::shared_ptr<Run> run = std::move(run_);
    running_ = false;
    if (run) {
        run->running = false;
    }

    if (run && t_current_run == run.get()) {
        // stop() from an observer: the loop exits once this iteration ends
        thread_.detach();
        detached_ = run;
        Logger::log(Logger::INFO, "Pacing loop stopped");
        return;
    }

    if (detached_ && t_current_run != detached_.get()) {
        if (!waitForExit(*detached_)) {
            Logger::log(Logger::WARNING, "Pacing thread stopped by its observer is still running");
        }
        detached_.reset();
    }

    if (!run) {
        return;
    }
    if (waitForExit(*run)) {
        if (thread_.joinable()) {
            thread_.join();
        }
    } else {
        Logger::log(Logger::WARNING, "Pacing thread did not exit in time, abandoning it");
        if (thread_.joinable()) {
            thread_.detach();
        }
    }
    Logger::log(Logger::INFO, "Pacing loop stopped");
}

void PacingLoop::loop(std::shared_ptr<State> state, std::shared_ptr<Run> run) {
    t_current_run = run.get();
    {
        std::lock_guard<std::mutex> lock(state->iteration_mutex);
        state->fps_frame_count = 0;
        state->fps_window_start = -1.0;
    }

    while (run->running) {
        state->runOnce(&run->running);
    }

    std::lock_guard<std::mutex> lock(run->exit_mutex);
    run->exited = true;
    run->exit_cv.notify_all();
}

void PacingLoop::runOnce() {
    state_->runOnce(nullptr);
}

void PacingLoop::State::runOnce(const std::atomic<bool>* keep_running) {
    std::lock_guard<std::mutex> lock(iteration_mutex);
    if (keep_running && !*keep_running) {
        return;
    }

    const double start = clock->now();
    try {
        if (!iterate(start, keep_running)) {
            return;
        }

        double elapsed = clock->now() - start;
        double remaining = 1.0 / target_fps - elapsed;
        if (remaining > 0.0) {
            clock->sleepFor(remaining);
        }

        updateFps(clock->now());
    } catch (const std::exception& e) {
        stats.errors++;
        reportError(e.what());
        clock->sleepFor(kErrorBackoffSeconds);
    } catch (...) {
        // Observers are caller code and may throw anything
        stats.errors++;
        reportError("unknown error");
        clock->sleepFor(kErrorBackoffSeconds);
    }
}

// False when the run was stopped during a call into a collaborator
bool PacingLoop::State::iterate(double start, const std::atomic<bool>* keep_running) {
    auto stopped = [keep_running] { return keep_running && !*keep_running; };

    if (fps_window_start < 0.0) {
        fps_window_start = start;
    }

    // Absent frame is fine, the webcam layer stays blank
    cv::Mat frame_in = source ? source->getFrame() : cv::Mat();
    if (stopped()) {
        return false;
    }

    Timer compose_timer;
    cv::Mat composed = compositor.composeFrame(frame_in);
    stats.compose_time = compose_timer.elapsed_us();
    if (stopped()) {
        return false;
    }

    forwardToSink(composed);
    if (stopped()) {
        return false;
    }

    ComposedFrame frame;
    frame.frame = composed;
    frame.timestamp_us = static_cast<uint64_t>(start * 1e6);
    frame.frame_id = frame_id++;
    stats.frames++;

    FrameCallback observer;
    {
        std::lock_guard<std::mutex> lock(callback_mutex);
        observer = on_frame;
    }
    if (observer) {
        observer(frame);
    }

    published.put(std::move(frame));
    return !stopped();
}

void PacingLoop::State::forwardToSink(const cv::Mat& composed) {
    OutputSink* out_sink = sink;
    if (out_sink == nullptr || !out_sink->isRunning()) {
        return;
    }

    cv::Mat out = composed;
    int w = out_sink->getWidth();
    int h = out_sink->getHeight();
    if (w > 0 && h > 0 && (composed.cols != w || composed.rows != h)) {
        cv::resize(composed, out, cv::Size(w, h));
    }

    Timer send_timer;
    if (!out_sink->sendFrame(out)) {
        stats.send_failures++;
        Logger::log(Logger::DEBUG, "Sink rejected frame " + std::to_string(frame_id));
    }
    stats.send_time = send_timer.elapsed_us();
}

void PacingLoop::State::updateFps(double now) {
    fps_frame_count++;
    double elapsed = now - fps_window_start;
    if (elapsed < 1.0) {
        return;
    }

    float fps = static_cast<float>(fps_frame_count / elapsed);
    stats.fps = fps;
    fps_frame_count = 0;
    fps_window_start = now;

    FpsCallback observer;
    {
        std::lock_guard<std::mutex> lock(callback_mutex);
        observer = on_fps;
    }
    if (observer) {
        observer(fps);
    }
}

void PacingLoop::State::reportError(const std::string& message) {
    Logger::log(Logger::ERROR, "Compositor iteration failed: " + message);

    ErrorCallback observer;
    {
        std::lock_guard<std::mutex> lock(callback_mutex);
        observer = on_error;
    }
    if (!observer) {
        return;
    }
    try {
        observer(message);
    } catch (const std::exception& e) {
        Logger::log(Logger::ERROR, std::string("Error observer threw: ") + e.what());
    } catch (...) {
        Logger::log(Logger::ERROR, "Error observer threw an unknown exception");
    }
}

} // namespace vcamstudio
