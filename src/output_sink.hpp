// output_sink.hpp
#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace vcamstudio {

// Downstream consumer of composed frames (virtual camera, recorder, ...).
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Empty preferred_backend means "pick the first that works".
    virtual bool start(const std::string& preferred_backend = "") = 0;
    // Frames are BGR at any size; the sink must not keep a reference after returning.
    virtual bool sendFrame(const cv::Mat& frame) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;
    virtual std::string getLastError() const = 0;
    virtual std::string getBackendName() const = 0;
};

} // namespace vcamstudio
