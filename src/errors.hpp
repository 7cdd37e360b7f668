// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace vcamstudio {

class VcamError : public std::runtime_error {
public:
    explicit VcamError(const std::string& what) : std::runtime_error(what) {}
};

// No capture backend could open the device. Thrown by FrameSource::start.
class CaptureUnavailable : public VcamError {
public:
    explicit CaptureUnavailable(const std::string& what) : VcamError(what) {}
};

// Missing or undecodable image / ticker / indicator file.
class AssetLoadError : public VcamError {
public:
    explicit AssetLoadError(const std::string& what) : VcamError(what) {}
};

// No output backend could be initialised.
class SinkUnavailable : public VcamError {
public:
    explicit SinkUnavailable(const std::string& what) : VcamError(what) {}
};

// Per-frame capture or send failure; never escapes the iteration that hit it.
class TransientIOError : public VcamError {
public:
    explicit TransientIOError(const std::string& what) : VcamError(what) {}
};

} // namespace vcamstudio
