#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdint>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <csignal>
#include <opencv2/highgui.hpp>

#include "capture.hpp"
#include "compositor.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "pacing_loop.hpp"
#include "text_renderer.hpp"
#include "utils.hpp"
#include "virtual_camera.hpp"

using namespace vcamstudio;
using namespace std::chrono;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutting down..." << std::endl;
        g_running = false;
    }
}

static void handleKey(int key, Compositor& compositor) {
    CountdownLayer& countdown = compositor.countdownLayer();
    switch (key) {
        case 'q':
        case 27:  // ESC
            g_running = false;
            break;
        case 's':
            countdown.setVisible(true);
            countdown.start();
            Logger::log(Logger::INFO, "Countdown started");
            break;
        case 'p':
            countdown.togglePause();
            Logger::log(Logger::INFO, countdown.isPaused() ? "Countdown paused" : "Countdown resumed");
            break;
        case 'r':
            countdown.reset();
            Logger::log(Logger::INFO, "Countdown reset");
            break;
        case 't': {
            TickerLayer& ticker = compositor.tickerLayer();
            ticker.setVisible(!ticker.isVisible());
            break;
        }
        case 'i': {
            IndicatorLayer& indicators = compositor.indicatorLayer();
            indicators.setVisible(!indicators.isVisible());
            break;
        }
        case 'l':
            compositor.tickerLayer().reloadText();
            compositor.indicatorLayer().reload();
            Logger::log(Logger::INFO, "Ticker and indicator files reloaded");
            break;
        case 'm': {
            WebcamLayer& webcam = compositor.webcamLayer();
            webcam.setFlipHorizontal(!webcam.getFlipHorizontal());
            break;
        }
        default:
            break;
    }
}

int main(int argc, char* argv[]) {
    // First pass only to find --config, second pass overrides the file
    AppConfig cfg;
    if (!parseArgs(argc, argv, cfg)) {
        printUsage(argv[0]);
        return 0;
    }
    loadConfigFile(cfg);
    parseArgs(argc, argv, cfg);

    Logger::setLevel(Logger::parseLevel(cfg.log_level));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    TextRenderer::initialize(cfg.font_path);

    Compositor compositor(cfg.output.width, cfg.output.height);
    applyConfig(cfg, compositor);

    // Capture: degrade to a blank webcam layer if no camera opens
    auto source = std::make_unique<FrameSource>(cfg.camera.device, cfg.camera.width,
                                                cfg.camera.height, cfg.camera.fps);
    if (!cfg.camera.pipeline.empty()) {
        source->setPipeline(cfg.camera.pipeline);
    }
    try {
        source->start();
    } catch (const CaptureUnavailable& e) {
        Logger::log(Logger::ERROR, std::string("Camera unavailable: ") + e.what());
        Logger::log(Logger::WARNING, "Continuing without a camera");
    }

    // Output: degrade to preview only
    std::unique_ptr<VirtualCameraOutput> sink;
    if (cfg.enable_output) {
        sink = std::make_unique<VirtualCameraOutput>(cfg.output.width, cfg.output.height,
                                                     cfg.output.fps, cfg.output.device);
        if (!cfg.output.pipeline.empty()) {
            sink->setPipeline(cfg.output.pipeline);
        }
        if (!sink->start(cfg.output.backend)) {
            Logger::log(Logger::WARNING, "Virtual camera unavailable, preview only");
        }
    }

    PacingLoop pacing(source.get(), compositor, sink.get(), cfg.output.fps);
    pacing.setFpsCallback([](float fps) {
        std::ostringstream ss;
        ss << "FPS: " << std::fixed << std::setprecision(1) << fps;
        Logger::log(Logger::DEBUG, ss.str());
    });
    pacing.setErrorCallback([](const std::string& message) {
        Logger::log(Logger::WARNING, "Frame dropped: " + message);
    });

    std::cout << "Starting vcamstudio..." << std::endl;
    std::cout << "Output: " << cfg.output.width << "x" << cfg.output.height << " @ "
              << cfg.output.fps << " FPS" << std::endl;
    if (sink && sink->isRunning()) {
        std::cout << "Virtual camera: " << cfg.output.device << " (" << sink->getBackendName()
                  << ")" << std::endl;
    }
    if (cfg.show_window) {
        std::cout << "Keys: q quit | s start countdown | p pause | r reset | t ticker | "
                  << "i indicators | l reload files | m mirror" << std::endl;
    }

    pacing.start();

    if (cfg.show_window) {
        const std::string window = "vcamstudio";
        cv::namedWindow(window, cv::WINDOW_AUTOSIZE);
        uint64_t last_shown = UINT64_MAX;
        ComposedFrame latest;

        while (g_running) {
            if (pacing.getLatestFrame(latest) && latest.frame_id != last_shown) {
                cv::imshow(window, latest.frame);
                last_shown = latest.frame_id;
            }
            int key = cv::waitKey(10);
            if (key >= 0) {
                handleKey(key & 0xFF, compositor);
            }
        }
        cv::destroyAllWindows();
    } else {
        while (g_running) {
            std::this_thread::sleep_for(seconds(1));

            PerfSnapshot stats = pacing.getStats();
            std::cout << "\rFPS: " << std::fixed << std::setprecision(1) << stats.fps
                      << " | Frames: " << stats.frames
                      << " | Compose: " << stats.compose_time << "us"
                      << " | Send: " << stats.send_time << "us"
                      << " | Send failures: " << stats.send_failures
                      << " | Errors: " << stats.errors << "    " << std::flush;
        }
        std::cout << std::endl;
    }

    pacing.stop();
    source->stop();
    if (sink) {
        sink->stop();
    }

    std::cout << "Shutdown complete." << std::endl;
    return 0;
}
