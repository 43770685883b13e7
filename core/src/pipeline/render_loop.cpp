#include <pipeline/render_loop.hpp>
#include <pipeline/frame_buffer.hpp>

#include <iomanip>
#include <iostream>
#include <thread>

namespace pv {
    RenderLoop::RenderLoop(FrameBuffer& buffer, IFrameDisplay& display, Options opt)
        : buffer_(buffer),
          display_(display),
          opt_(opt) {}

    void RenderLoop::run(CancellationToken& token) {
        while (!token.cancelled()) {
            ++polls_;

            if (auto frame = buffer_.try_take()) {
                try {
                    display_.show(*frame);
                    ++frames_shown_;
                    count_frame_(*frame);
                } catch (const std::exception& e) {
                    std::cerr << "[Render] display failed: " << e.what() << "\n";
                }
            }

            if (display_.poll_exit()) {
                std::cout << "[Render] exit requested\n";
                token.cancel();
                break;
            }

            std::this_thread::sleep_for(opt_.interval);
        }
    }

    void RenderLoop::count_frame_(const VideoFrame& frame) {
        const auto now = std::chrono::steady_clock::now();
        if (!first_frame_logged_) {
            std::cout << "[Render] Displaying first frame " << frame.width << "x" << frame.height << "\n";
            first_frame_logged_ = true;
            window_start_ = now;
        }
        ++window_frames_;

        const auto elapsed = now - window_start_;
        if (elapsed < opt_.stats_window) return;

        const double secs = std::chrono::duration<double>(elapsed).count();
        std::cout << "[Render] " << std::fixed << std::setprecision(2)
                  << (static_cast<double>(window_frames_) / secs) << " fps displayed\n";
        std::cout.unsetf(std::ios_base::floatfield);
        window_start_ = now;
        window_frames_ = 0;
    }
}
