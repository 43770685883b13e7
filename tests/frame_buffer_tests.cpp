#include <pipeline/frame_buffer.hpp>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    pv::VideoFrame make_frame(int64_t id) {
        pv::VideoFrame f;
        f.width = 4;
        f.height = 2;
        f.pixels = cv::Mat(2, 4, CV_8UC3, cv::Scalar(static_cast<double>(id % 255), 0, 0));
        f.frame_id = id;
        return f;
    }

    void test_empty_buffer_yields_nothing() {
        pv::FrameBuffer buf;
        check(!buf.pending(), "new buffer should not be pending");
        check(!buf.try_take().has_value(), "new buffer should have nothing to take");
    }

    void test_latest_wins() {
        pv::FrameBuffer buf;
        buf.publish(make_frame(1));
        buf.publish(make_frame(2));
        buf.publish(make_frame(3));

        auto f = buf.try_take();
        check(f.has_value(), "published frame should be taken");
        check(f && f->frame_id == 3, "consumer should only see the latest frame");
        check(!buf.try_take().has_value(), "a frame must not be read twice");
        check(buf.published() == 3, "published counter should count every publish");
        check(buf.overwritten() == 2, "two unread frames were replaced");
    }

    void test_clear_drops_pending_frame() {
        pv::FrameBuffer buf;
        buf.publish(make_frame(7));
        buf.clear();
        check(!buf.pending(), "clear should reset pending");
        check(!buf.try_take().has_value(), "clear should drop the stored frame");

        buf.publish(make_frame(8));
        auto f = buf.try_take();
        check(f && f->frame_id == 8, "buffer should be reusable after clear");
    }

    void test_taken_frame_owns_its_pixels() {
        pv::FrameBuffer buf;
        buf.publish(make_frame(5));
        auto f = buf.try_take();
        buf.publish(make_frame(6));
        check(f && !f->pixels.empty(), "taken frame should keep its pixels");
        check(f && f->pixels.at<cv::Vec3b>(0, 0)[0] == 5, "taken frame should not be touched by a later publish");
    }

    void test_concurrent_producer_consumer() {
        pv::FrameBuffer buf;
        constexpr int64_t N = 5000;
        std::atomic<bool> done{false};

        std::thread producer([&] {
            for (int64_t i = 1; i <= N; ++i) buf.publish(make_frame(i));
            done = true;
        });

        std::vector<int64_t> seen;
        while (true) {
            if (auto f = buf.try_take()) seen.push_back(f->frame_id);
            else if (done) break;
            else std::this_thread::yield();
        }
        producer.join();
        if (auto f = buf.try_take()) seen.push_back(f->frame_id);

        bool increasing = true;
        for (size_t i = 1; i < seen.size(); ++i) {
            if (seen[i] <= seen[i - 1]) increasing = false;
        }
        check(!seen.empty(), "consumer should observe frames");
        check(increasing, "frames should be observed in order and never twice");
        check(!seen.empty() && seen.back() == N, "the last published frame should be observed");
        check(buf.published() == static_cast<uint64_t>(N), "every publish should be counted");
        check(buf.published() == seen.size() + buf.overwritten(), "each frame is either taken or overwritten");
    }
}

int main() {
    test_empty_buffer_yields_nothing();
    test_latest_wins();
    test_clear_drops_pending_frame();
    test_taken_frame_owns_its_pixels();
    test_concurrent_producer_consumer();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all frame buffer tests passed\n";
    return 0;
}
