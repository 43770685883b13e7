#pragma once

#include <cstdint>
#include <opencv2/core.hpp>

#include <media/media_format.hpp>

namespace pv {
    struct VideoFrame {
        cv::Mat pixels;
        int width = 0;
        int height = 0;
        PixelFormat format = PixelFormat::Bgr; // layout of `pixels`
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
    };
}
