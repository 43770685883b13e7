#pragma once

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace pv {
    inline int interp_from_str(const std::string& s) {
        if (s == "nearest") return cv::INTER_NEAREST;
        if (s == "cubic") return cv::INTER_CUBIC;
        if (s == "area") return cv::INTER_AREA;
        return cv::INTER_LINEAR;
    }

    // Largest rect with the aspect of `src` that fits in `canvas`, centered.
    inline cv::Rect letterbox_rect(cv::Size src, cv::Size canvas) {
        if (src.width <= 0 || src.height <= 0) return {0, 0, canvas.width, canvas.height};

        const double scale = std::min(static_cast<double>(canvas.width) / src.width,
                                      static_cast<double>(canvas.height) / src.height);
        const int w = std::clamp(static_cast<int>(src.width * scale), 1, canvas.width);
        const int h = std::clamp(static_cast<int>(src.height * scale), 1, canvas.height);
        return {(canvas.width - w) / 2, (canvas.height - h) / 2, w, h};
    }

    // Display size 0 means "as decoded".
    inline cv::Mat fit_frame(const cv::Mat& src, int target_w, int target_h, bool keep_aspect, int interp) {
        const cv::Size canvas(target_w, target_h);
        if (src.empty() || target_w <= 0 || target_h <= 0 || src.size() == canvas) return src;

        cv::Mat out;
        if (!keep_aspect) {
            cv::resize(src, out, canvas, 0, 0, interp);
            return out;
        }

        const cv::Rect roi = letterbox_rect(src.size(), canvas);
        out = cv::Mat::zeros(canvas, src.type());
        cv::Mat view = out(roi);
        cv::resize(src, view, roi.size(), 0, 0, interp);
        return out;
    }
}
