#include <pipeline/cv_window_display.hpp>

#include <common/resize.hpp>

#include <opencv2/highgui.hpp>

namespace pv {
    CvWindowDisplay::CvWindowDisplay(DisplayConfig cfg)
        : cfg_(std::move(cfg)),
          interp_(interp_from_str(cfg_.interp)) {
        cv::namedWindow(cfg_.window_name, cv::WINDOW_AUTOSIZE);
    }

    CvWindowDisplay::~CvWindowDisplay() {
        cv::destroyWindow(cfg_.window_name);
    }

    void CvWindowDisplay::show(const VideoFrame& frame) {
        if (frame.pixels.empty()) return;
        cv::imshow(cfg_.window_name,
                   fit_frame(frame.pixels, cfg_.width, cfg_.height, cfg_.keep_aspect, interp_));
    }

    bool CvWindowDisplay::poll_exit() {
        return is_exit_key(cv::waitKey(1));
    }
}
