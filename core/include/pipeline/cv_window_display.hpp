#pragma once

#include <string>

#include <common/config.hpp>
#include <pipeline/render_loop.hpp>

namespace pv {
    // HighGUI window. Must be created, used and destroyed on the same thread.
    class CvWindowDisplay : public IFrameDisplay {
    public:
        explicit CvWindowDisplay(DisplayConfig cfg);
        ~CvWindowDisplay() override;

        CvWindowDisplay(const CvWindowDisplay&) = delete;
        CvWindowDisplay& operator=(const CvWindowDisplay&) = delete;

        void show(const VideoFrame& frame) override;
        bool poll_exit() override;

        static bool is_exit_key(int key) { return key == 27 || key == 'q' || key == 'Q'; }

    private:
        DisplayConfig cfg_;
        int interp_;
    };
}
