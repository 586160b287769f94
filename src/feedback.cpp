#include "zonekit/feedback.hpp"

#include <algorithm>
#include <iostream>

namespace zonekit {

    StreamFeedback::StreamFeedback() : StreamFeedback(std::cout, std::cerr) {}

    StreamFeedback::StreamFeedback(std::ostream &out, std::ostream &err, bool show_progress)
        : out_(out), err_(err), show_progress_(show_progress) {}

    void StreamFeedback::setProgress(int percent) {
        percent = std::clamp(percent, 0, 100);
        if (percent == progress_)
            return;
        progress_ = percent;
        if (show_progress_)
            out_ << "PROGRESS: " << percent << "%\n" << std::flush;
    }

    void StreamFeedback::pushInfo(const std::string &message) { out_ << message << "\n"; }

    void StreamFeedback::reportError(const std::string &message) {
        ++errors_;
        err_ << "ERROR: " << message << "\n";
    }

} // namespace zonekit
