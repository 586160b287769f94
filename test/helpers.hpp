#pragma once

#include "zonekit/feedback.hpp"
#include "zonekit/types.hpp"

#include <string>
#include <vector>

namespace dp = ::datapod;

namespace testutil {

    inline dp::Polygon ring(const std::vector<dp::Point> &pts) {
        return dp::Polygon{dp::Vector<dp::Point>{pts.begin(), pts.end()}};
    }

    inline zonekit::Surface rect(double x0, double y0, double x1, double y1) {
        return zonekit::Surface{ring({dp::Point{x0, y0, 0.0}, dp::Point{x1, y0, 0.0}, dp::Point{x1, y1, 0.0},
                                      dp::Point{x0, y1, 0.0}}),
                                {}};
    }

    inline zonekit::Feature feature(std::int64_t id, zonekit::Geometry geometry, zonekit::Properties props = {}) {
        zonekit::Feature f;
        f.id = id;
        f.parts.push_back(std::move(geometry));
        f.properties = std::move(props);
        return f;
    }

    inline zonekit::FeatureCollection collection(std::vector<zonekit::Feature> features) {
        zonekit::FeatureCollection fc;
        fc.datum = dp::Geo{52.0, 5.0, 0.0};
        fc.heading = dp::Euler{0.0, 0.0, 0.0};
        for (auto &f : features)
            zonekit::addFeature(fc, std::move(f));
        return fc;
    }

    // Collects everything reported and can cancel once progress reaches a threshold
    class RecordingFeedback : public zonekit::Feedback {
      public:
        void setProgress(int percent) override {
            progress.push_back(percent);
            if (cancel_at >= 0 && percent >= cancel_at)
                canceled = true;
        }
        void pushInfo(const std::string &message) override { infos.push_back(message); }
        void reportError(const std::string &message) override { errors.push_back(message); }
        bool isCanceled() const override { return canceled; }

        std::vector<int> progress;
        std::vector<std::string> infos;
        std::vector<std::string> errors;
        bool canceled = false;
        int cancel_at = -1;
    };

} // namespace testutil
