#pragma once

#include "zonekit/feedback.hpp"
#include "zonekit/geometry.hpp"
#include "zonekit/sink.hpp"
#include "zonekit/types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zonekit {

    class IncompatibleGeometryError : public std::runtime_error {
      public:
        explicit IncompatibleGeometryError(const std::string &what) : std::runtime_error(what) {}
    };

    class MissingFieldError : public std::runtime_error {
      public:
        explicit MissingFieldError(const std::string &what) : std::runtime_error(what) {}
    };

    class CanceledError : public std::runtime_error {
      public:
        explicit CanceledError(const std::string &what) : std::runtime_error(what) {}
    };

    // Values of the grouping fields; empty for the single "ALL" group
    using GroupKey = std::vector<FieldValue>;

    struct FeatureGroup {
        GroupKey key;
        std::vector<const Feature *> features;
    };

    // Groups in first-seen order
    using FeatureGroups = std::vector<FeatureGroup>;

    // Measures of one (zone feature, class group) pair
    struct MeasureAccumulator {
        double area = 0.0;
        double length = 0.0;
        std::int64_t point_count = 0;
        std::vector<std::pair<std::string, double>> sums;

        MeasureAccumulator() = default;
        explicit MeasureAccumulator(const std::vector<std::string> &sum_fields);

        double sum(const std::string &field) const;
        void addToSum(const std::string &field, double value);
    };

    enum class AccumulateStatus { Applied, SkippedInvalidGeometry, Failed };

    struct AccumulateOutcome {
        AccumulateStatus status = AccumulateStatus::Applied;
        std::string reason;

        bool applied() const { return status == AccumulateStatus::Applied; }
    };

    struct SummarizeConfig {
        const FeatureCollection *zones = nullptr;
        std::vector<std::string> zone_fields;
        const FeatureCollection *classes = nullptr;
        std::vector<std::string> class_fields;
        std::vector<std::string> sum_fields;
        bool emit_sums = false; // adds one SUM_<field> column per sum field
    };

    struct SummaryReport {
        std::size_t records = 0;
        std::size_t pairs = 0;
        std::size_t invalid_class_features = 0;
        std::size_t feature_errors = 0;
        std::string destination;
    };

    class ZonalAggregator {
      public:
        explicit ZonalAggregator(const GeometryEngine &engine) : engine_(engine) {}

        // Throws IncompatibleGeometryError when the class kind has a higher dimension than the zone kind
        static void validateGeometryCompatibility(GeometryKind zoneKind, GeometryKind classKind);

        // Throws MissingFieldError when a feature lacks one of the grouping fields
        static FeatureGroups groupFeatures(const std::vector<Feature> &features,
                                           const std::vector<std::string> &groupingFields);

        static Schema outputSchema(const SummarizeConfig &config, GeometryKind zoneKind, GeometryKind classKind);

        // Area for polygons, length for lines, 1 for points
        double totalMeasure(const GEOSGeometry *geometry, GeometryKind kind) const;

        double intersectionMeasure(const GEOSGeometry *intersection, GeometryKind zoneKind,
                                   GeometryKind classKind) const;

        // Adds one class feature's intersection measure, and its sum field values scaled by the share of the
        // feature's own measure that the intersection covers. Invalid geometry leaves the accumulator untouched.
        AccumulateOutcome accumulate(MeasureAccumulator &accumulator, double measure, const Feature &classFeature,
                                     const GEOSGeometry *classGeometry,
                                     const std::vector<std::string> &sumFields) const;

        static double percentage(const MeasureAccumulator &accumulator, double zoneTotalMeasure,
                                 GeometryKind zoneKind, GeometryKind classKind);

        SummaryReport summarize(const SummarizeConfig &config, OutputSink &sink, Feedback &feedback) const;

      private:
        const GeometryEngine &engine_;
    };

} // namespace zonekit
