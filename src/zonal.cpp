#include "zonekit/zonal.hpp"
#include "zonekit/fields.hpp"

#include <algorithm>
#include <map>

namespace zonekit {

    namespace {
        constexpr const char *AREA = "AREA";
        constexpr const char *LENGTH = "LENGTH";
        constexpr const char *PNT_COUNT = "PNT_COUNT";
        constexpr const char *PERCENTAGE = "PERCENTAGE";

        void require_fields(const FeatureCollection &fc, const std::vector<std::string> &names, const char *layer) {
            for (const auto &name : names) {
                if (std::find(fc.fields.begin(), fc.fields.end(), name) == fc.fields.end())
                    throw MissingFieldError(std::string(layer) + " layer has no field '" + name + "'");
            }
        }

        std::string describe(const GroupKey &key) {
            if (key.empty())
                return "ALL";
            std::string out = "[";
            for (std::size_t i = 0; i < key.size(); ++i) {
                if (i > 0)
                    out += ", ";
                out += toText(key[i]);
            }
            return out + "]";
        }
    } // namespace

    MeasureAccumulator::MeasureAccumulator(const std::vector<std::string> &sum_fields) {
        sums.reserve(sum_fields.size());
        for (const auto &field : sum_fields)
            sums.emplace_back(field, 0.0);
    }

    double MeasureAccumulator::sum(const std::string &field) const {
        for (const auto &[name, value] : sums) {
            if (name == field)
                return value;
        }
        return 0.0;
    }

    void MeasureAccumulator::addToSum(const std::string &field, double value) {
        for (auto &[name, total] : sums) {
            if (name == field) {
                total += value;
                return;
            }
        }
        sums.emplace_back(field, value);
    }

    void ZonalAggregator::validateGeometryCompatibility(GeometryKind zoneKind, GeometryKind classKind) {
        if (zoneKind == GeometryKind::Unknown || classKind == GeometryKind::Unknown)
            throw IncompatibleGeometryError(std::string("Cannot summarize ") + toString(classKind) + " classes in " +
                                            toString(zoneKind) + " zones: layers must have a single geometry type");

        if (zoneKind == GeometryKind::Point &&
            (classKind == GeometryKind::Polygon || classKind == GeometryKind::Line))
            throw IncompatibleGeometryError("Class features cannot be polygons or lines when zone features are points");

        if (zoneKind == GeometryKind::Line && classKind == GeometryKind::Polygon)
            throw IncompatibleGeometryError("Class features cannot be polygons when zone features are lines");

        if (static_cast<int>(classKind) > static_cast<int>(zoneKind))
            throw IncompatibleGeometryError("Higher dimension class features are not supported for this zone type");
    }

    FeatureGroups ZonalAggregator::groupFeatures(const std::vector<Feature> &features,
                                                 const std::vector<std::string> &groupingFields) {
        FeatureGroups groups;
        if (groupingFields.empty()) {
            FeatureGroup all;
            all.features.reserve(features.size());
            for (const auto &feature : features)
                all.features.push_back(&feature);
            groups.push_back(std::move(all));
            return groups;
        }

        std::map<GroupKey, std::size_t> index;
        for (const auto &feature : features) {
            GroupKey key;
            key.reserve(groupingFields.size());
            for (const auto &field : groupingFields) {
                const FieldValue *value = findField(feature, field);
                if (!value)
                    throw MissingFieldError("Feature " + std::to_string(feature.id) + " has no field '" + field + "'");
                key.push_back(*value);
            }

            auto it = index.find(key);
            if (it == index.end()) {
                index.emplace(key, groups.size());
                groups.push_back(FeatureGroup{std::move(key), {&feature}});
            } else {
                groups[it->second].features.push_back(&feature);
            }
        }
        return groups;
    }

    Schema ZonalAggregator::outputSchema(const SummarizeConfig &config, GeometryKind zoneKind,
                                         GeometryKind classKind) {
        Schema schema;
        schema.insert(schema.end(), config.zone_fields.begin(), config.zone_fields.end());
        schema.insert(schema.end(), config.class_fields.begin(), config.class_fields.end());

        if (zoneKind == GeometryKind::Polygon && classKind == GeometryKind::Polygon)
            schema.emplace_back(AREA);
        if (classKind == GeometryKind::Line)
            schema.emplace_back(LENGTH);
        if (classKind == GeometryKind::Point)
            schema.emplace_back(PNT_COUNT);

        if (config.emit_sums) {
            for (const auto &field : config.sum_fields)
                schema.push_back("SUM_" + field);
        }

        schema.emplace_back(PERCENTAGE);
        return schema;
    }

    double ZonalAggregator::totalMeasure(const GEOSGeometry *geometry, GeometryKind kind) const {
        switch (kind) {
        case GeometryKind::Polygon:
            return engine_.area(geometry);
        case GeometryKind::Line:
            return engine_.length(geometry);
        case GeometryKind::Point:
            return 1.0;
        default:
            return 0.0;
        }
    }

    double ZonalAggregator::intersectionMeasure(const GEOSGeometry *intersection, GeometryKind zoneKind,
                                                GeometryKind classKind) const {
        if (zoneKind == GeometryKind::Polygon && classKind == GeometryKind::Polygon)
            return engine_.area(intersection);
        if (classKind == GeometryKind::Line)
            return engine_.length(intersection);
        if (classKind == GeometryKind::Point)
            return 1.0;
        return 0.0;
    }

    AccumulateOutcome ZonalAggregator::accumulate(MeasureAccumulator &accumulator, double measure,
                                                  const Feature &classFeature, const GEOSGeometry *classGeometry,
                                                  const std::vector<std::string> &sumFields) const {
        try {
            if (!classGeometry || !engine_.isValid(classGeometry))
                return {AccumulateStatus::SkippedInvalidGeometry,
                        classGeometry ? engine_.invalidReason(classGeometry) : "geometry could not be built"};

            GeometryKind kind = kindOf(classFeature);
            switch (kind) {
            case GeometryKind::Polygon:
                accumulator.area += measure;
                break;
            case GeometryKind::Line:
                accumulator.length += measure;
                break;
            case GeometryKind::Point:
                accumulator.point_count += static_cast<std::int64_t>(measure);
                break;
            default:
                break;
            }

            if (sumFields.empty())
                return {};

            double total = totalMeasure(classGeometry, kind);
            double proportion = (total != 0.0) ? measure / total : 0.0;

            for (const auto &field : sumFields) {
                FieldLookup lookup = numericField(classFeature, field);
                if (lookup.state == FieldState::Absent)
                    continue;
                // Non-numeric values contribute nothing
                accumulator.addToSum(field, lookup.value * proportion);
            }
            return {};
        } catch (const GeometryError &e) {
            return {AccumulateStatus::Failed, e.what()};
        }
    }

    double ZonalAggregator::percentage(const MeasureAccumulator &accumulator, double zoneTotalMeasure,
                                       GeometryKind zoneKind, GeometryKind classKind) {
        double denominator = 0.0;
        if (zoneKind == classKind)
            denominator = zoneTotalMeasure;
        else
            denominator = (classKind == GeometryKind::Polygon) ? accumulator.area : accumulator.length;

        if (denominator == 0.0)
            return 0.0;

        double value = 0.0;
        switch (zoneKind) {
        case GeometryKind::Polygon:
            value = accumulator.area;
            break;
        case GeometryKind::Line:
            value = accumulator.length;
            break;
        default:
            value = static_cast<double>(accumulator.point_count);
            break;
        }

        return (value / denominator) * 100.0;
    }

    SummaryReport ZonalAggregator::summarize(const SummarizeConfig &config, OutputSink &sink,
                                             Feedback &feedback) const {
        if (!config.zones || !config.classes)
            throw std::invalid_argument("ZonalAggregator::summarize: zone and class layers are required");

        const FeatureCollection &zones = *config.zones;
        const FeatureCollection &classes = *config.classes;

        GeometryKind zoneKind = kindOf(zones);
        GeometryKind classKind = kindOf(classes);
        validateGeometryCompatibility(zoneKind, classKind);

        require_fields(zones, config.zone_fields, "Zone");
        require_fields(classes, config.class_fields, "Class");
        require_fields(classes, config.sum_fields, "Class");

        Schema schema = outputSchema(config, zoneKind, classKind);

        FeatureGroups zoneGroups = groupFeatures(zones.features, config.zone_fields);
        FeatureGroups classGroups = groupFeatures(classes.features, config.class_fields);

        feedback.pushInfo("Summarizing " + std::to_string(zones.features.size()) + " " + toString(zoneKind) +
                          " zones in " + std::to_string(zoneGroups.size()) + " groups against " +
                          std::to_string(classes.features.size()) + " " + toString(classKind) + " classes in " +
                          std::to_string(classGroups.size()) + " groups");

        SummaryReport report;

        // Class geometries are built once; a null entry marks a feature that cannot be built
        std::vector<GeomPtr> classGeoms;
        std::vector<char> classValid;
        classGeoms.reserve(classes.features.size());
        classValid.reserve(classes.features.size());
        for (const auto &feature : classes.features) {
            GeomPtr geom;
            try {
                geom = engine_.build(feature);
            } catch (const GeometryError &e) {
                feedback.reportError("Class feature " + std::to_string(feature.id) + " skipped: " + e.what());
            }
            bool valid = false;
            if (geom) {
                try {
                    valid = engine_.isValid(geom.get());
                    if (!valid)
                        feedback.reportError("Class feature " + std::to_string(feature.id) +
                                             " has invalid geometry: " + engine_.invalidReason(geom.get()));
                } catch (const GeometryError &e) {
                    feedback.reportError("Class feature " + std::to_string(feature.id) + " skipped: " + e.what());
                }
            }
            if (!valid)
                ++report.invalid_class_features;
            classGeoms.push_back(std::move(geom));
            classValid.push_back(valid ? 1 : 0);
        }

        auto classIndex = [&classes](const Feature *feature) {
            return static_cast<std::size_t>(feature - classes.features.data());
        };

        const std::size_t totalPairs = zones.features.size() * classGroups.size();

        sink.open(schema);

        for (const auto &zoneGroup : zoneGroups) {
            for (const Feature *zoneFeature : zoneGroup.features) {
                if (feedback.isCanceled())
                    throw CanceledError("Summary canceled after " + std::to_string(report.pairs) + " of " +
                                        std::to_string(totalPairs) + " pairs");

                GeomPtr zoneGeom;
                double zoneTotal = 0.0;
                try {
                    zoneGeom = engine_.build(*zoneFeature);
                    zoneTotal = totalMeasure(zoneGeom.get(), zoneKind);
                } catch (const GeometryError &e) {
                    feedback.reportError("Zone feature " + std::to_string(zoneFeature->id) + " in group " +
                                         describe(zoneGroup.key) + " skipped: " + e.what());
                    ++report.feature_errors;
                    report.pairs += classGroups.size();
                    if (totalPairs > 0)
                        feedback.setProgress(static_cast<int>(report.pairs * 100 / totalPairs));
                    continue;
                }

                for (const auto &classGroup : classGroups) {
                    MeasureAccumulator acc(config.sum_fields);

                    for (const Feature *classFeature : classGroup.features) {
                        std::size_t idx = classIndex(classFeature);
                        if (!classValid[idx])
                            continue;
                        const GEOSGeometry *classGeom = classGeoms[idx].get();

                        try {
                            if (!engine_.intersects(zoneGeom.get(), classGeom))
                                continue;
                            GeomPtr inter = engine_.intersection(zoneGeom.get(), classGeom);
                            if (engine_.isEmpty(inter.get()))
                                continue;

                            double measure = intersectionMeasure(inter.get(), zoneKind, classKind);
                            AccumulateOutcome outcome =
                                accumulate(acc, measure, *classFeature, classGeom, config.sum_fields);
                            if (outcome.status == AccumulateStatus::Failed) {
                                feedback.reportError("Error processing feature " + std::to_string(classFeature->id) +
                                                     ": " + outcome.reason);
                                ++report.feature_errors;
                            }
                        } catch (const GeometryError &e) {
                            feedback.reportError("Error processing feature " + std::to_string(classFeature->id) +
                                                 ": " + e.what());
                            ++report.feature_errors;
                        }
                    }

                    double pct = percentage(acc, zoneTotal, zoneKind, classKind);
                    ++report.pairs;

                    if (acc.area != 0.0 || acc.length != 0.0 || acc.point_count != 0 || pct != 0.0) {
                        Record record;
                        record.reserve(schema.size());

                        for (const auto &field : config.zone_fields) {
                            const FieldValue *value = findField(*zoneFeature, field);
                            record.push_back(value ? *value : FieldValue{});
                        }

                        // Class values come from the last feature of the group
                        const Feature *representative = classGroup.features.back();
                        for (const auto &field : config.class_fields) {
                            const FieldValue *value = findField(*representative, field);
                            record.push_back(value ? *value : FieldValue{});
                        }

                        if (zoneKind == GeometryKind::Polygon && classKind == GeometryKind::Polygon)
                            record.emplace_back(acc.area);
                        if (classKind == GeometryKind::Line)
                            record.emplace_back(acc.length);
                        if (classKind == GeometryKind::Point)
                            record.emplace_back(static_cast<double>(acc.point_count));

                        if (config.emit_sums) {
                            for (const auto &field : config.sum_fields)
                                record.emplace_back(acc.sum(field));
                        }

                        record.emplace_back(pct);

                        sink.add(record);
                        ++report.records;
                    }

                    if (totalPairs > 0)
                        feedback.setProgress(static_cast<int>(report.pairs * 100 / totalPairs));
                }
            }
        }

        report.destination = sink.commit();
        feedback.setProgress(100);
        feedback.pushInfo("Wrote " + std::to_string(report.records) + " records to " + report.destination);
        return report;
    }

} // namespace zonekit
