#pragma once

#include <concord/concord.hpp>
#include <datapod/datapod.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dp = ::datapod;

namespace zonekit {

    // Polygon shell with optional interior rings (holes)
    struct Surface {
        dp::Polygon shell;
        std::vector<dp::Polygon> holes;
    };

    // Internal geometry representation: all coordinates are stored as Point (ENU/local system)
    // dp::Segment and std::vector<dp::Point> are both lines
    using Geometry = std::variant<dp::Point, dp::Segment, std::vector<dp::Point>, Surface>;

    // Ordered by topological dimension
    enum class GeometryKind { Point = 0, Line = 1, Polygon = 2, Unknown = 3 };

    // Simple CRS representation - used for input parsing and output formatting
    enum class CRS { WGS, ENU };

    // null, boolean, number, string
    using FieldValue = std::variant<std::monostate, bool, double, std::string>;

    using Properties = std::unordered_map<std::string, FieldValue>;

    // Attribute-only output: column names and one value per column
    using Schema = std::vector<std::string>;
    using Record = std::vector<FieldValue>;

    struct Feature {
        std::int64_t id = 0;
        std::vector<Geometry> parts; // more than one part for Multi* geometries
        Properties properties;
    };

    struct FeatureCollection {
        dp::Geo datum;
        dp::Euler heading;
        std::vector<Feature> features;
        std::vector<std::string> fields; // property names, first-seen order
        GeometryKind declared_kind = GeometryKind::Unknown; // used when there are no features
        std::unordered_map<std::string, std::string> global_properties;
    };

    // Appends a feature and registers its property names in the collection's field list
    inline void addFeature(FeatureCollection &fc, Feature feature) {
        for (const auto &prop : feature.properties) {
            if (std::find(fc.fields.begin(), fc.fields.end(), prop.first) == fc.fields.end())
                fc.fields.push_back(prop.first);
        }
        fc.features.emplace_back(std::move(feature));
    }

    inline GeometryKind kindOf(const Geometry &geom) {
        return std::visit(
            [](auto const &shape) -> GeometryKind {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, dp::Point>) {
                    return GeometryKind::Point;
                } else if constexpr (std::is_same_v<T, Surface>) {
                    return GeometryKind::Polygon;
                } else {
                    return GeometryKind::Line;
                }
            },
            geom);
    }

    // Unknown for features without parts or with parts of different kinds
    inline GeometryKind kindOf(const Feature &feature) {
        if (feature.parts.empty())
            return GeometryKind::Unknown;
        auto kind = kindOf(feature.parts.front());
        for (const auto &part : feature.parts) {
            if (kindOf(part) != kind)
                return GeometryKind::Unknown;
        }
        return kind;
    }

    // Unknown for geometry-heterogeneous collections
    inline GeometryKind kindOf(const FeatureCollection &fc) {
        if (fc.features.empty())
            return fc.declared_kind;
        auto kind = kindOf(fc.features.front());
        for (const auto &feature : fc.features) {
            if (kindOf(feature) != kind)
                return GeometryKind::Unknown;
        }
        return kind;
    }

    inline const char *toString(GeometryKind kind) {
        switch (kind) {
        case GeometryKind::Point:
            return "point";
        case GeometryKind::Line:
            return "line";
        case GeometryKind::Polygon:
            return "polygon";
        default:
            return "unknown";
        }
    }

} // namespace zonekit
