#pragma once

#include <json.h>

#include "zonekit/types.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <variant>
#include <vector>

namespace zonekit {

    namespace detail {
        // RAII wrapper for json_value_s to ensure proper cleanup
        struct JsonDeleter {
            void operator()(json_value_s *ptr) const {
                if (ptr)
                    free(ptr);
            }
        };
        using JsonPtr = std::unique_ptr<json_value_s, JsonDeleter>;

        // Helper to find an element in a JSON object by key
        inline json_object_element_s *find_element(json_object_s *obj, const char *key) {
            if (!obj)
                return nullptr;
            for (auto *elem = obj->start; elem; elem = elem->next) {
                if (elem->name && strcmp(elem->name->string, key) == 0) {
                    return elem;
                }
            }
            return nullptr;
        }

        inline std::string get_string(json_value_s *val) {
            if (!val || val->type != json_type_string)
                return "";
            auto *str = static_cast<json_string_s *>(val->payload);
            return std::string(str->string, str->string_size);
        }

        inline double get_number(json_value_s *val) {
            if (!val || val->type != json_type_number)
                return 0.0;
            auto *num = static_cast<json_number_s *>(val->payload);
            return std::stod(std::string(num->number, num->number_size));
        }

        inline json_object_s *get_object(json_value_s *val) {
            if (!val || val->type != json_type_object)
                return nullptr;
            return static_cast<json_object_s *>(val->payload);
        }

        inline json_array_s *get_array(json_value_s *val) {
            if (!val || val->type != json_type_array)
                return nullptr;
            return static_cast<json_array_s *>(val->payload);
        }

        // Helper to serialize a JSON value to string
        inline std::string serialize_value(json_value_s *val) {
            if (!val)
                return "null";

            switch (val->type) {
            case json_type_string: {
                auto *str = static_cast<json_string_s *>(val->payload);
                return "\"" + std::string(str->string, str->string_size) + "\"";
            }
            case json_type_number: {
                auto *num = static_cast<json_number_s *>(val->payload);
                return std::string(num->number, num->number_size);
            }
            case json_type_true:
                return "true";
            case json_type_false:
                return "false";
            case json_type_null:
                return "null";
            case json_type_object: {
                auto *obj = static_cast<json_object_s *>(val->payload);
                std::string result = "{";
                bool first = true;
                for (auto *elem = obj->start; elem; elem = elem->next) {
                    if (!first)
                        result += ",";
                    first = false;
                    result += "\"" + std::string(elem->name->string, elem->name->string_size) + "\":";
                    result += serialize_value(elem->value);
                }
                result += "}";
                return result;
            }
            case json_type_array: {
                auto *arr = static_cast<json_array_s *>(val->payload);
                std::string result = "[";
                bool first = true;
                for (auto *elem = arr->start; elem; elem = elem->next) {
                    if (!first)
                        result += ",";
                    first = false;
                    result += serialize_value(elem->value);
                }
                result += "]";
                return result;
            }
            default:
                return "null";
            }
        }

        inline JsonPtr parse_json(const std::string &content) {
            json_value_s *root = json_parse(content.c_str(), content.size());
            if (!root) {
                throw std::runtime_error("zonekit::ReadFeatureCollection(): failed to parse JSON");
            }
            return JsonPtr(root);
        }

        inline JsonPtr read_json_file(const std::filesystem::path &file) {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("zonekit::ReadFeatureCollection(): cannot open \"" + file.string() + '\"');
            }

            std::stringstream buffer;
            buffer << ifs.rdbuf();
            JsonPtr j = parse_json(buffer.str());

            auto *obj = get_object(j.get());
            auto *type_elem = find_element(obj, "type");
            if (!type_elem || type_elem->value->type != json_type_string) {
                throw std::runtime_error(
                    "zonekit::ReadFeatureCollection(): top-level object has no string 'type' field");
            }

            std::string type = get_string(type_elem->value);

            if (type != "FeatureCollection") {
                throw std::runtime_error("zonekit::ReadFeatureCollection(): expected a FeatureCollection, got " + type);
            }
            return j;
        }

        // Typed property value; arrays and objects are kept as their JSON text
        inline FieldValue parse_value(json_value_s *val) {
            if (!val)
                return std::monostate{};
            switch (val->type) {
            case json_type_null:
                return std::monostate{};
            case json_type_true:
                return true;
            case json_type_false:
                return false;
            case json_type_number:
                return get_number(val);
            case json_type_string:
                return get_string(val);
            default:
                return serialize_value(val);
            }
        }

        inline Properties parse_properties(json_object_s *props, std::vector<std::string> &fields) {
            Properties m;
            if (!props)
                return m;

            for (auto *elem = props->start; elem; elem = elem->next) {
                std::string key(elem->name->string, elem->name->string_size);
                if (std::find(fields.begin(), fields.end(), key) == fields.end())
                    fields.push_back(key);
                m[key] = parse_value(elem->value);
            }
            return m;
        }

        inline dp::Point parse_point(json_array_s *coords, const dp::Geo &datum, zonekit::CRS crs) {
            if (!coords || coords->length < 2) {
                throw std::runtime_error("Invalid point coordinates");
            }

            auto *x_elem = coords->start;
            auto *y_elem = x_elem->next;
            auto *z_elem = y_elem ? y_elem->next : nullptr;

            double x = get_number(x_elem->value);
            double y = get_number(y_elem->value);
            bool has_z = (z_elem != nullptr);
            double z = has_z ? get_number(z_elem->value) : 0.0;

            if (crs == zonekit::CRS::ENU) {
                return dp::Point{x, y, z};
            } else {
                // 2D input uses the datum altitude so the ENU frame gets no curvature offset in Z
                double wgs_alt = has_z ? z : datum.altitude;
                concord::earth::WGS wgs{y, x, wgs_alt};
                auto enu = concord::frame::to_enu(datum, wgs);
                double enu_z = has_z ? enu.up() : (z - datum.altitude);
                return dp::Point{enu.east(), enu.north(), enu_z};
            }
        }

        inline std::vector<dp::Point> parse_positions(json_array_s *coords, const dp::Geo &datum, zonekit::CRS crs) {
            std::vector<dp::Point> pts;
            if (!coords)
                return pts;

            for (auto *elem = coords->start; elem; elem = elem->next) {
                auto *pt_arr = get_array(elem->value);
                if (pt_arr) {
                    pts.push_back(parse_point(pt_arr, datum, crs));
                }
            }
            return pts;
        }

        inline Geometry parse_line_string(json_array_s *coords, const dp::Geo &datum, zonekit::CRS crs) {
            auto pts = parse_positions(coords, datum, crs);
            if (pts.size() == 2)
                return dp::Segment{pts[0], pts[1]};
            else
                return pts;
        }

        inline Surface parse_polygon(json_array_s *coords, const dp::Geo &datum, zonekit::CRS crs) {
            Surface surface;
            if (!coords)
                return surface;

            bool outer = true;
            for (auto *ring_elem = coords->start; ring_elem; ring_elem = ring_elem->next) {
                auto pts = parse_positions(get_array(ring_elem->value), datum, crs);
                dp::Polygon ring{dp::Vector<dp::Point>{pts.begin(), pts.end()}};
                if (outer) {
                    surface.shell = ring;
                    outer = false;
                } else {
                    surface.holes.push_back(ring);
                }
            }
            return surface;
        }

        inline std::vector<Geometry> parse_geometry(json_object_s *geom, const dp::Geo &datum, zonekit::CRS crs) {
            std::vector<Geometry> out;
            if (!geom)
                return out;

            auto *type_elem = find_element(geom, "type");
            if (!type_elem)
                return out;

            std::string type = get_string(type_elem->value);
            auto *coords_elem = find_element(geom, "coordinates");
            auto *coords = coords_elem ? get_array(coords_elem->value) : nullptr;

            if (type == "Point") {
                if (coords) {
                    out.emplace_back(parse_point(coords, datum, crs));
                }
            } else if (type == "LineString") {
                if (coords) {
                    out.emplace_back(parse_line_string(coords, datum, crs));
                }
            } else if (type == "Polygon") {
                if (coords) {
                    out.emplace_back(parse_polygon(coords, datum, crs));
                }
            } else if (type == "MultiPoint") {
                if (coords) {
                    for (auto *elem = coords->start; elem; elem = elem->next) {
                        auto *pt_arr = get_array(elem->value);
                        if (pt_arr) {
                            out.emplace_back(parse_point(pt_arr, datum, crs));
                        }
                    }
                }
            } else if (type == "MultiLineString") {
                if (coords) {
                    for (auto *elem = coords->start; elem; elem = elem->next) {
                        auto *line_arr = get_array(elem->value);
                        if (line_arr) {
                            out.emplace_back(parse_line_string(line_arr, datum, crs));
                        }
                    }
                }
            } else if (type == "MultiPolygon") {
                if (coords) {
                    for (auto *elem = coords->start; elem; elem = elem->next) {
                        auto *poly_arr = get_array(elem->value);
                        if (poly_arr) {
                            out.emplace_back(parse_polygon(poly_arr, datum, crs));
                        }
                    }
                }
            } else if (type == "GeometryCollection") {
                auto *geoms_elem = find_element(geom, "geometries");
                auto *geoms_arr = geoms_elem ? get_array(geoms_elem->value) : nullptr;
                if (geoms_arr) {
                    for (auto *elem = geoms_arr->start; elem; elem = elem->next) {
                        auto *sub_obj = get_object(elem->value);
                        if (sub_obj) {
                            auto subs = parse_geometry(sub_obj, datum, crs);
                            out.insert(out.end(), subs.begin(), subs.end());
                        }
                    }
                }
            } else {
                throw std::runtime_error("Unsupported geometry type: " + type);
            }
            return out;
        }

        inline zonekit::CRS parse_crs(const std::string &s) {
            if (s == "EPSG:4326" || s == "WGS84" || s == "WGS")
                return zonekit::CRS::WGS;
            else if (s == "ENU" || s == "ECEF")
                return zonekit::CRS::ENU;
            throw std::runtime_error("Unknown CRS string: " + s);
        }
    } // namespace detail

    inline FeatureCollection ReadFeatureCollection(const std::filesystem::path &file) {
        auto fc_json = detail::read_json_file(file);
        auto *fc_obj = detail::get_object(fc_json.get());

        auto *props_elem = detail::find_element(fc_obj, "properties");
        if (!props_elem || props_elem->value->type != json_type_object)
            throw std::runtime_error("missing top-level 'properties'");

        auto *P = detail::get_object(props_elem->value);

        auto *crs_elem = detail::find_element(P, "crs");
        if (!crs_elem || crs_elem->value->type != json_type_string)
            throw std::runtime_error("'properties' missing string 'crs'");

        auto *datum_elem = detail::find_element(P, "datum");
        auto *datum_arr = datum_elem ? detail::get_array(datum_elem->value) : nullptr;
        if (!datum_arr || datum_arr->length < 3)
            throw std::runtime_error("'properties' missing array 'datum' of ≥3 numbers");

        auto *heading_elem = detail::find_element(P, "heading");
        if (!heading_elem || heading_elem->value->type != json_type_number)
            throw std::runtime_error("'properties' missing numeric 'heading'");

        auto crsVal = detail::parse_crs(detail::get_string(crs_elem->value));

        // GeoJSON datum order is [longitude, latitude, altitude]
        auto *d0 = datum_arr->start;
        auto *d1 = d0->next;
        auto *d2 = d1->next;
        double lon = detail::get_number(d0->value);
        double lat = detail::get_number(d1->value);
        double alt = detail::get_number(d2->value);
        dp::Geo d{lat, lon, alt};

        double yaw = detail::get_number(heading_elem->value);
        dp::Euler euler{0.0, 0.0, yaw};

        FeatureCollection fc;
        fc.datum = d;
        fc.heading = euler;

        for (auto *elem = P->start; elem; elem = elem->next) {
            std::string key(elem->name->string, elem->name->string_size);
            if (key != "crs" && key != "datum" && key != "heading") {
                if (elem->value->type == json_type_string) {
                    fc.global_properties[key] = detail::get_string(elem->value);
                } else {
                    fc.global_properties[key] = detail::serialize_value(elem->value);
                }
            }
        }

        auto *features_elem = detail::find_element(fc_obj, "features");
        auto *features_arr = features_elem ? detail::get_array(features_elem->value) : nullptr;
        if (features_arr) {
            std::int64_t index = 0;
            for (auto *feat_elem = features_arr->start; feat_elem; feat_elem = feat_elem->next, ++index) {
                auto *feat_obj = detail::get_object(feat_elem->value);
                if (!feat_obj)
                    continue;

                auto *geom_elem = detail::find_element(feat_obj, "geometry");
                if (!geom_elem || geom_elem->value->type == json_type_null)
                    continue;

                Feature feature;
                feature.id = index;
                auto *id_elem = detail::find_element(feat_obj, "id");
                if (id_elem && id_elem->value->type == json_type_number)
                    feature.id = static_cast<std::int64_t>(detail::get_number(id_elem->value));

                feature.parts = detail::parse_geometry(detail::get_object(geom_elem->value), d, crsVal);
                if (feature.parts.empty())
                    continue;

                auto *feat_props_elem = detail::find_element(feat_obj, "properties");
                if (feat_props_elem && feat_props_elem->value->type == json_type_object) {
                    feature.properties =
                        detail::parse_properties(detail::get_object(feat_props_elem->value), fc.fields);
                }

                fc.features.emplace_back(std::move(feature));
            }
        }

        return fc;
    }

    inline std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc) {
        os << "DATUM: " << fc.datum.latitude << ", " << fc.datum.longitude << ", " << fc.datum.altitude << "\n"
           << "HEADING: " << fc.heading.yaw << "\n";
        os << "FEATURES: " << fc.features.size() << " (" << toString(kindOf(fc)) << ")\n";
        os << "FIELDS:";
        for (auto const &name : fc.fields)
            os << " " << name;
        os << "\n";
        return os;
    }

} // namespace zonekit
