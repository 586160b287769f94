#pragma once

#include "zonekit/types.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace zonekit {

    namespace detail {
        // Enough digits for doubles to read back unchanged
        constexpr int kDoubleDigits = std::numeric_limits<double>::max_digits10;

        // Helper to escape a string for JSON
        inline std::string escape_string(const std::string &s) {
            std::string result;
            result.reserve(s.size() + 2);
            for (char c : s) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        // JSON has no NaN or infinity, those are written as null
        inline std::string value_to_json(const FieldValue &value) {
            return std::visit(
                [](auto const &v) -> std::string {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        return "null";
                    } else if constexpr (std::is_same_v<T, bool>) {
                        return v ? "true" : "false";
                    } else if constexpr (std::is_same_v<T, double>) {
                        if (!std::isfinite(v))
                            return "null";
                        std::ostringstream oss;
                        oss << std::setprecision(detail::kDoubleDigits) << v;
                        return oss.str();
                    } else {
                        return "\"" + escape_string(v) + "\"";
                    }
                },
                value);
        }
    } // namespace detail

    inline std::string recordToJson(const Schema &schema, const Record &record) {
        if (record.size() != schema.size())
            throw std::runtime_error("recordToJson: record has " + std::to_string(record.size()) +
                                     " values, schema has " + std::to_string(schema.size()));

        std::ostringstream oss;
        oss << R"({"type":"Feature","properties":{)";
        for (std::size_t i = 0; i < schema.size(); ++i) {
            if (i > 0)
                oss << ",";
            oss << "\"" << detail::escape_string(schema[i]) << "\":" << detail::value_to_json(record[i]);
        }
        oss << "}," << R"("geometry":null})";
        return oss.str();
    }

    inline std::string tableToJson(const Schema &schema, const std::vector<Record> &records, const dp::Geo &datum,
                                   const dp::Euler &heading, zonekit::CRS outputCrs) {
        std::ostringstream oss;
        oss << R"({"type":"FeatureCollection","properties":{)";

        if (outputCrs == zonekit::CRS::WGS) {
            oss << R"("crs":"EPSG:4326")";
        } else {
            oss << R"("crs":"ENU")";
        }

        // Datum is written back in GeoJSON order [longitude, latitude, altitude]
        oss << "," << R"("datum":[)" << std::setprecision(detail::kDoubleDigits) << datum.longitude << ","
            << datum.latitude << "," << datum.altitude << "]";

        oss << "," << R"("heading":)" << std::setprecision(detail::kDoubleDigits) << heading.yaw;

        oss << "," << R"("fields":[)";
        for (std::size_t i = 0; i < schema.size(); ++i) {
            if (i > 0)
                oss << ",";
            oss << "\"" << detail::escape_string(schema[i]) << "\"";
        }
        oss << "]";

        oss << "}," << R"("features":[)";

        bool first = true;
        for (auto const &record : records) {
            if (!first)
                oss << ",";
            first = false;
            oss << recordToJson(schema, record);
        }

        oss << "]}";
        return oss.str();
    }

    inline void WriteSummaryTable(const Schema &schema, const std::vector<Record> &records, const dp::Geo &datum,
                                  const dp::Euler &heading, std::filesystem::path const &outPath,
                                  zonekit::CRS outputCrs) {
        std::string j = tableToJson(schema, records, datum, heading, outputCrs);
        std::ofstream ofs(outPath);
        if (!ofs)
            throw std::runtime_error("Cannot open for write: " + outPath.string());
        ofs << j << "\n";
    }

} // namespace zonekit
