#include "zonekit/sink.hpp"
#include "zonekit/writer.hpp"

#include <algorithm>
#include <stdexcept>

namespace zonekit {

    namespace {
        void check_record(const Schema &schema, const Record &record, bool open) {
            if (!open)
                throw std::runtime_error("OutputSink::add: sink is not open");
            if (record.size() != schema.size())
                throw std::runtime_error("OutputSink::add: record has " + std::to_string(record.size()) +
                                         " values, schema has " + std::to_string(schema.size()));
        }
    } // namespace

    void MemorySink::open(const Schema &schema) {
        if (open_)
            throw std::runtime_error("MemorySink::open: sink already open");
        schema_ = schema;
        records_.clear();
        open_ = true;
        committed_ = false;
    }

    void MemorySink::add(const Record &record) {
        check_record(schema_, record, open_);
        records_.push_back(record);
    }

    std::string MemorySink::commit() {
        if (!open_)
            throw std::runtime_error("MemorySink::commit: sink is not open");
        open_ = false;
        committed_ = true;
        return "memory";
    }

    const FieldValue &MemorySink::at(std::size_t row, const std::string &name) const {
        auto it = std::find(schema_.begin(), schema_.end(), name);
        if (it == schema_.end())
            throw std::out_of_range("MemorySink::at: no column named " + name);
        if (row >= records_.size())
            throw std::out_of_range("Record index out of range");
        return records_[row][static_cast<std::size_t>(it - schema_.begin())];
    }

    GeoJsonTableSink::GeoJsonTableSink(std::filesystem::path path, const dp::Geo &datum, const dp::Euler &heading,
                                       CRS outputCrs)
        : path_(std::move(path)), datum_(datum), heading_(heading), crs_(outputCrs) {}

    void GeoJsonTableSink::open(const Schema &schema) {
        if (open_)
            throw std::runtime_error("GeoJsonTableSink::open: sink already open");
        schema_ = schema;
        records_.clear();
        open_ = true;
    }

    void GeoJsonTableSink::add(const Record &record) {
        check_record(schema_, record, open_);
        records_.push_back(record);
    }

    std::string GeoJsonTableSink::commit() {
        if (!open_)
            throw std::runtime_error("GeoJsonTableSink::commit: sink is not open");
        WriteSummaryTable(schema_, records_, datum_, heading_, path_, crs_);
        open_ = false;
        return path_.string();
    }

} // namespace zonekit
