#pragma once

#include "zonekit/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace zonekit {

    // Append-only destination for summary records; the schema is fixed by open()
    class OutputSink {
      public:
        virtual ~OutputSink() = default;

        virtual void open(const Schema &schema) = 0;
        virtual void add(const Record &record) = 0;
        // Returns the destination identifier
        virtual std::string commit() = 0;
    };

    class MemorySink : public OutputSink {
      public:
        void open(const Schema &schema) override;
        void add(const Record &record) override;
        std::string commit() override;

        bool isOpen() const { return open_; }
        bool isCommitted() const { return committed_; }
        const Schema &schema() const { return schema_; }
        const std::vector<Record> &records() const { return records_; }

        // Value of column `name` in record `row`
        const FieldValue &at(std::size_t row, const std::string &name) const;

      private:
        Schema schema_;
        std::vector<Record> records_;
        bool open_ = false;
        bool committed_ = false;
    };

    // Buffers records and writes a GeoJSON summary table on commit(); nothing is written otherwise
    class GeoJsonTableSink : public OutputSink {
      public:
        GeoJsonTableSink(std::filesystem::path path, const dp::Geo &datum, const dp::Euler &heading,
                         CRS outputCrs = CRS::WGS);

        void open(const Schema &schema) override;
        void add(const Record &record) override;
        std::string commit() override;

        std::size_t pending() const { return records_.size(); }

      private:
        std::filesystem::path path_;
        dp::Geo datum_;
        dp::Euler heading_;
        CRS crs_;
        Schema schema_;
        std::vector<Record> records_;
        bool open_ = false;
    };

} // namespace zonekit
