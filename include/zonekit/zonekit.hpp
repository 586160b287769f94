#pragma once

#include "parser.hpp"
#include "types.hpp"
#include "writer.hpp"
#include "zonal.hpp"

namespace zonekit {

    inline FeatureCollection read(const std::filesystem::path &file) { return ReadFeatureCollection(file); }

    // Summarizes `classes` against `zones` into a GeoJSON table at `outPath`, headed with the zone datum
    inline SummaryReport summarize(const SummarizeConfig &config, const std::filesystem::path &outPath,
                                   Feedback &feedback, CRS outputCrs = CRS::WGS) {
        if (!config.zones)
            throw std::invalid_argument("zonekit::summarize: zone layer is required");
        GeometryEngine engine;
        ZonalAggregator aggregator(engine);
        GeoJsonTableSink sink(outPath, config.zones->datum, config.zones->heading, outputCrs);
        return aggregator.summarize(config, sink, feedback);
    }

} // namespace zonekit

namespace zk = zonekit;
