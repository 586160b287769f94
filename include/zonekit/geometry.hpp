#pragma once

#ifndef GEOS_USE_ONLY_R_API
#define GEOS_USE_ONLY_R_API
#endif
#include <geos_c.h>

#include "zonekit/types.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace zonekit {

    // Raised when GEOS reports an exception or rejects a geometry
    class GeometryError : public std::runtime_error {
      public:
        explicit GeometryError(const std::string &what) : std::runtime_error(what) {}
    };

    // Deleter bound to the context that created the geometry
    struct GeomDeleter {
        GEOSContextHandle_t ctx = nullptr;
        void operator()(GEOSGeometry *g) const {
            if (g)
                GEOSGeom_destroy_r(ctx, g);
        }
    };
    using GeomPtr = std::unique_ptr<GEOSGeometry, GeomDeleter>;

    // Planar overlay operations on a private GEOS context.
    // Geometries returned by an engine must not outlive it.
    class GeometryEngine {
      public:
        GeometryEngine();
        ~GeometryEngine();

        GeometryEngine(const GeometryEngine &) = delete;
        GeometryEngine &operator=(const GeometryEngine &) = delete;

        // One part gives a single geometry, several parts give a Multi* collection
        GeomPtr build(const Feature &feature) const;
        GeomPtr build(const Geometry &geometry) const;

        bool intersects(const GEOSGeometry *a, const GEOSGeometry *b) const;
        GeomPtr intersection(const GEOSGeometry *a, const GEOSGeometry *b) const;
        bool isEmpty(const GEOSGeometry *g) const;
        bool isValid(const GEOSGeometry *g) const;
        std::string invalidReason(const GEOSGeometry *g) const;
        double area(const GEOSGeometry *g) const;
        double length(const GEOSGeometry *g) const;

      private:
        GeomPtr wrap(GEOSGeometry *g, const char *what) const;
        GEOSCoordSequence *sequence(const std::vector<dp::Point> &pts, bool close_ring) const;
        GEOSGeometry *ring(const dp::Polygon &polygon) const;
        GEOSGeometry *part(const Geometry &geometry) const;
        [[noreturn]] void fail(const char *what) const;

        GEOSContextHandle_t ctx_ = nullptr;
        mutable std::string last_error_; // written by the GEOS error handler
    };

} // namespace zonekit
