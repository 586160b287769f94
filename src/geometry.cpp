#include "zonekit/geometry.hpp"

#include <vector>

namespace zonekit {

    namespace {
        void on_geos_error(const char *message, void *userdata) {
            auto *last_error = static_cast<std::string *>(userdata);
            if (last_error && message)
                *last_error = message;
        }

        void on_geos_notice(const char *, void *) {}
    } // namespace

    GeometryEngine::GeometryEngine() : ctx_(GEOS_init_r()) {
        if (!ctx_)
            throw GeometryError("GeometryEngine: cannot create GEOS context");
        GEOSContext_setErrorMessageHandler_r(ctx_, on_geos_error, &last_error_);
        GEOSContext_setNoticeMessageHandler_r(ctx_, on_geos_notice, nullptr);
    }

    GeometryEngine::~GeometryEngine() {
        if (ctx_)
            GEOS_finish_r(ctx_);
    }

    void GeometryEngine::fail(const char *what) const {
        std::string msg = std::string("GeometryEngine::") + what + " failed";
        if (!last_error_.empty())
            msg += ": " + last_error_;
        last_error_.clear();
        throw GeometryError(msg);
    }

    GeomPtr GeometryEngine::wrap(GEOSGeometry *g, const char *what) const {
        if (!g)
            fail(what);
        return GeomPtr(g, GeomDeleter{ctx_});
    }

    GEOSCoordSequence *GeometryEngine::sequence(const std::vector<dp::Point> &pts, bool close_ring) const {
        bool needs_closing = close_ring && !pts.empty() &&
                             (pts.front().x != pts.back().x || pts.front().y != pts.back().y);
        auto size = static_cast<unsigned int>(pts.size() + (needs_closing ? 1 : 0));

        GEOSCoordSequence *seq = GEOSCoordSeq_create_r(ctx_, size, 2);
        if (!seq)
            fail("sequence");

        for (unsigned int i = 0; i < size; ++i) {
            const auto &p = (i < pts.size()) ? pts[i] : pts.front();
            if (!GEOSCoordSeq_setX_r(ctx_, seq, i, p.x) || !GEOSCoordSeq_setY_r(ctx_, seq, i, p.y)) {
                GEOSCoordSeq_destroy_r(ctx_, seq);
                fail("sequence");
            }
        }
        return seq;
    }

    GEOSGeometry *GeometryEngine::ring(const dp::Polygon &polygon) const {
        std::vector<dp::Point> pts(polygon.vertices.begin(), polygon.vertices.end());
        if (pts.size() < 3)
            throw GeometryError("GeometryEngine::build: polygon ring needs at least 3 vertices, got " +
                                std::to_string(pts.size()));

        GEOSGeometry *g = GEOSGeom_createLinearRing_r(ctx_, sequence(pts, true));
        if (!g)
            fail("ring");
        return g;
    }

    // Returned geometry is owned by the caller
    GEOSGeometry *GeometryEngine::part(const Geometry &geometry) const {
        return std::visit(
            [&](auto const &shape) -> GEOSGeometry * {
                using T = std::decay_t<decltype(shape)>;
                GEOSGeometry *g = nullptr;
                if constexpr (std::is_same_v<T, dp::Point>) {
                    g = GEOSGeom_createPoint_r(ctx_, sequence({shape}, false));
                } else if constexpr (std::is_same_v<T, dp::Segment>) {
                    g = GEOSGeom_createLineString_r(ctx_, sequence({shape.start, shape.end}, false));
                } else if constexpr (std::is_same_v<T, std::vector<dp::Point>>) {
                    g = GEOSGeom_createLineString_r(ctx_, sequence(shape, false));
                } else if constexpr (std::is_same_v<T, Surface>) {
                    GEOSGeometry *shell = ring(shape.shell);
                    std::vector<GEOSGeometry *> holes;
                    try {
                        for (const auto &hole : shape.holes)
                            holes.push_back(ring(hole));
                    } catch (const GeometryError &) {
                        GEOSGeom_destroy_r(ctx_, shell);
                        for (auto *h : holes)
                            GEOSGeom_destroy_r(ctx_, h);
                        throw;
                    }
                    g = GEOSGeom_createPolygon_r(ctx_, shell, holes.empty() ? nullptr : holes.data(),
                                                 static_cast<unsigned int>(holes.size()));
                }
                if (!g)
                    fail("build");
                return g;
            },
            geometry);
    }

    GeomPtr GeometryEngine::build(const Geometry &geometry) const { return wrap(part(geometry), "build"); }

    GeomPtr GeometryEngine::build(const Feature &feature) const {
        if (feature.parts.empty())
            throw GeometryError("GeometryEngine::build: feature " + std::to_string(feature.id) + " has no geometry");

        if (feature.parts.size() == 1)
            return build(feature.parts.front());

        int type = GEOS_GEOMETRYCOLLECTION;
        switch (kindOf(feature)) {
        case GeometryKind::Point:
            type = GEOS_MULTIPOINT;
            break;
        case GeometryKind::Line:
            type = GEOS_MULTILINESTRING;
            break;
        case GeometryKind::Polygon:
            type = GEOS_MULTIPOLYGON;
            break;
        default:
            break;
        }

        std::vector<GEOSGeometry *> parts;
        parts.reserve(feature.parts.size());
        try {
            for (const auto &p : feature.parts)
                parts.push_back(part(p));
        } catch (const GeometryError &) {
            for (auto *g : parts)
                GEOSGeom_destroy_r(ctx_, g);
            throw;
        }

        return wrap(GEOSGeom_createCollection_r(ctx_, type, parts.data(), static_cast<unsigned int>(parts.size())),
                    "build");
    }

    bool GeometryEngine::intersects(const GEOSGeometry *a, const GEOSGeometry *b) const {
        char r = GEOSIntersects_r(ctx_, a, b);
        if (r == 2)
            fail("intersects");
        return r == 1;
    }

    GeomPtr GeometryEngine::intersection(const GEOSGeometry *a, const GEOSGeometry *b) const {
        return wrap(GEOSIntersection_r(ctx_, a, b), "intersection");
    }

    bool GeometryEngine::isEmpty(const GEOSGeometry *g) const {
        char r = GEOSisEmpty_r(ctx_, g);
        if (r == 2)
            fail("isEmpty");
        return r == 1;
    }

    bool GeometryEngine::isValid(const GEOSGeometry *g) const {
        char r = GEOSisValid_r(ctx_, g);
        if (r == 2)
            fail("isValid");
        return r == 1;
    }

    std::string GeometryEngine::invalidReason(const GEOSGeometry *g) const {
        char *reason = GEOSisValidReason_r(ctx_, g);
        if (!reason)
            fail("invalidReason");
        std::string out(reason);
        GEOSFree_r(ctx_, reason);
        return out;
    }

    double GeometryEngine::area(const GEOSGeometry *g) const {
        double value = 0.0;
        if (!GEOSArea_r(ctx_, g, &value))
            fail("area");
        return value;
    }

    double GeometryEngine::length(const GEOSGeometry *g) const {
        double value = 0.0;
        if (!GEOSLength_r(ctx_, g, &value))
            fail("length");
        return value;
    }

} // namespace zonekit
