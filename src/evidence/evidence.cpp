#include "evidenceforge/evidence.hpp"
#include "evidenceforge/colormap.hpp"
#include "evidenceforge/errors.hpp"
#include "evidenceforge/exr_writer.hpp"
#include "evidenceforge/mask_writer.hpp"
#include "evidenceforge/png_writer.hpp"
#include "evidenceforge/report.hpp"
#include "evidenceforge/resample.hpp"
#include "evidenceforge/atomic_file.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fs = std::filesystem;

namespace ef {

std::optional<Raster> OfflineSatelliteSource::fetch(const GeoCoordinate&, const DateRange&, int, int)
{
    throw UpstreamUnavailable("no satellite imagery service configured");
}

namespace {

// Upstream tile, or nullopt when the synthetic generator has to take over.
std::optional<Raster> try_upstream(const GeoCoordinate& c, const RenderOptions& o)
{
    if (o.upstream == nullptr) return std::nullopt;
    try {
        std::optional<Raster> tile = o.upstream->fetch(c, o.date_range, o.width, o.height);
        if (!tile || tile->empty()) {
            spdlog::warn("upstream '{}' has no tile for {} ({}..{}), using synthetic generator",
                         o.upstream->name(), canonical_string(c), o.date_range.start, o.date_range.end);
            return std::nullopt;
        }
        if (tile->width != o.width || tile->height != o.height)
            return resize_bicubic(*tile, o.width, o.height);
        return tile;
    } catch (const UpstreamUnavailable& e) {
        spdlog::warn("upstream '{}' unavailable ({}), using synthetic generator", o.upstream->name(), e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::warn("upstream '{}' failed ({}), using synthetic generator", o.upstream->name(), e.what());
        return std::nullopt;
    }
}

} // namespace

EvidenceArtifacts artifact_paths(const GeoCoordinate& c, const RenderOptions& o)
{
    const std::string tag = filename_tag(c);
    const std::string suffix = o.qualify_names ? "_" + tag : std::string();
    const fs::path& d = o.out_dir;

    EvidenceArtifacts a;
    a.satellite_path     = d / ("satellite_" + tag + ".png");
    a.heatmap_path       = d / ("thermal_heatmap" + suffix + ".png");
    a.super_res_path     = d / ("super_resolved" + suffix + ".png");
    a.comparison_path    = d / ("dmrv_comparison" + suffix + ".png");
    a.thermal_field_path = d / ("thermal_field" + suffix + ".exr");
    a.hotspot_mask_path  = d / ("thermal_mask" + suffix + ".pgm");
    a.hotspots_json_path = d / ("thermal_hotspots" + suffix + ".json");
    a.manifest_path      = d / ("manifest" + suffix + ".json");
    return a;
}

EvidenceImages build_evidence(const GeoCoordinate& c, Verdict v, const RenderOptions& o)
{
    if (o.width <= 0 || o.height <= 0)
        throw std::invalid_argument("build_evidence: raster size must be positive");

    EvidenceImages ev;
    ev.coord = c;
    ev.verdict = v;
    ev.coordinate_seed = coordinate_seed(c);
    ev.thermal_seed = o.thermal_seed.resolve(c);

    // 1. Satellite tile: upstream when it delivers, otherwise synthetic.
    if (std::optional<Raster> tile = try_upstream(c, o)) {
        ev.source = o.upstream->name();
        ev.satellite = std::move(*tile);
        if (o.annotate) annotate_satellite(ev.satellite, c, "SENTINEL-2 L2A");
    } else {
        ev.satellite = gaussian_blur(generate_field_tile(c, o.width, o.height, &ev.plots), o.blur_radius);
        if (o.annotate) annotate_satellite(ev.satellite, c);
    }

    // 2. Thermal field and heatmap.
    ev.thermal = ThermalFieldSynthesizer().synthesize(o.width, o.height, v, ev.thermal_seed, &ev.hotspots);
    ev.hot_mask = label_hot_regions(ev.thermal, o.hot_threshold);
    ev.regions = regions_from_labels(ev.hot_mask, ev.thermal);

    ev.heatmap = blend(ev.satellite, ev.thermal, o.heat_alpha);
    if (o.hotspot_boxes) draw_regions(ev.heatmap, ev.regions);
    if (o.annotate) annotate_heatmap(ev.heatmap, v);

    // 3. Super-resolved tile.
    ev.super_resolved = super_resolve(ev.satellite, o.super_res_scale);
    if (o.annotate) annotate_super_resolved(ev.super_resolved, o.super_res_scale);

    // 4. Side-by-side comparison.
    ev.comparison = compose_side_by_side(ev.satellite, ev.heatmap,
                                         {"SENTINEL-2 ORIGINAL", palette::sentinel_green},
                                         {"THERMAL ANALYSIS (NBR)", palette::amber},
                                         o.layout);

    spdlog::info("evidence for {} verdict={} source={} plots={} hot_regions={}",
                 canonical_string(c), to_string(v), ev.source, ev.plots.size(), ev.regions.size());
    return ev;
}

EvidenceArtifacts render_evidence(const GeoCoordinate& c, Verdict v, const RenderOptions& o)
{
    io::ensure_directory(o.out_dir);
    const EvidenceImages ev = build_evidence(c, v, o);
    const EvidenceArtifacts a = artifact_paths(c, o);

    save_png(a.satellite_path,  ev.satellite);
    save_png(a.heatmap_path,    ev.heatmap);
    save_png(a.super_res_path,  ev.super_resolved);
    save_png(a.comparison_path, ev.comparison);
    save_thermal_exr(a.thermal_field_path, ev.thermal);
    io::write_atomic(a.hotspot_mask_path, [&](const fs::path& staging, std::string& err) {
        return write_mask_pgm(staging.string(), ev.hot_mask, &err);
    });
    io::write_text_atomic(a.hotspots_json_path, hotspots_json(ev, o.hot_threshold));
    io::write_text_atomic(a.manifest_path, manifest_json(ev, a, o));
    return a;
}

} // namespace ef
