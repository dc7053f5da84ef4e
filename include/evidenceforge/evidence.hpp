#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "evidenceforge/compose.hpp"
#include "evidenceforge/geo.hpp"
#include "evidenceforge/hotspots.hpp"
#include "evidenceforge/raster.hpp"
#include "evidenceforge/terrain.hpp"
#include "evidenceforge/thermal.hpp"
#include "evidenceforge/verdict.hpp"

namespace ef {

struct DateRange {
    std::string start = "2025-10-01";
    std::string end   = "2025-11-30";
};

// Optional upstream imagery provider (e.g. a Sentinel-2 fetch service).
// fetch() returns a tile of the requested size, std::nullopt when it has no
// data for the request, or throws UpstreamUnavailable.
class SatelliteSource {
public:
    virtual ~SatelliteSource() = default;
    virtual std::string name() const = 0;
    virtual std::optional<Raster> fetch(const GeoCoordinate& c, const DateRange& range,
                                        int width, int height) = 0;
};

// No service configured: always unavailable.
class OfflineSatelliteSource : public SatelliteSource {
public:
    std::string name() const override { return "offline"; }
    std::optional<Raster> fetch(const GeoCoordinate&, const DateRange&, int, int) override;
};

struct RenderOptions {
    std::filesystem::path out_dir = "output";
    int    width = 512, height = 512;
    int    super_res_scale = 2;
    double heat_alpha = 0.4;
    double blur_radius = 1.2;
    double hot_threshold = kHotThreshold;
    bool   hotspot_boxes = true;
    bool   annotate = true;
    // Appends _{lat}_{lon} to the heatmap/super-res/comparison names.
    bool   qualify_names = false;
    ThermalSeedPolicy thermal_seed = ThermalSeedPolicy::per_coordinate();
    ComparisonLayout  layout;
    DateRange         date_range;
    SatelliteSource*  upstream = nullptr;   // not owned; nullptr = synthetic only
};

// In-memory result of the pipeline, before anything touches the disk.
struct EvidenceImages {
    GeoCoordinate coord;
    Verdict  verdict = Verdict::Compliant;
    std::string source = "synthetic";
    uint32_t coordinate_seed = 0;
    uint64_t thermal_seed = 0;

    std::vector<FieldPlot> plots;
    std::vector<Hotspot>   hotspots;   // injected bumps
    std::vector<HotRegion> regions;    // detected hot regions

    Raster satellite;
    ThermalField thermal;
    LabelMap hot_mask;
    Raster heatmap;
    Raster super_resolved;
    Raster comparison;
};

struct EvidenceArtifacts {
    std::filesystem::path satellite_path;
    std::filesystem::path heatmap_path;
    std::filesystem::path super_res_path;
    std::filesystem::path comparison_path;
    std::filesystem::path thermal_field_path;
    std::filesystem::path hotspot_mask_path;
    std::filesystem::path hotspots_json_path;
    std::filesystem::path manifest_path;
};

// File names for a render, relative to options.out_dir.
EvidenceArtifacts artifact_paths(const GeoCoordinate& c, const RenderOptions& options);

// Runs the whole pipeline in memory.
EvidenceImages build_evidence(const GeoCoordinate& c, Verdict v, const RenderOptions& options = {});

// build_evidence() + atomic writes of every artifact. Throws ArtifactError.
EvidenceArtifacts render_evidence(const GeoCoordinate& c, Verdict v, const RenderOptions& options = {});

} // namespace ef
