// tests/test_evidence.cpp
//
// End-to-end evidence rendering: shared satellite tile, per-verdict heatmaps,
// artifact naming, atomic writes and the upstream fallback.

#include <doctest/doctest.h>

#include "evidenceforge/atomic_file.hpp"
#include "evidenceforge/errors.hpp"
#include "evidenceforge/evidence.hpp"
#include "evidenceforge/png_writer.hpp"
#include "evidenceforge/report.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace ef;

namespace {

fs::path make_unique_temp_dir(const std::string& tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = base / ("evidenceforge_tests_" + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

std::string read_all(const fs::path& p)
{
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

RenderOptions small_options(const fs::path& out)
{
    RenderOptions o;
    o.out_dir = out;
    o.width = 128;
    o.height = 128;
    o.layout.panel_width = 128;
    o.layout.panel_height = 128;
    return o;
}

class ThrowingSource : public SatelliteSource {
public:
    int calls = 0;
    std::string name() const override { return "sentinel-hub"; }
    std::optional<Raster> fetch(const GeoCoordinate&, const DateRange&, int, int) override {
        ++calls;
        throw UpstreamUnavailable("connection refused");
    }
};

class FailingSource : public SatelliteSource {
public:
    std::string name() const override { return "openeo"; }
    std::optional<Raster> fetch(const GeoCoordinate&, const DateRange&, int, int) override {
        throw std::runtime_error("HTTP 503 from openeo");
    }
};

class EmptySource : public SatelliteSource {
public:
    std::string name() const override { return "empty"; }
    std::optional<Raster> fetch(const GeoCoordinate&, const DateRange&, int, int) override {
        return std::nullopt;
    }
};

class FlatSource : public SatelliteSource {
public:
    DateRange seen;
    std::string name() const override { return "flat"; }
    std::optional<Raster> fetch(const GeoCoordinate&, const DateRange& range, int w, int h) override {
        seen = range;
        return Raster(w / 2, h / 2, Rgb8{40, 90, 40});
    }
};

} // namespace

TEST_CASE("Both verdicts share the satellite tile but not the heatmap")
{
    const GeoCoordinate c{28.6139, 77.2090};
    const RenderOptions o = small_options(fs::path("unused"));

    const EvidenceImages ok  = build_evidence(c, Verdict::Compliant, o);
    const EvidenceImages bad = build_evidence(c, Verdict::Violation, o);

    CHECK(ok.satellite == bad.satellite);
    CHECK(ok.plots.size() == bad.plots.size());
    CHECK(ok.heatmap != bad.heatmap);
    CHECK(ok.thermal.max_value() <= 0.4);
    CHECK(bad.thermal.max_value() > 0.4);
    CHECK(ok.regions.empty());
    CHECK_FALSE(bad.regions.empty());
    CHECK(ok.source == "synthetic");
}

TEST_CASE("Evidence images have the configured geometry")
{
    RenderOptions o = small_options(fs::path("unused"));
    o.super_res_scale = 3;
    const EvidenceImages ev = build_evidence({12.9716, 77.5946}, Verdict::Violation, o);

    CHECK(ev.satellite.width == 128);
    CHECK(ev.heatmap.height == 128);
    CHECK(ev.super_resolved.width == 384);
    CHECK(ev.super_resolved.height == 384);
    CHECK(ev.comparison.width == 128 * 2 + 20);
    CHECK(ev.comparison.height == 128 + 40);
    CHECK(ev.thermal.width == 128);
    CHECK(ev.hot_mask.width == 128);
}

TEST_CASE("Rendering is reproducible from explicit arguments")
{
    const GeoCoordinate c{30.9010, 75.8573};
    const RenderOptions o = small_options(fs::path("unused"));
    const EvidenceImages a = build_evidence(c, Verdict::Violation, o);
    const EvidenceImages b = build_evidence(c, Verdict::Violation, o);
    CHECK(a.heatmap == b.heatmap);
    CHECK(a.comparison == b.comparison);
    CHECK(a.thermal_seed == b.thermal_seed);
}

TEST_CASE("Default artifact names qualify only the satellite tile")
{
    RenderOptions o;
    o.out_dir = "out";
    const GeoCoordinate c{28.6139, 77.2090};

    const EvidenceArtifacts a = artifact_paths(c, o);
    CHECK(a.satellite_path == fs::path("out") / "satellite_28.6139_77.2090.png");
    CHECK(a.heatmap_path == fs::path("out") / "thermal_heatmap.png");
    CHECK(a.super_res_path == fs::path("out") / "super_resolved.png");
    CHECK(a.comparison_path == fs::path("out") / "dmrv_comparison.png");

    o.qualify_names = true;
    const EvidenceArtifacts q = artifact_paths(c, o);
    CHECK(q.heatmap_path == fs::path("out") / "thermal_heatmap_28.6139_77.2090.png");
    CHECK(q.comparison_path == fs::path("out") / "dmrv_comparison_28.6139_77.2090.png");
    CHECK(q.manifest_path == fs::path("out") / "manifest_28.6139_77.2090.json");
}

TEST_CASE("render_evidence writes every artifact without staging leftovers")
{
    const fs::path dir = make_unique_temp_dir("render") / "nested" / "output";
    INFO("dir: ", dir.string());

    const EvidenceArtifacts a = render_evidence({28.6139, 77.2090}, Verdict::Violation, small_options(dir));

    for (const fs::path& p : {a.satellite_path, a.heatmap_path, a.super_res_path, a.comparison_path}) {
        REQUIRE(fs::exists(p));
        const std::string bytes = read_all(p);
        REQUIRE(bytes.size() > 8);
        CHECK(bytes.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0);
    }
    CHECK(fs::exists(a.thermal_field_path));
    CHECK(read_all(a.hotspot_mask_path).compare(0, 3, "P5\n") == 0);

    const std::string hotspots = read_all(a.hotspots_json_path);
    CHECK(hotspots.find("\"regions\": [") != std::string::npos);
    CHECK(hotspots.find("\"xmin\"") != std::string::npos);

    const std::string manifest = read_all(a.manifest_path);
    CHECK(manifest.find("\"verdict\": \"VIOLATION\"") != std::string::npos);
    CHECK(manifest.find("\"thermal_seed_policy\": \"coordinate\"") != std::string::npos);

    for (const auto& entry : fs::directory_iterator(dir))
        CHECK(entry.path().extension() != ".tmp");

    std::error_code ec;
    fs::remove_all(dir.parent_path().parent_path(), ec);
}

TEST_CASE("Writing into a path blocked by a file raises ArtifactError")
{
    const fs::path dir = make_unique_temp_dir("blocked");
    const fs::path blocker = dir / "not_a_dir";
    { std::ofstream f(blocker); f << "x"; }

    CHECK_THROWS_AS(io::ensure_directory(blocker), ArtifactError);
    CHECK_THROWS_AS(render_evidence({1.0, 2.0}, Verdict::Compliant, small_options(blocker / "out")), ArtifactError);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("Failed staged writes leave nothing behind")
{
    const fs::path dir = make_unique_temp_dir("staged");
    const fs::path target = dir / "artifact.bin";

    try {
        io::write_atomic(target, [](const fs::path& staging, std::string& err) {
            std::ofstream(staging) << "partial";
            err = "simulated failure";
            return false;
        });
        FAIL("write_atomic should have thrown");
    } catch (const ArtifactError& e) {
        CHECK(e.path() == target);
        CHECK(std::string(e.what()).find("simulated failure") != std::string::npos);
    }

    CHECK_FALSE(fs::exists(target));
    CHECK(fs::is_empty(dir));

    io::write_text_atomic(target, "done");
    CHECK(read_all(target) == "done");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("PNG writes report a full device instead of succeeding")
{
    if (!fs::exists("/dev/full"))
        return;
    std::string err;
    CHECK_FALSE(write_rgb_png("/dev/full", Raster(64, 64, Rgb8{1, 2, 3}), &err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("Unavailable upstream falls back to the synthetic tile")
{
    const GeoCoordinate c{28.6139, 77.2090};
    RenderOptions o = small_options(fs::path("unused"));
    const EvidenceImages plain = build_evidence(c, Verdict::Compliant, o);

    ThrowingSource throwing;
    o.upstream = &throwing;
    const EvidenceImages fallback = build_evidence(c, Verdict::Compliant, o);
    CHECK(throwing.calls == 1);
    CHECK(fallback.source == "synthetic");
    CHECK(fallback.satellite == plain.satellite);

    FailingSource failing;
    o.upstream = &failing;
    EvidenceImages after_error;
    CHECK_NOTHROW(after_error = build_evidence(c, Verdict::Violation, o));
    CHECK(after_error.source == "synthetic");
    CHECK(after_error.satellite == plain.satellite);

    EmptySource empty;
    o.upstream = &empty;
    CHECK(build_evidence(c, Verdict::Compliant, o).satellite == plain.satellite);

    OfflineSatelliteSource offline;
    o.upstream = &offline;
    CHECK(build_evidence(c, Verdict::Compliant, o).source == "synthetic");
}

TEST_CASE("Upstream tiles are used and resized when available")
{
    FlatSource flat;
    RenderOptions o = small_options(fs::path("unused"));
    o.upstream = &flat;
    o.annotate = false;

    const EvidenceImages ev = build_evidence({28.6139, 77.2090}, Verdict::Compliant, o);
    CHECK(ev.source == "flat");
    CHECK(ev.plots.empty());
    CHECK(ev.satellite.width == 128);
    CHECK(ev.satellite.px(64,64)[1] == 90);
    CHECK(flat.seen.start == "2025-10-01");
    CHECK(flat.seen.end == "2025-11-30");
}

TEST_CASE("Manifest records the seeds and options of a render")
{
    RenderOptions o = small_options(fs::path("out"));
    o.thermal_seed = ThermalSeedPolicy::fixed(42);
    const GeoCoordinate c{28.6139, 77.2090};
    const EvidenceImages ev = build_evidence(c, Verdict::Violation, o);
    CHECK(ev.thermal_seed == 42u);

    const std::string m = manifest_json(ev, artifact_paths(c, o), o);
    CHECK(m.find("\"thermal_seed_policy\": \"fixed:42\"") != std::string::npos);
    CHECK(m.find("\"thermal_seed\": 42") != std::string::npos);
    CHECK(m.find("\"coordinate_seed\": " + std::to_string(coordinate_seed(c))) != std::string::npos);
}
