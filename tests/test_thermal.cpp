// tests/test_thermal.cpp
//
// Thermal field bounds per verdict, hotspot injection and hot-region labelling.

#include <doctest/doctest.h>

#include "evidenceforge/hotspots.hpp"
#include "evidenceforge/thermal.hpp"

#include <vector>

using namespace ef;

TEST_CASE("Compliant thermal fields never exceed 0.4")
{
    const ThermalFieldSynthesizer synth;
    for (uint64_t seed : {1ull, 42ull, 7777ull, 0xdeadbeefull}) {
        std::vector<Hotspot> hs;
        const ThermalField f = synth.synthesize(256, 256, Verdict::Compliant, seed, &hs);
        CHECK(hs.empty());
        CHECK(f.max_value() <= 0.4);
        CHECK(f.min_value() >= 0.0);
        CHECK(locate_hotspots(f).empty());
    }
}

TEST_CASE("Violation thermal fields carry 2 to 4 hotspots above 0.4")
{
    const ThermalFieldSynthesizer synth;
    for (uint64_t seed=1; seed<=20; ++seed) {
        std::vector<Hotspot> hs;
        const ThermalField f = synth.synthesize(512, 512, Verdict::Violation, seed, &hs);
        CHECK(hs.size() >= 2);
        CHECK(hs.size() <= 4);
        for (const Hotspot& h : hs) {
            CHECK(h.cx >= 50);  CHECK(h.cx < 462);
            CHECK(h.cy >= 50);  CHECK(h.cy < 462);
            CHECK(h.radius >= 20);  CHECK(h.radius < 60);
            CHECK(h.amplitude >= 0.5);  CHECK(h.amplitude <= 0.9);
        }
        CHECK(f.max_value() > 0.4);
        CHECK(f.max_value() <= 1.0);
        CHECK(f.min_value() >= 0.0);
        CHECK_FALSE(locate_hotspots(f).empty());
    }
}

TEST_CASE("Small violation fields still carry a hot pixel")
{
    const ThermalFieldSynthesizer synth;
    for (int edge : {3, 16, 40}) {
        for (uint64_t seed=1; seed<=200; ++seed) {
            std::vector<Hotspot> hs;
            const ThermalField f = synth.synthesize(edge, edge, Verdict::Violation, seed, &hs);
            INFO("edge ", edge, " seed ", seed);
            for (const Hotspot& h : hs) {
                CHECK(h.cx >= 0);  CHECK(h.cx < edge);
                CHECK(h.cy >= 0);  CHECK(h.cy < edge);
            }
            CHECK(f.max_value() > 0.4);
        }
    }
}

TEST_CASE("Same seed gives the same thermal field")
{
    const ThermalFieldSynthesizer synth;
    const ThermalField a = synth.synthesize(128, 128, Verdict::Violation, 42);
    const ThermalField b = synth.synthesize(128, 128, Verdict::Violation, 42);
    const ThermalField c = synth.synthesize(128, 128, Verdict::Violation, 43);
    CHECK(a.t == b.t);
    CHECK(a.t != c.t);
}

TEST_CASE("Fixed seed policy shares geometry across coordinates")
{
    const ThermalSeedPolicy fixed = ThermalSeedPolicy::fixed(42);
    const ThermalSeedPolicy per_coord = ThermalSeedPolicy::per_coordinate();
    const GeoCoordinate a{28.6139, 77.2090}, b{30.9010, 75.8573};
    const ThermalFieldSynthesizer synth;

    std::vector<Hotspot> ha, hb;
    synth.synthesize(256, 256, Verdict::Violation, fixed.resolve(a), &ha);
    synth.synthesize(256, 256, Verdict::Violation, fixed.resolve(b), &hb);
    REQUIRE(ha.size() == hb.size());
    for (size_t i=0; i<ha.size(); ++i) {
        CHECK(ha[i].cx == hb[i].cx);
        CHECK(ha[i].cy == hb[i].cy);
        CHECK(ha[i].radius == hb[i].radius);
    }

    const ThermalField fa = synth.synthesize(256, 256, Verdict::Violation, per_coord.resolve(a));
    const ThermalField fb = synth.synthesize(256, 256, Verdict::Violation, per_coord.resolve(b));
    CHECK(fa.t != fb.t);
}

TEST_CASE("add_hotspot peaks at its centre")
{
    ThermalField f(21, 21);
    add_hotspot(f, Hotspot{10, 10, 3, 0.5});
    CHECK(f.at(10,10) == doctest::Approx(0.5));
    CHECK(f.at(13,10) == doctest::Approx(0.5 * 0.6065306597).epsilon(1e-6));
    CHECK(f.at(0,0) < 1e-4);
}

TEST_CASE("Hot regions are 4-connected and numbered in scan order")
{
    ThermalField f(10, 10);
    for (int y=1; y<=2; ++y) for (int x=1; x<=2; ++x) f.at(x,y) = 0.9;
    f.at(3,3) = 0.7;                       // diagonal neighbour: separate region
    for (int x=6; x<=8; ++x) f.at(x,5) = 0.5;
    f.at(9,9) = 0.4;                       // not strictly above the threshold

    const LabelMap labels = label_hot_regions(f);
    CHECK(labels.at(1,1) == 1u);
    CHECK(labels.at(3,3) == 2u);
    CHECK(labels.at(7,5) == 3u);
    CHECK(labels.at(9,9) == 0u);

    const std::vector<HotRegion> regions = regions_from_labels(labels, f);
    REQUIRE(regions.size() == 3);

    CHECK(regions[0].id == 1u);
    CHECK(regions[0].x0 == 1); CHECK(regions[0].y0 == 1);
    CHECK(regions[0].x1 == 2); CHECK(regions[0].y1 == 2);
    CHECK(regions[0].pixels == 4);
    CHECK(regions[0].peak == doctest::Approx(0.9));

    CHECK(regions[1].pixels == 1);

    CHECK(regions[2].x0 == 6); CHECK(regions[2].x1 == 8);
    CHECK(regions[2].y0 == 5); CHECK(regions[2].y1 == 5);
    CHECK(regions[2].pixels == 3);
    CHECK(regions[2].peak == doctest::Approx(0.5));
}

TEST_CASE("Region boxes are drawn as outlines")
{
    Raster img(10, 10);
    draw_regions(img, {HotRegion{1, 2, 2, 5, 6, 12, 0.8}});
    CHECK(img.px(2,2)[0] == 255);
    CHECK(img.px(5,6)[1] == 255);
    CHECK(img.px(3,4)[0] == 0);
}
