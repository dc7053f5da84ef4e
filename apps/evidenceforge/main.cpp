// EvidenceForge CLI: mock D-MRV classification + synthetic satellite evidence
// Outputs: <out>/satellite_<lat>_<lon>.png, thermal_heatmap.png, super_resolved.png,
//          dmrv_comparison.png, thermal_field.exr, thermal_mask.pgm, thermal_hotspots.json, manifest.json
#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <chrono>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <limits>

#include "evidenceforge/atomic_file.hpp"
#include "evidenceforge/classifier.hpp"
#include "evidenceforge/evidence.hpp"
#include "evidenceforge/geo.hpp"
#include "evidenceforge/log.hpp"
#include "evidenceforge/report.hpp"
#include "evidenceforge/thermal.hpp"
#include "evidenceforge/verdict.hpp"

// ---------------------------- Small helpers ----------------------------
static bool parse_double(const std::string& s, double& out){
    char* end=nullptr; out = std::strtod(s.c_str(), &end);
    return end && end!=s.c_str() && *end=='\0';
}
static bool parse_int(const std::string& s, int& out){
    errno = 0;
    char* end=nullptr; long v = std::strtol(s.c_str(), &end, 10);
    if (!(end && end!=s.c_str() && *end=='\0') || errno==ERANGE) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = int(v); return true;
}
// "512" or "640x480"
static bool parse_size(const std::string& s, int& w, int& h){
    const size_t x = s.find_first_of("xX");
    if (x == std::string::npos) { if (!parse_int(s, w)) return false; h = w; return true; }
    return parse_int(s.substr(0, x), w) && parse_int(s.substr(x+1), h);
}
static bool parse_bool(const std::string& s){
    std::string t=s; std::transform(t.begin(),t.end(),t.begin(),::tolower);
    return (t=="1"||t=="true"||t=="yes"||t=="on");
}

// ---------------------------- CLI Options ----------------------------
struct Opts {
    std::string command;

    // IO
    std::string out = "output";

    // Location
    double lat = 28.6139, lon = 77.2090;

    // Render
    std::string verdict = "compliant";
    int width = 512, height = 512;
    int scale = 2;
    double alpha = 0.4;
    double blur = 1.2;
    std::string thermal_seed = "coordinate";
    bool qualify_names = false;
    bool hotspot_boxes = true;
    bool annotate = true;

    // Classify
    std::string photo;
    std::string filename;      // defaults to the photo's file name
    bool write_json = true;

    std::string log_level = "info";
};

static void print_usage() {
    std::cout <<
R"(EvidenceForge: mock D-MRV compliance evidence

Usage:
  evidenceforge render   [--lat L] [--lon L] [--verdict compliant|violation]
                         [--out DIR] [--size WxH | --width W --height H] [--scale N]
                         [--alpha A] [--blur R] [--thermal-seed fixed:N|coordinate]
                         [--qualify-names] [--hotspot-boxes true|false] [--no-annotate]
  evidenceforge classify --photo PATH [--filename NAME] [--lat L] [--lon L]
                         [--out DIR] [--no-json]
  evidenceforge pipeline --photo PATH [--filename NAME] [--lat L] [--lon L] [render flags]
  common:                [--log-level trace|debug|info|warn|error|off] [--help]

Examples:
  evidenceforge render --lat 28.6139 --lon 77.2090 --verdict violation
  evidenceforge render --verdict violation --thermal-seed fixed:42
  evidenceforge pipeline --photo field_burn_2024.jpg --lat 30.9010 --lon 75.8573
)";
}

[[noreturn]] static void usage_error(const std::string& msg){
    std::cerr << msg << "\n";
    print_usage();
    std::exit(2);
}

static Opts parse(int argc, char** argv) {
    Opts o;
    if (argc < 2) usage_error("Missing command");
    o.command = argv[1];
    if (o.command=="--help" || o.command=="-h"){ print_usage(); std::exit(0); }
    if (o.command!="render" && o.command!="classify" && o.command!="pipeline")
        usage_error("Unknown command: " + o.command);

    auto need = [&](int &i){ if(i+1>=argc){ usage_error(std::string("Missing value for ") + argv[i]); } return ++i; };
    auto num  = [&](int &i, double& v){ const char* f=argv[i]; if(!parse_double(argv[need(i)], v)) usage_error(std::string("Bad ") + f); };
    auto inum = [&](int &i, int& v){ const char* f=argv[i]; if(!parse_int(argv[need(i)], v)) usage_error(std::string("Bad ") + f); };

    for (int i=2;i<argc;++i) {
        std::string a(argv[i]);
        if (a=="--out")                 o.out = argv[need(i)];
        else if (a=="--lat")            num(i, o.lat);
        else if (a=="--lon")            num(i, o.lon);
        else if (a=="--verdict")        o.verdict = argv[need(i)];
        else if (a=="--size")         { if(!parse_size(argv[need(i)], o.width, o.height)) usage_error("Bad --size"); }
        else if (a=="--width")          inum(i, o.width);
        else if (a=="--height")         inum(i, o.height);
        else if (a=="--scale")          inum(i, o.scale);
        else if (a=="--alpha")          num(i, o.alpha);
        else if (a=="--blur")           num(i, o.blur);
        else if (a=="--thermal-seed")   o.thermal_seed = argv[need(i)];
        else if (a=="--qualify-names")  o.qualify_names = true;
        else if (a=="--hotspot-boxes")  o.hotspot_boxes = parse_bool(argv[need(i)]);
        else if (a=="--no-annotate")    o.annotate = false;
        else if (a=="--photo")          o.photo = argv[need(i)];
        else if (a=="--filename")       o.filename = argv[need(i)];
        else if (a=="--no-json")        o.write_json = false;
        else if (a=="--log-level")      o.log_level = argv[need(i)];
        else if (a=="--help" || a=="-h"){ print_usage(); std::exit(0); }
        else usage_error("Unknown flag: " + a);
    }
    return o;
}

// ---------------------------- Boundary validation ----------------------------
static void validate_location(const Opts& o){
    if (!ef::GeoCoordinate{o.lat, o.lon}.is_valid())
        usage_error("Coordinate out of range: latitude must be in [-90,90], longitude in [-180,180]");
}

constexpr int kMaxEdge  = 16384;
constexpr int kMaxScale = 16;

static ef::RenderOptions render_options(const Opts& o){
    ef::RenderOptions r;
    if (o.width < 1 || o.width > kMaxEdge || o.height < 1 || o.height > kMaxEdge)
        usage_error("--width/--height must be in [1," + std::to_string(kMaxEdge) + "]");
    if (o.scale < 1 || o.scale > kMaxScale) usage_error("--scale must be in [1," + std::to_string(kMaxScale) + "]");
    if (o.alpha < 0.0 || o.alpha > 1.0) usage_error("--alpha must be in [0,1]");
    if (o.blur < 0.0) usage_error("--blur must be >= 0");
    if (!ef::parse_thermal_seed_policy(o.thermal_seed, r.thermal_seed)) usage_error("Bad --thermal-seed: " + o.thermal_seed);
    r.out_dir = o.out;
    r.width = o.width; r.height = o.height;
    r.super_res_scale = o.scale;
    r.heat_alpha = o.alpha;
    r.blur_radius = o.blur;
    r.qualify_names = o.qualify_names;
    r.hotspot_boxes = o.hotspot_boxes;
    r.annotate = o.annotate;
    return r;
}

static std::vector<uint8_t> read_photo(const std::string& path){
    if (path.empty()) usage_error("--photo is required");
    std::ifstream f(path, std::ios::binary);
    if (!f) usage_error("Cannot read photo: " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (bytes.empty()) usage_error("Empty image file: " + path);
    return bytes;
}

static void print_artifacts(const ef::EvidenceArtifacts& a){
    for (const auto* p : {&a.satellite_path, &a.heatmap_path, &a.super_res_path, &a.comparison_path,
                          &a.thermal_field_path, &a.hotspot_mask_path, &a.hotspots_json_path, &a.manifest_path})
        std::cout << "Wrote " << p->string() << "\n";
}

static ef::ClassificationResult run_classify(const Opts& o){
    const std::vector<uint8_t> bytes = read_photo(o.photo);
    const std::string name = o.filename.empty() ? std::filesystem::path(o.photo).filename().string() : o.filename;

    ef::PhotoComplianceClassifier classifier;
    ef::ClassificationResult r = classifier.classify(bytes, name, {o.lat, o.lon});

    const std::string json = ef::to_json(r);
    std::cout << json;
    if (o.write_json) {
        const std::filesystem::path p = std::filesystem::path(o.out) / ("classification_" + r.image_hash + ".json");
        ef::io::write_text_atomic(p, json);
        std::cout << "Wrote " << p.string() << "\n";
    }
    return r;
}

// ---------------------------- MAIN ----------------------------
int main(int argc, char** argv) {
    Opts o = parse(argc, argv);

    spdlog::level::level_enum level = spdlog::level::info;
    if (!ef::parse_log_level(o.log_level, level)) usage_error("Bad --log-level: " + o.log_level);
    ef::init_logging(level);

    validate_location(o);
    const ef::GeoCoordinate coord{o.lat, o.lon};

    try {
        auto t0 = std::chrono::steady_clock::now();

        if (o.command == "classify") {
            run_classify(o);
        } else if (o.command == "render") {
            ef::Verdict v = ef::Verdict::Compliant;
            if (!ef::parse_verdict(o.verdict, v)) usage_error("Bad --verdict: " + o.verdict);
            ef::OfflineSatelliteSource upstream;
            ef::RenderOptions r = render_options(o);
            r.upstream = &upstream;
            print_artifacts(ef::render_evidence(coord, v, r));
        } else {
            ef::RenderOptions r = render_options(o);
            const ef::ClassificationResult c = run_classify(o);
            ef::OfflineSatelliteSource upstream;
            r.upstream = &upstream;
            print_artifacts(ef::render_evidence(coord, c.verdict, r));
        }

        auto t1 = std::chrono::steady_clock::now();
        spdlog::info("Done in {:.3f}s", std::chrono::duration<double>(t1 - t0).count());
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
