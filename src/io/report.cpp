#include "evidenceforge/report.hpp"

#include <iomanip>
#include <sstream>

namespace ef {

namespace {

std::string quoted(const std::string& s)
{
    std::ostringstream o;
    o << '"';
    for (unsigned char ch : s) {
        switch (ch) {
        case '"':  o << "\\\""; break;
        case '\\': o << "\\\\"; break;
        case '\n': o << "\\n";  break;
        case '\r': o << "\\r";  break;
        case '\t': o << "\\t";  break;
        default:
            if (ch < 0x20) o << "\\u" << std::hex << std::setw(4) << std::setfill('0') << int(ch) << std::dec;
            else o << ch;
        }
    }
    o << '"';
    return o.str();
}

const char* boolstr(bool b) { return b ? "true" : "false"; }

} // namespace

std::string to_json(const ClassificationResult& r)
{
    std::ostringstream j;
    j << "{\n"
      << "  \"status\": " << quoted(to_string(r.verdict)) << ",\n"
      << std::fixed << std::setprecision(2)
      << "  \"confidence\": " << r.confidence << ",\n"
      << "  \"timestamp\": " << quoted(r.timestamp) << ",\n"
      << "  \"model_version\": " << quoted(r.model_version) << ",\n"
      << "  \"details\": {\n"
      << std::setprecision(1)
      << "    \"burnt_soil_percentage\": " << r.burnt_soil_pct << ",\n"
      << "    \"tilled_soil_percentage\": " << r.tilled_soil_pct << ",\n"
      << std::setprecision(2)
      << "    \"vegetation_index\": " << r.vegetation_index << ",\n"
      << "    \"thermal_anomaly\": " << boolstr(r.thermal_anomaly) << "\n"
      << "  },\n"
      << "  \"image_hash\": " << quoted(r.image_hash) << ",\n"
      << std::setprecision(4)
      << "  \"gps\": {\"latitude\": " << r.gps.latitude << ", \"longitude\": " << r.gps.longitude << "}\n"
      << "}\n";
    return j.str();
}

std::string hotspots_json(const EvidenceImages& ev, double threshold)
{
    std::ostringstream j;
    j << std::fixed << std::setprecision(4);
    j << "{\n  \"image_width\": " << ev.thermal.width << ",\n  \"image_height\": " << ev.thermal.height
      << ",\n  \"threshold\": " << threshold << ",\n  \"regions\": [\n";
    for (size_t i=0;i<ev.regions.size();++i){
        const auto& b = ev.regions[i];
        j << "    {\"id\": " << b.id
          << ", \"xmin\": " << b.x0 << ", \"ymin\": " << b.y0
          << ", \"xmax\": " << b.x1 << ", \"ymax\": " << b.y1
          << ", \"pixels\": " << b.pixels << ", \"peak\": " << b.peak << "}";
        if (i+1<ev.regions.size()) j << ",";
        j << "\n";
    }
    j << "  ]\n}\n";
    return j.str();
}

std::string manifest_json(const EvidenceImages& ev, const EvidenceArtifacts& a, const RenderOptions& o)
{
    std::ostringstream j;
    j << std::fixed << std::setprecision(4);
    j << "{\n"
      << "  \"tool\": \"EvidenceForge\",\n"
      << "  \"latitude\": " << ev.coord.latitude << ",\n"
      << "  \"longitude\": " << ev.coord.longitude << ",\n"
      << "  \"verdict\": " << quoted(to_string(ev.verdict)) << ",\n"
      << "  \"source\": " << quoted(ev.source) << ",\n"
      << "  \"coordinate_seed\": " << ev.coordinate_seed << ",\n"
      << "  \"thermal_seed_policy\": " << quoted(o.thermal_seed.describe()) << ",\n"
      << "  \"thermal_seed\": " << ev.thermal_seed << ",\n"
      << "  \"width\": " << o.width << ",\n"
      << "  \"height\": " << o.height << ",\n"
      << "  \"super_res_scale\": " << o.super_res_scale << ",\n"
      << std::setprecision(2)
      << "  \"heat_alpha\": " << o.heat_alpha << ",\n"
      << "  \"blur_radius\": " << o.blur_radius << ",\n"
      << "  \"field_plots\": " << ev.plots.size() << ",\n"
      << "  \"injected_hotspots\": " << ev.hotspots.size() << ",\n"
      << "  \"hot_regions\": " << ev.regions.size() << ",\n"
      << "  \"artifacts\": {\n"
      << "    \"satellite\": "     << quoted(a.satellite_path.string()) << ",\n"
      << "    \"heatmap\": "       << quoted(a.heatmap_path.string()) << ",\n"
      << "    \"super_resolved\": " << quoted(a.super_res_path.string()) << ",\n"
      << "    \"comparison\": "    << quoted(a.comparison_path.string()) << ",\n"
      << "    \"thermal_field\": " << quoted(a.thermal_field_path.string()) << ",\n"
      << "    \"thermal_mask\": "  << quoted(a.hotspot_mask_path.string()) << ",\n"
      << "    \"hotspots\": "      << quoted(a.hotspots_json_path.string()) << "\n"
      << "  }\n"
      << "}\n";
    return j.str();
}

} // namespace ef
