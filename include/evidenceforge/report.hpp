#pragma once
#include <string>
#include "evidenceforge/classifier.hpp"
#include "evidenceforge/evidence.hpp"

namespace ef {

// API-shaped classification response:
// {status, confidence, timestamp, model_version, details{...}, image_hash, gps{...}}
std::string to_json(const ClassificationResult& r);

// {"image_width", "image_height", "threshold", "regions": [...]}
std::string hotspots_json(const EvidenceImages& ev, double threshold = kHotThreshold);

// Inputs, resolved seeds and artifact paths of one render.
std::string manifest_json(const EvidenceImages& ev, const EvidenceArtifacts& a, const RenderOptions& o);

} // namespace ef
