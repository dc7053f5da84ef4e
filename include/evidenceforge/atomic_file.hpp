#pragma once
#include <filesystem>
#include <functional>
#include <string>

namespace ef::io {

// Creates dir and its parents. Throws ArtifactError on failure.
void ensure_directory(const std::filesystem::path& dir);

// Fills the staging file; returns false and sets err on failure.
using StagedWriter = std::function<bool(const std::filesystem::path& staging, std::string& err)>;

// Runs writer against a unique sibling "<name>.<tag>.tmp" and renames it over
// path, so readers never see a half-written artifact. The staging file is
// removed on failure and ArtifactError is thrown.
void write_atomic(const std::filesystem::path& path, const StagedWriter& writer);

void write_text_atomic(const std::filesystem::path& path, const std::string& text);

} // namespace ef::io
