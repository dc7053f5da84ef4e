#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ef {

// An artifact (or its directory) could not be written. Propagated to callers.
class ArtifactError : public std::runtime_error {
public:
    ArtifactError(const std::filesystem::path& path, const std::string& reason)
        : std::runtime_error("cannot write " + path.string() + ": " + reason), path_(path) {}
    const std::filesystem::path& path() const noexcept { return path_; }
private:
    std::filesystem::path path_;
};

// The satellite-imagery service is absent or failed. Recovered locally by
// falling back to synthetic generation; never reaches render_evidence callers.
class UpstreamUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ef
