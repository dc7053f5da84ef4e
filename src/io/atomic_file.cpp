#include "evidenceforge/atomic_file.hpp"
#include "evidenceforge/errors.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <fstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace ef::io {

namespace {

std::atomic<unsigned long long> g_staging_counter{0};

fs::path staging_path_for(const fs::path& path)
{
    const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    const auto n   = g_staging_counter.fetch_add(1);
    fs::path staging = path;
    staging += "." + std::to_string(tid % 100000) + "-" + std::to_string(n) + ".tmp";
    return staging;
}

} // namespace

void ensure_directory(const fs::path& dir)
{
    if (dir.empty()) return;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw ArtifactError(dir, ec.message());
    if (!fs::is_directory(dir, ec)) throw ArtifactError(dir, "not a directory");
}

void write_atomic(const fs::path& path, const StagedWriter& writer)
{
    ensure_directory(path.parent_path());
    const fs::path staging = staging_path_for(path);

    std::string err;
    if (!writer(staging, err)) {
        std::error_code ec;
        fs::remove(staging, ec);
        throw ArtifactError(path, err.empty() ? "write failed" : err);
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        std::error_code rm;
        fs::remove(staging, rm);
        throw ArtifactError(path, "rename failed: " + ec.message());
    }
    spdlog::debug("wrote {}", path.string());
}

void write_text_atomic(const fs::path& path, const std::string& text)
{
    write_atomic(path, [&](const fs::path& staging, std::string& err) {
        std::ofstream f(staging, std::ios::binary);
        if (!f) { err = "cannot open " + staging.string(); return false; }
        f << text;
        f.flush();
        if (!f) { err = "short write to " + staging.string(); return false; }
        return true;
    });
}

} // namespace ef::io
