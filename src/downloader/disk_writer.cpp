/*
 * geofetch/src/downloader/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Each sink stages into its own "<destination>.<pid>-<seq>.part" beside the destination,
 *   created with O_EXCL so concurrent sinks for one destination never share a file
 * - commit(): flush + fsync, atomic rename onto the destination, fsync of the directory
 * - EXDEV fallback: copy + fsync + replace when cross-device rename is detected
 * - A sink destroyed without commit() removes its staging file
 */

#include <geofetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace geofetch::downloader {

namespace fs = std::filesystem;

// ---------- Helpers (sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

static Expected<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Expected<void>{};
}

// Copy file contents and ensure durability (fsync destination and dir). Replace if exists.
static Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "copy " + src.string() + " -> " + dst.string() + " failed: " + ec.message()};
    }
    auto rf = fsync_file(dst);
    if (!rf.ok())
        return rf;
    return fsync_dir(dst.parent_path());
}

static std::atomic<std::uint64_t> g_stagingSeq{0};

static Expected<fs::path> create_staging_file(const fs::path& destination) {
    for (int tries = 0; tries < 8; ++tries) {
        fs::path staging = destination;
        staging += "." + std::to_string(::getpid()) + "-" +
                   std::to_string(g_stagingSeq.fetch_add(1, std::memory_order_relaxed)) + ".part";
        int fd = ::open(staging.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            ::close(fd);
            return staging;
        }
        if (errno != EEXIST) {
            return Error{ErrorCode::IoError,
                         "Failed to create staging file " + staging.string() + ": " +
                             std::error_code(errno, std::generic_category()).message()};
        }
    }
    return Error{ErrorCode::IoError, "No free staging name for " + destination.string()};
}

// ---------- ArtifactSink ----------

class ArtifactSink final : public IArtifactSink {
public:
    ArtifactSink(fs::path destination, fs::path staging, std::ofstream out)
        : _destination(std::move(destination)), _staging(std::move(staging)),
          _out(std::move(out)) {}

    ~ArtifactSink() override {
        if (!_committed) {
            discard();
        }
    }

    ArtifactSink(const ArtifactSink&) = delete;
    ArtifactSink& operator=(const ArtifactSink&) = delete;

    Expected<void> write(std::span<const std::byte> data) override {
        if (_committed || !_out.is_open()) {
            return Error{ErrorCode::IoError, "write to closed artifact: " + _staging.string()};
        }
        _out.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!_out.good()) {
            return Error{ErrorCode::IoError, "write failed on: " + _staging.string()};
        }
        _written += data.size();
        return Expected<void>{};
    }

    Expected<fs::path> commit() override {
        if (_committed) {
            return _destination;
        }
        _out.flush();
        const bool flushed = _out.good();
        _out.close();
        if (!flushed || _out.fail()) {
            return Error{ErrorCode::IoError, "flush failed on: " + _staging.string()};
        }

        auto r = fsync_file(_staging);
        if (!r.ok())
            return Error{r.error().code, "Failed to fsync staging: " + _staging.string()};

        std::error_code ren_ec;
        fs::rename(_staging, _destination, ren_ec);
        if (ren_ec) {
            if (ren_ec == std::errc::cross_device_link) {
                spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                             _destination.string());
                auto copied = copy_file_fsync_replace(_staging, _destination);
                if (!copied.ok()) {
                    return copied.error();
                }
                std::error_code del_ec;
                fs::remove(_staging, del_ec);
            } else {
                return Error{ErrorCode::IoError, "rename() failed (" + ren_ec.message() +
                                                     ") from " + _staging.string() + " to " +
                                                     _destination.string()};
            }
        }
        _committed = true;

        auto rd = fsync_dir(_destination.parent_path());
        if (!rd.ok()) {
            spdlog::debug("fsync on destination dir failed (continuing): {}",
                          _destination.parent_path().string());
        }
        return _destination;
    }

    void discard() noexcept override {
        if (_out.is_open()) {
            _out.close();
        }
        std::error_code ec;
        fs::remove(_staging, ec);
        if (ec) {
            spdlog::debug("discard: failed to remove staging file {}: {}", _staging.string(),
                          ec.message());
        }
    }

    [[nodiscard]] const fs::path& destination() const noexcept override { return _destination; }
    [[nodiscard]] const fs::path& stagingPath() const noexcept override { return _staging; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept override { return _written; }

private:
    fs::path _destination;
    fs::path _staging;
    std::ofstream _out;
    std::uint64_t _written{0};
    bool _committed{false};
};

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<std::unique_ptr<IArtifactSink>> open(const fs::path& destination) override {
        if (destination.empty() || !destination.has_filename()) {
            return Error{ErrorCode::InvalidArgument,
                         "artifact destination has no file name: " + destination.string()};
        }

        std::error_code ec;
        const auto parent = destination.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::IoError,
                             "Failed to create directory " + parent.string() + ": " + ec.message()};
            }
        }

        auto created = create_staging_file(destination);
        if (!created.ok()) {
            return created.error();
        }
        auto staging = std::move(created).value();
        std::ofstream out(staging, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!out.good()) {
            std::error_code rm_ec;
            fs::remove(staging, rm_ec);
            return Error{ErrorCode::IoError, "Failed to open staging file: " + staging.string()};
        }
        spdlog::debug("Staging {} at {}", destination.string(), staging.string());
        return std::unique_ptr<IArtifactSink>(
            std::make_unique<ArtifactSink>(destination, std::move(staging), std::move(out)));
    }
};

std::shared_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_shared<DiskWriter>();
}

} // namespace geofetch::downloader
