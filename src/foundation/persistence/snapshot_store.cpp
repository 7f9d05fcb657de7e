/// @file snapshot_store.cpp
/// @brief File and in-memory snapshot stores with a retention policy.

#include "evolve/foundation/snapshot_store.hpp"

#include "evolve/foundation/game_logger.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace evolve::foundation {

// -- FileSnapshotStore::Impl -------------------------------------------------

struct FileSnapshotStore::Impl {
    FileSnapshotConfig config;
    mutable std::mutex mutex;
    bool open = false;

    explicit Impl(FileSnapshotConfig cfg) : config(std::move(cfg)) {}

    /// Zero-padded so lexical order matches save order.
    std::filesystem::path snapshotPath(uint64_t sequence) const {
        char digits[21];
        std::snprintf(digits, sizeof(digits), "%020llu",
                      static_cast<unsigned long long>(sequence));
        return config.directory / (config.prefix + digits + ".bin");
    }

    /// Snapshot files sorted oldest first.
    std::vector<std::filesystem::path> listSnapshots() const {
        std::vector<std::filesystem::path> files;
        std::error_code ec;
        if (!std::filesystem::exists(config.directory, ec)) {
            return files;
        }
        for (const auto& entry : std::filesystem::directory_iterator(config.directory, ec)) {
            if (entry.is_regular_file() &&
                entry.path().filename().string().starts_with(config.prefix) &&
                entry.path().extension() == ".bin") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    uint64_t nextSequence() const {
        auto files = listSnapshots();
        if (files.empty()) {
            return 1;
        }
        auto stem = files.back().stem().string().substr(config.prefix.size());
        try {
            return std::stoull(stem) + 1;
        } catch (const std::logic_error&) {
            return files.size() + 1;
        }
    }

    void pruneOldSnapshots() {
        auto files = listSnapshots();
        while (files.size() > config.maxRetained) {
            std::error_code ec;
            std::filesystem::remove(files.front(), ec);
            if (ec) {
                EVOLVE_LOG_WARN(LogCategory::Persistence,
                                "failed to prune snapshot " + files.front().string());
            }
            files.erase(files.begin());
        }
    }
};

// -- Construction ------------------------------------------------------------

FileSnapshotStore::FileSnapshotStore(FileSnapshotConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

FileSnapshotStore::~FileSnapshotStore() = default;

GameResult<void> FileSnapshotStore::open() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->open) {
        return GameResult<void>::ok();
    }
    std::error_code ec;
    std::filesystem::create_directories(impl_->config.directory, ec);
    if (ec) {
        return GameResult<void>::err(GameError(
            ErrorCode::SnapshotWriteFailed,
            "failed to create snapshot directory: " + ec.message()));
    }
    impl_->open = true;
    return GameResult<void>::ok();
}

bool FileSnapshotStore::isOpen() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->open;
}

// -- Save / Load -------------------------------------------------------------

GameResult<void> FileSnapshotStore::save(std::span<const uint8_t> blob) {
    std::lock_guard lock(impl_->mutex);
    if (!impl_->open) {
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotWriteFailed, "snapshot store is not open"));
    }

    auto path = impl_->snapshotPath(impl_->nextSequence());
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return GameResult<void>::err(GameError(
            ErrorCode::SnapshotWriteFailed, "cannot open snapshot file " + path.string()));
    }
    file.write(reinterpret_cast<const char*>(blob.data()),
               static_cast<std::streamsize>(blob.size()));
    file.flush();
    if (!file) {
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotWriteFailed, "failed to write snapshot data"));
    }
    file.close();

    impl_->pruneOldSnapshots();
    EVOLVE_LOG_DEBUG(LogCategory::Persistence,
                     "saved snapshot " + path.filename().string() + " (" +
                         std::to_string(blob.size()) + " bytes)");
    return GameResult<void>::ok();
}

GameResult<std::vector<uint8_t>> FileSnapshotStore::loadLatest() const {
    std::lock_guard lock(impl_->mutex);
    auto files = impl_->listSnapshots();
    if (files.empty()) {
        return GameResult<std::vector<uint8_t>>::err(
            GameError(ErrorCode::SnapshotReadFailed, "no snapshots found"));
    }

    const auto& latestPath = files.back();
    std::ifstream file(latestPath, std::ios::binary);
    if (!file) {
        return GameResult<std::vector<uint8_t>>::err(GameError(
            ErrorCode::SnapshotReadFailed, "cannot open snapshot file " + latestPath.string()));
    }

    std::error_code ec;
    auto fileSize = std::filesystem::file_size(latestPath, ec);
    if (ec) {
        return GameResult<std::vector<uint8_t>>::err(
            GameError(ErrorCode::SnapshotReadFailed, "cannot stat snapshot file: " + ec.message()));
    }
    std::vector<uint8_t> data(static_cast<std::size_t>(fileSize));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(fileSize));
    if (static_cast<std::size_t>(file.gcount()) < fileSize) {
        return GameResult<std::vector<uint8_t>>::err(
            GameError(ErrorCode::SnapshotReadFailed, "snapshot file read incomplete"));
    }
    return GameResult<std::vector<uint8_t>>::ok(std::move(data));
}

std::size_t FileSnapshotStore::snapshotCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->listSnapshots().size();
}

// -- MemorySnapshotStore -----------------------------------------------------

GameResult<void> MemorySnapshotStore::save(std::span<const uint8_t> blob) {
    blobs_.emplace_back(blob.begin(), blob.end());
    if (blobs_.size() > maxRetained_) {
        blobs_.erase(blobs_.begin());
    }
    return GameResult<void>::ok();
}

GameResult<std::vector<uint8_t>> MemorySnapshotStore::loadLatest() const {
    if (blobs_.empty()) {
        return GameResult<std::vector<uint8_t>>::err(
            GameError(ErrorCode::SnapshotReadFailed, "no snapshots found"));
    }
    return GameResult<std::vector<uint8_t>>::ok(blobs_.back());
}

} // namespace evolve::foundation
