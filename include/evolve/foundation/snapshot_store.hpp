#pragma once

/// @file snapshot_store.hpp
/// @brief Storage backends for opaque snapshot blobs (AI memory).

#include "evolve/foundation/game_result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace evolve::foundation {

/// Destination for serialized snapshots.
///
/// The store treats blobs as opaque bytes; encoding and version checks
/// belong to the caller's serializer.
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    /// Persist a blob as the newest snapshot.
    [[nodiscard]] virtual GameResult<void> save(std::span<const uint8_t> blob) = 0;

    /// Load the newest snapshot.
    /// @return The blob, or SnapshotReadFailed when none exists.
    [[nodiscard]] virtual GameResult<std::vector<uint8_t>> loadLatest() const = 0;

    [[nodiscard]] virtual std::size_t snapshotCount() const = 0;
};

/// Configuration for FileSnapshotStore.
struct FileSnapshotConfig {
    /// Directory where snapshot files are written.
    std::filesystem::path directory = "snapshots";

    /// File name prefix; files are "<prefix><sequence>.bin".
    std::string prefix = "memory_";

    /// Maximum number of snapshots to keep (oldest are pruned).
    uint32_t maxRetained = 3;
};

/// Snapshot store writing one file per snapshot.
///
/// @code
///   FileSnapshotStore store({.directory = "save/ai"});
///   if (auto r = store.open(); !r) { report(r.error()); }
///   store.save(blob);
///   auto latest = store.loadLatest();
/// @endcode
class FileSnapshotStore : public ISnapshotStore {
public:
    explicit FileSnapshotStore(FileSnapshotConfig config);
    ~FileSnapshotStore() override;

    FileSnapshotStore(const FileSnapshotStore&) = delete;
    FileSnapshotStore& operator=(const FileSnapshotStore&) = delete;

    /// Create the snapshot directory if needed.
    [[nodiscard]] GameResult<void> open();

    [[nodiscard]] bool isOpen() const;

    [[nodiscard]] GameResult<void> save(std::span<const uint8_t> blob) override;
    [[nodiscard]] GameResult<std::vector<uint8_t>> loadLatest() const override;
    [[nodiscard]] std::size_t snapshotCount() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// In-process snapshot store keeping the last @p maxRetained blobs.
class MemorySnapshotStore : public ISnapshotStore {
public:
    explicit MemorySnapshotStore(std::size_t maxRetained = 3)
        : maxRetained_(maxRetained == 0 ? 1 : maxRetained) {}

    [[nodiscard]] GameResult<void> save(std::span<const uint8_t> blob) override;
    [[nodiscard]] GameResult<std::vector<uint8_t>> loadLatest() const override;
    [[nodiscard]] std::size_t snapshotCount() const override { return blobs_.size(); }

private:
    std::size_t maxRetained_;
    std::vector<std::vector<uint8_t>> blobs_;
};

} // namespace evolve::foundation
