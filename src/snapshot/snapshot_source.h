#pragma once

/// @file snapshot_source.h
/// @brief Abstract snapshot provider and the file-backed implementation

#include <filesystem>
#include <string>

#include <absl/status/statusor.h>

#include "snapshot/types.h"

namespace skyrca::snapshot {

/// @brief Supplies one snapshot per analysis pass
///
/// Implementations wrap a monitoring backend (or a capture of one).
/// Fetch is called once per pass; failures abort only that pass.
class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;

    /// @brief Fetch the snapshot to analyze
    virtual absl::StatusOr<Snapshot> Fetch() = 0;

    /// @brief Human-readable origin, used in logs
    virtual std::string Describe() const = 0;
};

/// @brief Reads a snapshot JSON document from disk
class FileSnapshotSource : public SnapshotSource {
public:
    explicit FileSnapshotSource(std::filesystem::path path);

    absl::StatusOr<Snapshot> Fetch() override;
    std::string Describe() const override;

private:
    std::filesystem::path path_;
};

}  // namespace skyrca::snapshot
