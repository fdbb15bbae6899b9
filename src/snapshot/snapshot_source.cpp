/// @file snapshot_source.cpp
/// @brief File-backed snapshot source

#include "snapshot/snapshot_source.h"

#include <fstream>
#include <sstream>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "snapshot/snapshot_parser.h"

namespace skyrca::snapshot {

FileSnapshotSource::FileSnapshotSource(std::filesystem::path path)
    : path_(std::move(path)) {}

absl::StatusOr<Snapshot> FileSnapshotSource::Fetch() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return absl::NotFoundError(
            absl::StrCat("Cannot open snapshot file: ", path_.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return MakeError(ErrorCode::kDataLoss,
                         absl::StrCat("Failed to read snapshot file: ", path_.string()));
    }

    SKYRCA_LOG_INFO("Loading snapshot from {}", path_.string());
    return ParseSnapshotString(buffer.str());
}

std::string FileSnapshotSource::Describe() const {
    return absl::StrCat("file:", path_.string());
}

}  // namespace skyrca::snapshot
