#pragma once

/// @file snapshot_parser.h
/// @brief Reader for the SkyWalking-style snapshot JSON document
///
/// Accepted layout:
/// @code
/// {
///   "timestamp": "2024-05-01T10:15:00+00:00",
///   "time_range": {"start": "...", "end": "..."},
///   "topology": {"nodes": [{"id", "name", "type", "isReal"}],
///                "calls": [{"source", "target"}]},
///   "services": [{"service": {"id", "name"},
///                 "metrics": {"service_resp_time": {"values": {"values": [{"value": 12}]}}},
///                 "traces": [{"segmentId", "duration", "start", "isError"}],
///                 "instances": [{"id", "name"}]}]
/// }
/// @endcode
///
/// Metric values may also arrive as a list of result groups
/// (`{"values": [{"values": [...]}]}`). Null sample values are skipped;
/// samples without a timestamp are spread evenly over the time range.

#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "snapshot/types.h"

namespace skyrca::snapshot {

/// @brief Build a snapshot from a parsed JSON document
/// @return Snapshot, or kMalformedSnapshot when the document structure is unusable
absl::StatusOr<Snapshot> ParseSnapshot(const nlohmann::json& document);

/// @brief Parse JSON text and build a snapshot from it
absl::StatusOr<Snapshot> ParseSnapshotString(std::string_view content);

/// @brief Parse a wire timestamp
///
/// Accepts RFC 3339 strings (with or without offset, naive values are UTC),
/// "YYYY-MM-DD HHMM" minute strings, and epoch numbers or numeric strings.
/// Epoch values above 1e11 are milliseconds, smaller ones are seconds.
absl::StatusOr<Timestamp> ParseTimestamp(const nlohmann::json& value);

}  // namespace skyrca::snapshot
