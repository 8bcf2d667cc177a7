#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "snapshot.hpp"

namespace fs = std::filesystem;

// Parse a snapshot document. Checks referential integrity and the
// one-active-allocation-per-asset rule; violations are Parse errors.
Result<SnapshotData> parse_snapshot(const std::string& yaml_text,
                                    const std::string& origin = "snapshot");

// Read and parse a snapshot file. Missing or unreadable files are Io errors.
Result<SnapshotData> load_snapshot(const fs::path& path);

// Serialize back to the same document format
std::string emit_snapshot(const SnapshotData& data);

Result<void> save_snapshot(const SnapshotData& data, const fs::path& path);
