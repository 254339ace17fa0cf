#pragma once

#include <filesystem>
#include <string_view>

namespace modsync::codegen
{

enum class ArtifactStatus {
    Unchanged,  ///< rendered content equals the file on disk, nothing written
    Updated,    ///< file replaced with the rendered content
    Stale,      ///< would be updated, but writing was disabled
    Skipped,    ///< not generated, see diagnostics
};

struct ArtifactReport {
    std::filesystem::path path;
    ArtifactStatus status = ArtifactStatus::Skipped;
};

std::string_view to_string(ArtifactStatus status);

/// Options controlling how an artifact reaches the disk.
struct WriteOptions {
    bool check_only = false;  ///< compare only, never write
    bool crlf = false;        ///< write CRLF line endings
};

}  // namespace modsync::codegen
