#pragma once

#include "../api/ScanTypes.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace civicscan
{

// Read-only view of the downstream pipeline's meetings registry (meetings.json).
// Entries with status "processed" contribute their videoId.
class ProcessedRegistry
{
public:
    // Missing file -> empty set, true. Malformed file -> false with outError.
    static bool loadFile(const std::filesystem::path& path, std::set<VideoId>& outIds, std::string& outError);

    static bool parse(const std::string& jsonContent, std::set<VideoId>& outIds, std::string& outError);

    // "1002,1050" -> {1002, 1050}; rejects non-numeric entries
    static bool parseIdList(const std::string& text, std::set<VideoId>& outIds, std::string& outError);
};

} // namespace civicscan
