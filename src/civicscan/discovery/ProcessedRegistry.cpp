#include "ProcessedRegistry.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace civicscan
{

namespace
{

bool parse_id(const std::string& text, VideoId& out)
{
    if (text.empty() || text.size() > 18)
        return false;
    for (char c : text)
    {
        if (c < '0' || c > '9')
            return false;
    }
    out = std::stoll(text);
    return true;
}

} // namespace

bool ProcessedRegistry::loadFile(const std::filesystem::path& path, std::set<VideoId>& outIds, std::string& outError)
{
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec))
    {
        PLOG_INFO << "No meetings registry at " << path.string() << ", assuming nothing processed yet";
        return true;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        outError = "cannot open " + path.string();
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();

    if (!parse(buffer.str(), outIds, outError))
    {
        outError = path.string() + ": " + outError;
        return false;
    }
    return true;
}

bool ProcessedRegistry::parse(const std::string& jsonContent, std::set<VideoId>& outIds, std::string& outError)
{
    try
    {
        json registry = json::parse(jsonContent);
        if (!registry.is_array())
        {
            outError = "meetings registry is not a JSON array";
            return false;
        }

        for (const auto& meeting : registry)
        {
            if (!meeting.is_object())
                continue;

            const auto status = meeting.find("status");
            if (status == meeting.end() || status->is_null())
                continue;
            if (!status->is_string())
            {
                PLOG_WARNING << "Skipping meeting with non-string status: " << status->dump();
                continue;
            }
            if (status->get<std::string>() != "processed")
                continue;

            const auto it = meeting.find("videoId");
            if (it == meeting.end() || it->is_null())
                continue;

            VideoId id = 0;
            if (it->is_number_integer())
            {
                id = it->get<VideoId>();
            }
            else if (!it->is_string() || !parse_id(it->get<std::string>(), id))
            {
                PLOG_WARNING << "Skipping processed meeting with unusable videoId: " << it->dump();
                continue;
            }
            outIds.insert(id);
        }
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

bool ProcessedRegistry::parseIdList(const std::string& text, std::set<VideoId>& outIds, std::string& outError)
{
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        const auto first = item.find_first_not_of(" \t");
        const auto last = item.find_last_not_of(" \t");
        if (first == std::string::npos)
            continue;
        item = item.substr(first, last - first + 1);

        VideoId id = 0;
        if (!parse_id(item, id))
        {
            outError = "not a video id: '" + item + "'";
            return false;
        }
        outIds.insert(id);
    }
    return true;
}

} // namespace civicscan
