#include "ScanStateCodec.hpp"
#include "../../utils/TimeFormat.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace civicscan
{

namespace
{

// The endpoint stores ids from a spreadsheet, so accept numeric strings too
bool read_id(const json& j, const char* key, VideoId& out)
{
    if (!j.contains(key) || j[key].is_null())
    {
        out = 0;
        return true;
    }
    const auto& v = j[key];
    if (v.is_number_integer())
    {
        out = v.get<VideoId>();
        return true;
    }
    if (v.is_string())
    {
        try
        {
            std::size_t used = 0;
            const auto s = v.get<std::string>();
            out = std::stoll(s, &used);
            return used == s.size();
        }
        catch (const std::exception&)
        {
            return false;
        }
    }
    return false;
}

} // namespace

std::string ScanStateCodec::encode(const ScanState& state)
{
    json j;
    j["highestValidId"] = state.highestValidId;
    j["highestScannedId"] = state.highestScannedId;
    j["scannedAt"] = utils::FormatIso8601(state.scannedAt);
    return j.dump(2);
}

DecodeStatus ScanStateCodec::decode(const std::string& text, ScanState& outState, std::string& outError)
{
    try
    {
        json j = json::parse(text);
        if (!j.is_object())
        {
            outError = "scan state is not a JSON object";
            return DecodeStatus::Malformed;
        }

        if (!j.contains("scannedAt") || j["scannedAt"].is_null())
        {
            return DecodeStatus::Empty;
        }

        if (!j["scannedAt"].is_string())
        {
            outError = "scannedAt is not a string";
            return DecodeStatus::Malformed;
        }

        ScanState state;
        if (!read_id(j, "highestValidId", state.highestValidId) ||
            !read_id(j, "highestScannedId", state.highestScannedId))
        {
            outError = "scan state ids are not integers";
            return DecodeStatus::Malformed;
        }

        if (!utils::ParseIso8601(j["scannedAt"].get<std::string>(), state.scannedAt))
        {
            outError = "scannedAt is not ISO-8601: " + j["scannedAt"].get<std::string>();
            return DecodeStatus::Malformed;
        }

        if (state.highestValidId > state.highestScannedId)
        {
            outError = "highestValidId exceeds highestScannedId";
            return DecodeStatus::Malformed;
        }

        outState = state;
        return DecodeStatus::State;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        return DecodeStatus::Malformed;
    }
}

} // namespace civicscan
