#include "ScanStateStore.hpp"
#include "ScanStateCodec.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace civicscan
{

ScanStateStore::ScanStateStore(const ScanStateStoreCreateInfo& create_info)
    : http_(create_info.http)
    , remote_url_(create_info.remote_url)
    , local_path_(create_info.local_path)
{
    session_.timeout_ms = create_info.remote_timeout_ms;
    session_.connect_timeout_ms = create_info.remote_timeout_ms;
    session_.follow_redirects = true;
}

std::string ScanStateStore::remoteUrlFor(const std::string& key) const
{
    if (key.empty())
        return remote_url_;
    const char sep = remote_url_.find('?') == std::string::npos ? '?' : '&';
    return remote_url_ + sep + "key=" + http::urlEscape(key);
}

LoadResult ScanStateStore::load(const std::string& key)
{
    LoadResult result;

    if (!remote_url_.empty() && http_)
    {
        ScanState remote;
        switch (loadRemote(key, remote))
        {
        case RemoteRead::Found:
            result.status = LoadStatus::Found;
            result.state = remote;
            result.source = StateSource::Remote;
            return result;
        case RemoteRead::Absent:
            // Authoritative: a stale local file must not override it
            return result;
        case RemoteRead::Unreachable:
            break;
        }
    }

    ScanState local;
    if (loadLocal(local))
    {
        result.status = LoadStatus::Found;
        result.state = local;
        result.source = StateSource::LocalFile;
    }
    return result;
}

ScanStateStore::RemoteRead ScanStateStore::loadRemote(const std::string& key, ScanState& out)
{
    auto response = http_->get(remoteUrlFor(key), { { "Accept", "application/json" } }, session_);
    if (response.transportFailed())
    {
        PLOG_WARNING << "Scan state endpoint unreachable (" << response.error << "), trying local file";
        return RemoteRead::Unreachable;
    }

    if (response.status_code != 200)
    {
        PLOG_WARNING << "Scan state endpoint returned status " << response.status_code << ", treating as no state";
        return RemoteRead::Absent;
    }

    std::string error;
    switch (ScanStateCodec::decode(response.text, out, error))
    {
    case DecodeStatus::State:
        PLOG_INFO << "Loaded scan state from remote: highestScannedId=" << out.highestScannedId
                  << " highestValidId=" << out.highestValidId;
        return RemoteRead::Found;
    case DecodeStatus::Empty:
        PLOG_INFO << "Remote scan state is empty";
        return RemoteRead::Absent;
    case DecodeStatus::Malformed:
        PLOG_WARNING << "Remote scan state is malformed (" << error << "), treating as no state";
        return RemoteRead::Absent;
    }
    return RemoteRead::Absent;
}

bool ScanStateStore::loadLocal(ScanState& out)
{
    if (local_path_.empty())
        return false;

    std::error_code ec;
    if (!fs::exists(local_path_, ec))
        return false;

    std::ifstream ifs(local_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_WARNING << "Cannot open local scan state " << local_path_.string();
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();

    std::string error;
    if (ScanStateCodec::decode(buffer.str(), out, error) != DecodeStatus::State)
    {
        if (!error.empty())
            PLOG_WARNING << "Ignoring local scan state " << local_path_.string() << ": " << error;
        return false;
    }

    PLOG_INFO << "Loaded scan state from local file: highestScannedId=" << out.highestScannedId;
    return true;
}

bool ScanStateStore::save(const std::string& key, const ScanState& state)
{
    std::string local_error;
    const bool local_ok = writeLocal(state, local_error);
    if (!local_ok)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ScanState, "Could not write local scan state",
                                            local_error);
    }

    if (remote_url_.empty() || !http_)
        return local_ok;

    std::string remote_error;
    if (!writeRemote(key, state, remote_error))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ScanState,
                                            "Scan state not persisted remotely; it will not survive a redeploy",
                                            remote_error);
        return local_ok;
    }

    removeLocal();
    PLOG_INFO << "Scan state saved: highestScannedId=" << state.highestScannedId
              << " highestValidId=" << state.highestValidId;
    return true;
}

bool ScanStateStore::writeLocal(const ScanState& state, std::string& outError)
{
    if (local_path_.empty())
    {
        outError = "no local path configured";
        return false;
    }

    std::error_code ec;
    auto dir = local_path_.parent_path();
    if (!dir.empty())
    {
        fs::create_directories(dir, ec);
        if (ec)
        {
            outError = "create_directories failed: " + ec.message();
            return false;
        }
    }

    fs::path tmp = local_path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            outError = "cannot open " + tmp.string();
            return false;
        }
        ofs << ScanStateCodec::encode(state);
        ofs.flush();
        if (!ofs)
        {
            outError = "write failed for " + tmp.string();
            return false;
        }
    }

    fs::rename(tmp, local_path_, ec);
    if (ec)
    {
        outError = "rename failed: " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool ScanStateStore::writeRemote(const std::string& key, const ScanState& state, std::string& outError)
{
    auto response = http_->putJson(remoteUrlFor(key), ScanStateCodec::encode(state), {}, session_);
    if (response.transportFailed())
    {
        outError = "PUT failed: " + response.error;
        return false;
    }
    if (!response.ok())
    {
        outError = "PUT returned status " + std::to_string(response.status_code);
        return false;
    }
    return true;
}

void ScanStateStore::removeLocal()
{
    if (local_path_.empty())
        return;

    std::error_code ec;
    if (fs::remove(local_path_, ec))
    {
        PLOG_DEBUG << "Removed local scan state " << local_path_.string() << " (remote is authoritative)";
    }
    else if (ec)
    {
        PLOG_WARNING << "Could not remove local scan state " << local_path_.string() << ": " << ec.message();
    }
}

} // namespace civicscan
