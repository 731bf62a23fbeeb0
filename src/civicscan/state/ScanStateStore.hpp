#pragma once

#include "../api/ScanTypes.hpp"
#include "../http/HttpCommon.hpp"

#include <filesystem>
#include <string>

namespace civicscan
{

enum class LoadStatus
{
    Found,
    Absent
};

enum class StateSource
{
    None,
    Remote,
    LocalFile
};

struct LoadResult
{
    LoadStatus status = LoadStatus::Absent;
    ScanState state;
    StateSource source = StateSource::None;
};

class IScanStateStore
{
public:
    virtual ~IScanStateStore() = default;

    // Never fails: every read problem degrades to Absent
    virtual LoadResult load(const std::string& key) = 0;

    // True when at least one copy (local or remote) was written
    virtual bool save(const std::string& key, const ScanState& state) = 0;
};

struct ScanStateStoreCreateInfo
{
    http::IHttpClient* http = nullptr;
    std::string remote_url; // empty disables the remote store
    int remote_timeout_ms = 5000;
    std::filesystem::path local_path;
};

/**
 * @brief Remote-authoritative checkpoint store with a local-file fallback
 *
 * load(): the remote answer wins even when it says "no state". The local file is
 * consulted only when the remote GET fails outright (transport error/timeout) or
 * when no remote URL is configured.
 *
 * save(): writes the local file first, then PUTs to the remote; a successful PUT
 * removes the local file so it can never shadow newer remote state.
 */
class ScanStateStore : public IScanStateStore
{
public:
    explicit ScanStateStore(const ScanStateStoreCreateInfo& create_info);

    LoadResult load(const std::string& key) override;
    bool save(const std::string& key, const ScanState& state) override;

    const std::filesystem::path& localPath() const { return local_path_; }

private:
    enum class RemoteRead
    {
        Found,
        Absent,
        Unreachable
    };

    std::string remoteUrlFor(const std::string& key) const;
    RemoteRead loadRemote(const std::string& key, ScanState& out);
    bool loadLocal(ScanState& out);
    bool writeLocal(const ScanState& state, std::string& outError);
    bool writeRemote(const std::string& key, const ScanState& state, std::string& outError);
    void removeLocal();

    http::IHttpClient* http_;
    std::string remote_url_;
    http::SessionConfig session_;
    std::filesystem::path local_path_;
};

} // namespace civicscan
