#pragma once

#include "../api/ScanTypes.hpp"

namespace civicscan
{

/**
 * @brief Decides whether a single video ID exists and belongs to the tenant
 *
 * probe() may be called concurrently from the batch scanner's workers and must
 * not throw; every failure is folded into the returned ProbeResult.
 */
class IProber
{
public:
    virtual ~IProber() = default;

    virtual ProbeResult probe(VideoId id) = 0;
};

} // namespace civicscan
