#pragma once

#include "../api/ScanTypes.hpp"

#include <string>

namespace civicscan
{

enum class DecodeStatus
{
    State, // a persisted checkpoint
    Empty, // well-formed "no state yet" payload (scannedAt null or missing)
    Malformed
};

// JSON encoding shared by the remote endpoint and the local fallback file:
// {"highestValidId": n, "highestScannedId": n, "scannedAt": "ISO-8601" | null}
class ScanStateCodec
{
public:
    static std::string encode(const ScanState& state);

    static DecodeStatus decode(const std::string& text, ScanState& outState, std::string& outError);
};

} // namespace civicscan
