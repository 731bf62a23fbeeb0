#pragma once

#include <chrono>
#include <string>

namespace utils
{

// ISO-8601 UTC with millisecond precision, e.g. "2026-10-18T09:30:00.000Z"
std::string FormatIso8601(std::chrono::system_clock::time_point tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z"; returns false on anything else
bool ParseIso8601(const std::string& text, std::chrono::system_clock::time_point& out);

} // namespace utils
