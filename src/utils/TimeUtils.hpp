#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace utils
{

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts a date ("2025-01-31"), optionally followed by 'T' or ' ' and a time
 * ("12:30", "12:30:15", "12:30:15.123456") and an optional zone designator
 * ("Z", "+02:00", "-0130", "+02"). Timestamps without a zone are taken as UTC.
 *
 * @return false if the text is not a valid timestamp (outTime is left untouched)
 */
bool parseIso8601(const std::string& text, Timestamp& outTime);

// "2025-01-31T12:30:15Z" (UTC, whole seconds)
std::string formatIso8601(Timestamp time);

// "2025-01-31" (UTC)
std::string formatDate(Timestamp time);

// Convert a file modification time into a system clock time point
Timestamp toSystemTime(std::filesystem::file_time_type fileTime);

} // namespace utils
