#pragma once

#include "UpdateTypes.hpp"

#include <optional>
#include <vector>

namespace updater
{

/**
 * @brief Pick the route database that should replace the installed one.
 *
 * Only candidates strictly newer than currentDatasetDate are considered (all of them if no
 * database is installed). The newest one wins; on equal dates an exact schema match is preferred
 * over a backward compatible one; if still tied the first one in input order is returned.
 */
std::optional<UpdateCandidate> selectBestCandidate(const std::optional<utils::Timestamp>& currentDatasetDate,
                                                   const std::vector<UpdateCandidate>& candidates);

} // namespace updater
