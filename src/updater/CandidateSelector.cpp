#include "CandidateSelector.hpp"

namespace updater
{

namespace
{

// True if a should be preferred over b
bool isBetter(const UpdateCandidate& a, const UpdateCandidate& b)
{
    if (a.creationDate != b.creationDate)
    {
        return a.creationDate > b.creationDate;
    }
    return a.compatibilityMode == CompatibilityMode::ExactMatch &&
           b.compatibilityMode == CompatibilityMode::BackwardCompatible;
}

} // namespace

std::optional<UpdateCandidate> selectBestCandidate(const std::optional<utils::Timestamp>& currentDatasetDate,
                                                   const std::vector<UpdateCandidate>& candidates)
{
    const UpdateCandidate* best = nullptr;
    for (const auto& candidate : candidates)
    {
        if (currentDatasetDate && candidate.creationDate <= *currentDatasetDate)
        {
            continue;
        }
        if (!best || isBetter(candidate, *best))
        {
            best = &candidate;
        }
    }

    if (!best)
    {
        return std::nullopt;
    }
    return *best;
}

} // namespace updater
