#pragma once

#include "UpdateTypes.hpp"

#include <string>
#include <vector>

namespace updater
{

// Source of downloadable route databases. Installation is done by the storage.
class IRouteDbUpdateSource
{
public:
    virtual ~IRouteDbUpdateSource() = default;

    // Fetch all route databases the running application can use. An empty list is not an error.
    virtual bool listCandidates(std::vector<UpdateCandidate>& outCandidates, FetchError& outError) = 0;

    // Download the candidate into a new temporary file and return its path.
    // The file stays valid until cleanup().
    virtual bool materialize(const UpdateCandidate& candidate, std::string& outPath, FetchError& outError) = 0;

    // Delete everything materialize() created since the last call. Best effort, never fails.
    virtual void cleanup() = 0;
};

} // namespace updater
