#pragma once

#include "routedb/IRouteDbStorage.hpp"
#include "updater/IRouteDbStatusSink.hpp"
#include "updater/IRouteDbUpdateSource.hpp"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_utils {

// Shared, ordered record of the calls made on the fakes
struct CallLog {
    std::vector<std::string> calls;

    void add(const std::string& call) { calls.push_back(call); }

    size_t count(const std::string& call) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c == call) {
                ++n;
            }
        }
        return n;
    }
};

class FakeStorage : public routedb::IRouteDbStorage {
public:
    explicit FakeStorage(CallLog& log) : log_(log) {}

    bool connected = false;
    std::optional<routedb::StorageStartingError> start_error; // start() fails with this if set
    std::optional<routedb::ImportError> import_error;         // importFile() fails with this if set
    bool import_throws = false;
    utils::Timestamp creation_date{};

    bool start(routedb::StorageStartingError& outError) override {
        log_.add("start");
        if (start_error) {
            outError = *start_error;
            return false;
        }
        connected = true;
        return true;
    }

    void stop() override {
        log_.add("stop");
        connected = false;
    }

    bool isConnected() const override { return connected; }

    bool importFile(const std::string& sourcePath, routedb::ImportError& outError) override {
        log_.add("import:" + sourcePath);
        if (connected) {
            throw std::logic_error("import while connected");
        }
        if (import_throws) {
            throw std::runtime_error("disk on fire");
        }
        if (import_error) {
            outError = *import_error;
            return false;
        }
        return true;
    }

    utils::Timestamp creationDate() const override {
        if (!connected) {
            throw std::logic_error("not connected");
        }
        return creation_date;
    }

    std::vector<routedb::Summit> retrieveSummits(const std::optional<std::string>& = std::nullopt) override { return {}; }
    routedb::Summit retrieveSummit(std::int64_t) override { return {}; }
    std::vector<routedb::Route> retrieveRoutesOfSummit(std::int64_t, routedb::RoutesSortMode) override { return {}; }
    routedb::Route retrieveRoute(std::int64_t) override { return {}; }
    std::vector<routedb::Post> retrievePostsOfRoute(std::int64_t, routedb::PostsSortMode) override { return {}; }

private:
    CallLog& log_;
};

class FakeUpdateSource : public updater::IRouteDbUpdateSource {
public:
    explicit FakeUpdateSource(CallLog& log) : log_(log) {}

    std::vector<updater::UpdateCandidate> candidates;
    std::optional<updater::FetchError> list_error;
    std::optional<updater::FetchError> materialize_error;

    bool listCandidates(std::vector<updater::UpdateCandidate>& outCandidates, updater::FetchError& outError) override {
        log_.add("list");
        if (list_error) {
            outError = *list_error;
            return false;
        }
        outCandidates = candidates;
        return true;
    }

    // The local file is named after the candidate: "<identifier>.sqlite"
    bool materialize(const updater::UpdateCandidate& candidate, std::string& outPath,
                     updater::FetchError& outError) override {
        log_.add("materialize:" + candidate.identifier);
        if (materialize_error) {
            outError = *materialize_error;
            return false;
        }
        outPath = candidate.identifier + ".sqlite";
        return true;
    }

    void cleanup() override { log_.add("cleanup"); }

private:
    CallLog& log_;
};

class RecordingStatusSink : public updater::IRouteDbStatusSink {
public:
    void updateRouteDbStatus(const updater::RouteDbStatus& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_.push_back(status);
    }

    std::vector<updater::RouteDbStatus> statuses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    updater::RouteDbStatus last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<updater::RouteDbStatus> statuses_;
};

}  // namespace test_utils
