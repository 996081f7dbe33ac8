#pragma once

#include "utils/HttpCommon.hpp"
#include "utils/TimeUtils.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace test_utils {

// Mock HTTP response structure
struct MockResponse {
    int status_code = 200;
    std::string body;
    std::string error_message;
    bool has_error = false;
};

// In-memory replacement of utils::HttpClient
class MockHttpClient : public utils::IHttpClient {
public:
    // Set response for a specific URL
    void setResponse(const std::string& url, const MockResponse& response);

    // Set response based on URL pattern matching
    void setPatternResponse(const std::string& pattern, const MockResponse& response);

    // Simulate a network error for all requests
    void simulateNetworkError(const std::string& error_msg);

    // Clear all mocked responses and the request log
    void clearResponses();

    // Get mocked response for URL
    MockResponse getResponse(const std::string& url) const;

    // URLs requested so far, in order
    std::vector<std::string> requestedUrls() const;

    utils::HttpResponse get(const std::string& url, const std::vector<utils::Header>& headers = {}) override;
    utils::HttpResponse download(const std::string& url, const std::string& destPath) override;

private:
    utils::HttpResponse respond(const std::string& url);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MockResponse> url_responses_;
    std::unordered_map<std::string, MockResponse> pattern_responses_;
    bool simulate_error_ = false;
    std::string error_message_;
    std::vector<std::string> requested_urls_;
};

// One entry of the OTA metadata document
struct OtaEntry {
    std::string download_url;
    long long major = 1;
    long long minor = 0;
    std::string creation_date;
};

// Common mock responses for testing
class MockResponses {
public:
    // OTA api.php responses
    static MockResponse ota_metadata(const std::vector<OtaEntry>& entries);
    static MockResponse ota_invalid_json();
    static MockResponse ota_not_found();

    // Body of a downloadable file
    static MockResponse file_content(const std::string& content);

    // Generic error responses
    static MockResponse network_error();
    static MockResponse timeout_error();
};

}  // namespace test_utils
