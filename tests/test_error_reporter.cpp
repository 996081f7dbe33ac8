#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("Error reporter queue", "[utils][errors]") {
    ErrorReporter::ClearErrors();

    SECTION("Reports are queued in order and drained") {
        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

        ErrorReporter::ReportWarning(ErrorCategory::RouteDb, "import failed", "copy failed");
        ErrorReporter::ReportError(ErrorCategory::Network, "download failed");
        ErrorReporter::ReportFatal(ErrorCategory::Initialization, "no logging");

        REQUIRE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::GetLastError().user_message == "no logging");
        REQUIRE(ErrorReporter::GetLastError().is_fatal);

        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 3);
        REQUIRE(reports[0].severity == ErrorSeverity::Warning);
        REQUIRE(reports[0].technical_details == "copy failed");
        REQUIRE(reports[1].category == ErrorCategory::Network);
        REQUIRE_FALSE(reports[1].is_fatal);
        REQUIRE_FALSE(reports[0].timestamp.empty());

        REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
        REQUIRE(ErrorReporter::GetLastError().user_message.empty());
    }

    SECTION("Queue keeps only the newest reports") {
        for (size_t i = 0; i < ErrorReporter::MAX_QUEUE_SIZE + 10; ++i) {
            ErrorReporter::ReportError(ErrorCategory::Unknown, ErrorSeverity::Info, "report " + std::to_string(i));
        }
        auto reports = ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == ErrorReporter::MAX_QUEUE_SIZE);
        REQUIRE(reports.front().user_message == "report 10");
    }

    SECTION("Names") {
        REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::RouteDb) == "Route Database");
        REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Configuration) == "Configuration");
        REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Fatal) == "Fatal");
    }
}
