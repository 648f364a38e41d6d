#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sstream>
#include "progress_tracker.hpp"

using Catch::Matchers::ContainsSubstring;

TEST_CASE("ProgressTracker counts completed files", "[ProgressTracker]") {
    std::ostringstream log;
    ProgressTracker tracker(log);

    REQUIRE_FALSE(tracker.isVerbose());

    tracker.start(4);
    REQUIRE(tracker.totalFiles() == 4);
    REQUIRE(tracker.getPercentage() == 0);

    tracker.fileCompleted("a.cpp", true);
    tracker.fileCompleted("b.cpp", false);
    REQUIRE(tracker.completedFiles() == 2);
    REQUIRE(tracker.untrackedFiles() == 1);
    REQUIRE(tracker.getPercentage() == 50);
    REQUIRE_FALSE(tracker.isComplete());

    tracker.fileCompleted("c.cpp", true);
    tracker.fileCompleted("d.cpp", true);
    tracker.finish();

    REQUIRE(tracker.isComplete());
    REQUIRE(tracker.getPercentage() == 100);

    // Quiet unless verbose
    REQUIRE(log.str().empty());
}

TEST_CASE("ProgressTracker verbose output", "[ProgressTracker]") {
    std::ostringstream log;
    ProgressTracker tracker(log, true);
    REQUIRE(tracker.isVerbose());

    tracker.start(2);
    tracker.fileCompleted("a.cpp", false);
    tracker.fileCompleted("b.cpp", true);
    tracker.finish();

    REQUIRE_THAT(log.str(), ContainsSubstring("Scoring 2 files"));
    REQUIRE_THAT(log.str(), ContainsSubstring("Skipping untracked file a.cpp"));
    REQUIRE_THAT(log.str(), ContainsSubstring("Progress: 100% (2/2 files)"));
    REQUIRE_THAT(log.str(), ContainsSubstring("(1 untracked files skipped)"));
}

TEST_CASE("ProgressTracker warnings are always shown", "[ProgressTracker]") {
    std::ostringstream log;
    ProgressTracker tracker(log);

    tracker.info("hidden");
    tracker.warning("Falling back to single-threaded blame");

    REQUIRE(log.str() == "Warning: Falling back to single-threaded blame\n");
}

TEST_CASE("ProgressTracker with no files is complete", "[ProgressTracker]") {
    std::ostringstream log;
    ProgressTracker tracker(log);

    tracker.start(0);
    REQUIRE(tracker.getPercentage() == 100);
}
