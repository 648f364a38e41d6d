#include <catch2/catch_test_macros.hpp>
#include "file_scorer.hpp"
#include "ownership_error.hpp"
#include "fake_blame_source.hpp"

TEST_CASE("FileScorer counts lines per author", "[FileScorer]") {
    FakeBlameSource source;
    source.addFile("repo/main.cpp", {"alice", "alice", "bob"});
    source.addFile("repo/empty.txt", {});
    source.addFile("repo/case.txt", {"Alice", "alice", "alice"});

    FileScorer scorer(source);

    SECTION("Two thirds alice, one third bob") {
        auto set = scorer.scoreFile("repo/main.cpp");

        REQUIRE(set.denominator() == 3);
        REQUIRE(set.size() == 2);
        REQUIRE(set.owners()[0].name == "alice");
        REQUIRE(set.owners()[0].score == Score(2, 3));
        REQUIRE(set.owners()[1].name == "bob");
        REQUIRE(set.owners()[1].score == Score(1, 3));
        REQUIRE(set.path() == fs::path("repo/main.cpp"));
    }

    SECTION("An empty file yields an empty set") {
        auto set = scorer.scoreFile("repo/empty.txt");

        REQUIRE(set.empty());
        REQUIRE(set.denominator() == 0);
    }

    SECTION("Identities are compared exactly") {
        auto set = scorer.scoreFile("repo/case.txt");

        REQUIRE(set.size() == 2);
        REQUIRE(set.linesFor("alice") == 2);
        REQUIRE(set.linesFor("Alice") == 1);
    }
}

TEST_CASE("FileScorer propagates blame errors", "[FileScorer]") {
    FakeBlameSource source;
    source.addUntrackedFile("repo/generated.cpp");
    source.addFailingFile("repo/locked.cpp", "permission denied");

    FileScorer scorer(source);

    SECTION("Untracked file") {
        REQUIRE_THROWS_AS(scorer.scoreFile("repo/generated.cpp"), NotTrackedError);
    }

    SECTION("Blame failure") {
        REQUIRE_THROWS_AS(scorer.scoreFile("repo/locked.cpp"), BlameUnavailableError);
    }
}

TEST_CASE("FileScorer scores an author sequence", "[FileScorer]") {
    auto set = FileScorer::scoreLines("notes.md", {"carol", "dave", "carol", "carol"});

    REQUIRE(set.denominator() == 4);
    REQUIRE(set.owners()[0].name == "carol");
    REQUIRE(set.owners()[0].score.numerator() == 3);
    REQUIRE(set.owners()[1].name == "dave");
    REQUIRE(set.owners()[1].score.numerator() == 1);
}
