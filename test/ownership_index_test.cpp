#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <memory>
#include <sstream>
#include "ownership_index.hpp"
#include "ownership_error.hpp"
#include "pattern_matcher.hpp"
#include "progress_tracker.hpp"
#include "fake_blame_source.hpp"

namespace {

std::vector<std::string> names(const std::vector<Ownership>& owners) {
    std::vector<std::string> result;
    for (const auto& owner : owners) {
        result.push_back(owner.name);
    }
    return result;
}

IndexOptions withThreads(unsigned int numThreads) {
    IndexOptions options;
    options.numThreads = numThreads;
    return options;
}

} // namespace

TEST_CASE("OwnershipIndex builds a directory bottom-up", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("repo/fileA", {"alice", "alice", "bob"});
    source.addFile("repo/fileB", {"bob", "bob"});
    source.addFile("repo/lib/util.cpp", {"carol", "alice", "carol", "carol"});
    source.addFile("repo/lib/deep/empty.txt", {});

    unsigned int numThreads = GENERATE(1u, 2u, 8u);
    OwnershipIndex index("repo", source, withThreads(numThreads));

    SECTION("Every file and directory is indexed") {
        REQUIRE(index.size() == 7);
        REQUIRE(index.contains("repo"));
        REQUIRE(index.contains("repo/fileA"));
        REQUIRE(index.contains("repo/lib"));
        REQUIRE(index.contains("repo/lib/deep"));
        REQUIRE(index.contains("repo/lib/deep/empty.txt"));
        REQUIRE(index.isDirectory("repo/lib"));
        REQUIRE_FALSE(index.isDirectory("repo/lib/util.cpp"));
        REQUIRE(index.rootTracked());
        REQUIRE(index.rootIsDirectory());
    }

    SECTION("File sets sum to their line counts") {
        const auto& fileA = index.find("repo/fileA");
        REQUIRE(fileA.denominator() == 3);
        REQUIRE(fileA.linesFor("alice") == 2);
        REQUIRE(fileA.linesFor("bob") == 1);
    }

    SECTION("Directory denominators sum every tracked file beneath") {
        REQUIRE(index.find("repo/lib/deep").denominator() == 0);
        REQUIRE(index.find("repo/lib").denominator() == 4);
        REQUIRE(index.summarize().denominator() == 9);
    }

    SECTION("Root owners sum across all files") {
        const auto& root = index.summarize();
        REQUIRE(root.linesFor("alice") == 3);
        REQUIRE(root.linesFor("bob") == 3);
        REQUIRE(root.linesFor("carol") == 3);
        REQUIRE(names(root.owners()) == std::vector<std::string>{"alice", "bob", "carol"});
    }

    SECTION("Summarize returns the stored aggregate") {
        REQUIRE(&index.summarize() == &index.find("repo"));
        REQUIRE(&index.summarize("repo/lib") == &index.find("repo/lib"));
        REQUIRE(&index.summarize("repo/") == &index.summarize());
    }

    SECTION("Traversal is pre-order with the root first") {
        std::vector<fs::path> paths;
        for (const auto& [path, set] : index.traversal()) {
            paths.push_back(path);
        }

        REQUIRE(paths == std::vector<fs::path>{
            "repo",
            "repo/fileA",
            "repo/fileB",
            "repo/lib",
            "repo/lib/deep",
            "repo/lib/deep/empty.txt",
            "repo/lib/util.cpp"
        });
        REQUIRE(index.depth("repo") == 0);
        REQUIRE(index.depth("repo/lib/deep/empty.txt") == 3);
    }

    SECTION("Unknown paths are rejected") {
        REQUIRE_FALSE(index.contains("repo/missing.cpp"));
        REQUIRE_THROWS_AS(index.find("repo/missing.cpp"), InvalidPathError);
    }
}

TEST_CASE("OwnershipIndex matches scenario B", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("dir/fileA", {"alice", "alice", "bob"});
    source.addFile("dir/fileB", {"bob", "bob"});

    OwnershipIndex index("dir", source);
    const auto& set = index.summarize();

    REQUIRE(set.denominator() == 5);
    REQUIRE(set.owners()[0].name == "bob");
    REQUIRE(set.owners()[0].score == Score(3, 5));
    REQUIRE(set.owners()[1].name == "alice");
    REQUIRE(set.owners()[1].score == Score(2, 5));
}

TEST_CASE("OwnershipIndex absorbs untracked paths", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("repo/src/main.cpp", {"alice", "bob"});
    source.addUntrackedFile("repo/build/generated.cpp");
    source.addUntrackedFile("repo/build/out/more.cpp");
    source.addUntrackedFile("repo/src/scratch.cpp");

    std::ostringstream log;
    ProgressTracker progress(log, true);
    IndexOptions options;
    options.progress = &progress;

    OwnershipIndex index("repo", source, options);

    SECTION("An untracked subdirectory contributes nothing") {
        REQUIRE_FALSE(index.contains("repo/build"));
        REQUIRE(index.summarize().denominator() == 2);
        REQUIRE(index.summarize() == index.find("repo/src"));
    }

    SECTION("Untracked files are left out and counted") {
        REQUIRE_FALSE(index.contains("repo/src/scratch.cpp"));
        REQUIRE(progress.completedFiles() == 4);
        REQUIRE(progress.untrackedFiles() == 3);
        REQUIRE(progress.isComplete());
        REQUIRE(log.str().find("Skipping untracked file") != std::string::npos);
    }
}

TEST_CASE("OwnershipIndex reports an untracked root as empty", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("repo/tracked.cpp", {"alice"});
    source.addDirectory("scratch");
    source.addUntrackedFile("notes/todo.txt");

    SECTION("Directory with nothing tracked") {
        OwnershipIndex index("scratch", source);

        REQUIRE_FALSE(index.rootTracked());
        REQUIRE(index.size() == 1);
        REQUIRE(index.summarize().empty());
        REQUIRE(index.summarize().denominator() == 0);
    }

    SECTION("Single untracked file") {
        OwnershipIndex index("notes/todo.txt", source);

        REQUIRE_FALSE(index.rootTracked());
        REQUIRE_FALSE(index.rootIsDirectory());
        REQUIRE(index.summarize().empty());
    }
}

TEST_CASE("OwnershipIndex scores a single file root", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("repo/main.cpp", {"alice", "alice", "bob"});

    OwnershipIndex index("repo/main.cpp", source);

    REQUIRE(index.size() == 1);
    REQUIRE(index.rootTracked());
    REQUIRE_FALSE(index.rootIsDirectory());
    REQUIRE(index.summarize().owners()[0].score == Score(2, 3));
    REQUIRE(index.summarize().owners()[1].score == Score(1, 3));
}

TEST_CASE("OwnershipIndex rejects missing roots", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("repo/main.cpp", {"alice"});

    REQUIRE_THROWS_AS(OwnershipIndex("nowhere", source), InvalidPathError);
}

TEST_CASE("OwnershipIndex aborts on the first blame failure", "[OwnershipIndex]") {
    FakeBlameSource source;
    for (int i = 0; i < 100; ++i) {
        fs::path path = fs::path("big") / ("file" + std::to_string(i) + ".cpp");
        if (i == 42) {
            source.addFailingFile(path, "git: permission denied");
        } else {
            source.addFile(path, {"alice", "bob"});
        }
    }

    unsigned int numThreads = GENERATE(1u, 4u, 16u);

    std::ostringstream log;
    ProgressTracker progress(log);
    IndexOptions options;
    options.numThreads = numThreads;
    options.progress = &progress;

    std::unique_ptr<OwnershipIndex> index;
    REQUIRE_THROWS_AS(index = std::make_unique<OwnershipIndex>("big", source, options),
                      BlameUnavailableError);
    REQUIRE(index == nullptr);
    REQUIRE_FALSE(progress.isComplete());

    SECTION("The original error reaches the caller unchanged") {
        try {
            OwnershipIndex failing("big", source, options);
            FAIL("expected BlameUnavailableError");
        } catch (const BlameUnavailableError& e) {
            REQUIRE(e.detail() == "git: permission denied");
        }
    }
}

TEST_CASE("OwnershipIndex applies a path filter", "[OwnershipIndex]") {
    FakeBlameSource source;
    source.addFile("repo/src/main.cpp", {"alice", "alice"});
    source.addFile("repo/src/main.hpp", {"bob"});
    source.addFile("repo/docs/guide.md", {"carol", "carol", "carol"});

    PatternMatcher filter;
    filter.setIncludePatterns("*.cpp,*.hpp");

    IndexOptions options;
    options.filter = &filter;
    OwnershipIndex index("repo", source, options);

    REQUIRE_FALSE(index.contains("repo/docs"));
    REQUIRE(index.summarize().denominator() == 3);
    REQUIRE(index.summarize().linesFor("carol") == 0);
}

TEST_CASE("OwnershipIndex top-N queries", "[OwnershipIndex]") {
    OwnershipSet set("file", {{"alice", 5}, {"bob", 3}, {"carol", 2}});

    SECTION("n = 0 is empty") {
        REQUIRE(OwnershipIndex::top(set, 0).empty());
    }

    SECTION("n selects the leading owners") {
        REQUIRE(names(OwnershipIndex::top(set, 2)) == std::vector<std::string>{"alice", "bob"});
    }

    SECTION("n at or beyond the owner count returns every owner") {
        REQUIRE(OwnershipIndex::top(set, 3) == set.owners());
        REQUIRE(OwnershipIndex::top(set, 100) == set.owners());
    }

    SECTION("Negative n is rejected") {
        REQUIRE_THROWS_AS(OwnershipIndex::top(set, -1), InvalidArgumentError);
    }
}

TEST_CASE("OwnershipIndex percentage queries", "[OwnershipIndex]") {
    OwnershipSet set("file", {{"alice", 5}, {"bob", 3}, {"carol", 2}});

    SECTION("Smallest prefix reaching the percentage") {
        REQUIRE(names(OwnershipIndex::topPercentage(set, 0.5)) == std::vector<std::string>{"alice"});
        REQUIRE(names(OwnershipIndex::topPercentage(set, 0.51)) == std::vector<std::string>{"alice", "bob"});
        REQUIRE(names(OwnershipIndex::topPercentage(set, 0.8)) == std::vector<std::string>{"alice", "bob"});
    }

    SECTION("1.0 returns every owner") {
        REQUIRE(OwnershipIndex::topPercentage(set, 1.0) == set.owners());
    }

    SECTION("0.0 returns nothing") {
        REQUIRE(OwnershipIndex::topPercentage(set, 0.0).empty());
    }

    SECTION("Thirds reach 1.0 despite rounding") {
        OwnershipSet thirds("file", {{"a", 1}, {"b", 1}, {"c", 1}});
        REQUIRE(OwnershipIndex::topPercentage(thirds, 1.0).size() == 3);
        REQUIRE(OwnershipIndex::topPercentage(thirds, 2.0 / 3.0).size() == 2);
    }

    SECTION("Just above a boundary takes the next owner") {
        OwnershipSet halves("file", {{"a", 1}, {"b", 1}});
        REQUIRE(OwnershipIndex::topPercentage(halves, 0.5).size() == 1);
        REQUIRE(OwnershipIndex::topPercentage(halves, 0.5 + 5e-10).size() == 2);
    }

    SECTION("Empty set") {
        REQUIRE(OwnershipIndex::topPercentage(OwnershipSet(), 0.5).empty());
    }

    SECTION("Out of range percentages are rejected") {
        REQUIRE_THROWS_AS(OwnershipIndex::topPercentage(set, 1.5), InvalidArgumentError);
        REQUIRE_THROWS_AS(OwnershipIndex::topPercentage(set, -0.1), InvalidArgumentError);
    }
}

TEST_CASE("OwnershipIndex combined queries", "[OwnershipIndex]") {
    OwnershipSet set("file", {{"alice", 5}, {"bob", 3}, {"carol", 2}});

    SECTION("Neither limit returns every owner") {
        REQUIRE(OwnershipIndex::top(set, TopQuery()) == set.owners());
    }

    SECTION("Only n") {
        TopQuery query;
        query.n = 1;
        REQUIRE(names(OwnershipIndex::top(set, query)) == std::vector<std::string>{"alice"});
    }

    SECTION("Only percentage") {
        TopQuery query;
        query.percentage = 1.0;
        REQUIRE(OwnershipIndex::top(set, query) == set.owners());
    }

    SECTION("Both limits are rejected") {
        TopQuery query;
        query.n = 2;
        query.percentage = 0.5;
        REQUIRE_THROWS_AS(OwnershipIndex::top(set, query), InvalidArgumentError);
    }

    SECTION("Percentage above one is rejected") {
        TopQuery query;
        query.percentage = 1.5;
        REQUIRE_THROWS_AS(OwnershipIndex::validate(query), InvalidArgumentError);
    }
}
