#include <iostream>
#include <CLI/CLI.hpp>
#include "who_owns.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"who-owns - Rank the authors of files and directories by blamed lines"};

        WhoOwnsOptions options;
        std::string formatStr = "tree";
        std::string identityStr = "name";
        long long topN = 0;
        double percentage = 0.0;
        size_t maxDepth = 0;
        bool noHeader = false;

        // Target file or directory
        app.add_option("path", options.target, "File or directory to attribute (default: .)");

        // Owner selection
        auto topOpt = app.add_option("-n,--top", topN, "Show only the first N owners of each path");
        auto percentageOpt = app.add_option("-p,--percentage", percentage,
                     "Show the smallest set of owners covering this fraction of lines (0-1)");

        // Output options
        app.add_option("-f,--format", formatStr, "Output format: tree, csv, json (default: tree)")
            ->check(CLI::IsMember({"tree", "csv", "json"}));
        app.add_flag("--no-header", noHeader, "Omit the CSV header row");
        app.add_option("-o,--output", options.outputFile, "Write output to a file instead of stdout");
        auto depthOpt = app.add_option("-d,--max-depth", maxDepth, "Deepest level shown below the target");
        app.add_flag("--files-only", options.render.filesOnly, "Only show files below the target");
        app.add_flag("--dirs-only", options.render.directoriesOnly, "Only show directories below the target");

        // Optional include patterns
        app.add_option("--include", options.includePatterns,
                     "Comma-separated list of glob patterns for files to include (e.g. *.cpp,*.hpp)");

        // Optional exclude patterns
        app.add_option("--exclude", options.excludePatterns,
                     "Comma-separated list of glob patterns for files to exclude (e.g. *.md,third_party/**)");

        // Blame options
        app.add_option("--identity", identityStr, "Owner identity: name, email, name-email (default: name)")
            ->check(CLI::IsMember({"name", "email", "name-email"}));
        app.add_option("--rev", options.git.revision, "Blame the files as of this revision");
        app.add_flag("-w,--ignore-whitespace", options.git.ignoreWhitespace, "Ignore whitespace-only changes");
        app.add_option("--git", options.git.gitExecutable, "git executable to run (default: git)");

        // Optional thread count
        app.add_option("--threads", options.numThreads,
                     "Number of concurrent blame processes (default: number of CPU cores)")
            ->check(CLI::Range(1u, 256u));

        // Optional verbose flag
        app.add_flag("-v,--verbose", options.verbose, "Enable verbose output");

        // Optional timing flag
        app.add_flag("-t,--timing", options.showTiming, "Show detailed timing information");

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        options.format = Renderer::formatFromString(formatStr);
        options.git.identity = GitBlameSource::identityModeFromString(identityStr);
        options.render.header = !noHeader;

        if (*topOpt) {
            options.render.query.n = topN;
        }
        if (*percentageOpt) {
            options.render.query.percentage = percentage;
        }
        if (*depthOpt) {
            options.render.maxDepth = maxDepth;
        }

        // Run who-owns
        WhoOwns whoOwns(options, std::cout, std::cerr);
        if (!whoOwns.run()) {
            return 1;
        }

        // Print summary and timing to the log stream, stdout carries the result
        if (options.verbose) {
            std::cerr << whoOwns.getSummary() << std::endl;
        }
        if (options.showTiming) {
            std::cerr << whoOwns.getTimingInfo() << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
