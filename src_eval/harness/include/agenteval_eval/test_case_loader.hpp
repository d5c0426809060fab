#pragma once

#include "agenteval/parser.hpp"
#include "agenteval/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace agenteval::eval {

struct LoadIssue {
    std::string file_path;
    std::string message;
};

struct LoadResult {
    std::vector<TestCase> test_cases;
    std::vector<LoadIssue> errors;
    std::vector<LoadIssue> warnings;

    [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }
};

/**
 * \brief Discovers and parses test-case files.
 *
 * Every `.txt` and `.md` file below a directory is parsed with Parser::parse_multiple. Test-case
 * ids are built from the path relative to `root`:
 *
 * \code{.txt}
 * <root>/weather/forecast.md  ->  weather/forecast/<section title>
 * <root>/smoke.txt            ->  smoke            (no sections)
 * \endcode
 *
 * Files are visited in sorted path order so results are stable across platforms.
 */
class TestCaseLoader {
public:
    explicit TestCaseLoader(std::filesystem::path root);

    /// Throws ParseError for malformed content, std::runtime_error when the file is unreadable.
    [[nodiscard]] std::vector<TestCase> load_file(const std::filesystem::path& file) const;
    [[nodiscard]] std::vector<TestCase> load_file(const std::filesystem::path& file,
                                                  std::vector<std::string>& warnings) const;

    /**
     * \brief Loads every test-case file below `directory`.
     *
     * Failures are collected per file. With `stop_on_error` the walk stops at the first failing
     * file. A missing directory is reported as an error for that path.
     */
    [[nodiscard]] LoadResult load_directory(const std::filesystem::path& directory,
                                            bool stop_on_error = false) const;

    /// `<relative dir>/<stem>` with '/' separators, or just the stem for files outside the root.
    [[nodiscard]] std::string hierarchical_id(const std::filesystem::path& file) const;

    [[nodiscard]] static bool is_test_case_file(const std::filesystem::path& file);

private:
    std::filesystem::path root_;
    Parser parser_;
};

}  // namespace agenteval::eval
