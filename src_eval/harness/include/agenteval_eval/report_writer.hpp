#pragma once

#include "config.hpp"
#include "evaluator.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace agenteval::eval {

/**
 * \brief Renders evaluation reports.
 *
 * - json: the full report (summary, results with fuzzy-match details, metadata), 2-space indent.
 * - markdown: summary list and a results table.
 * - text: summary block followed by one line per failing execution.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    [[nodiscard]] std::string render(const EvaluationReport& report, OutputFormat format) const;

    [[nodiscard]] nlohmann::json to_json(const EvaluationReport& report) const;

    /// Creates parent directories. Throws std::runtime_error when the file cannot be opened.
    void write(const std::filesystem::path& destination, const EvaluationReport& report,
               OutputFormat format) const;
};

}  // namespace agenteval::eval
