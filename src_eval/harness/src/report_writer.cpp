#include "agenteval_eval/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json fuzzy_to_json(const agenteval::FuzzyMatchResult& match) {
    return json{
        {"expected_text", match.assertion.expected_text},
        {"threshold", match.assertion.threshold},
        {"passed", match.passed},
        {"final_score", match.final_score},
        {"best_match", match.best_match},
        {"rouge",
         {
             {"rouge1", match.rouge_scores.rouge1},
             {"rouge2", match.rouge_scores.rouge2},
             {"rougeL", match.rouge_scores.rougeL},
         }},
        {"position", {{"start", match.match_position.start}, {"end", match.match_position.end}}},
    };
}

json result_to_json(const agenteval::eval::EvaluationResult& result) {
    json fuzzy = json::array();
    for (const auto& match : result.fuzzy_matches) {
        fuzzy.push_back(fuzzy_to_json(match));
    }
    return json{
        {"test_case_id", result.test_case_id},
        {"name", result.name},
        {"run", result.run},
        {"passed", result.passed},
        {"score", result.score},
        {"duration_ms", result.duration.count()},
        {"expected", result.expected},
        {"observed", result.observed},
        {"error", result.error ? json(*result.error) : json(nullptr)},
        {"fuzzy_matches", std::move(fuzzy)},
    };
}

std::string percent(double ratio) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << ratio * 100.0 << '%';
    return os.str();
}

std::string fixed3(double value) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << value;
    return os.str();
}

// Table cells must stay on one line and must not close the cell early.
std::string escape_markdown_cell(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '|':
                out += "\\|";
                break;
            case '\n':
                out += "<br>";
                break;
            case '\r':
                break;
            default:
                out += ch;
        }
    }
    return out;
}

std::string render_markdown(const agenteval::eval::EvaluationReport& report) {
    const auto& s = report.summary;
    std::ostringstream oss;
    oss << "# Evaluation Report\n\n"
        << "## Summary\n\n"
        << "- Total: " << s.total << "\n"
        << "- Passed: " << s.passed << "\n"
        << "- Failed: " << s.failed << "\n"
        << "- Pass rate: " << percent(s.pass_rate) << "\n"
        << "- Average score: " << fixed3(s.average_score) << "\n"
        << "- Threshold: " << fixed3(s.threshold) << "\n"
        << "- Scoring method: " << agenteval::eval::to_string(report.metadata.scoring_method) << "\n"
        << "- Timestamp: " << report.metadata.timestamp << "\n\n"
        << "## Results\n\n"
        << "| # | Test case | Run | Status | Score | Duration (ms) | Details |\n"
        << "|---|---|---|---|---|---|---|\n";

    for (std::size_t index = 0; index < report.results.size(); ++index) {
        const auto& r = report.results[index];
        std::string details;
        if (r.error) {
            details = "Error: " + *r.error;
        } else if (!r.passed) {
            details = "Expected: " + r.expected + " / Observed: " + r.observed;
        }
        oss << "| " << (index + 1) << " | " << escape_markdown_cell(r.test_case_id) << " | " << r.run
            << " | " << (r.passed ? "PASS" : "FAIL") << " | " << fixed3(r.score) << " | "
            << r.duration.count() << " | " << escape_markdown_cell(details) << " |\n";
    }
    return oss.str();
}

std::string render_text(const agenteval::eval::EvaluationReport& report) {
    const auto& s = report.summary;
    std::ostringstream oss;
    oss << "Test Summary\n"
        << "============\n"
        << "Total: " << s.total << "\n"
        << "Passed: " << s.passed << "\n"
        << "Failed: " << s.failed << "\n"
        << "Pass rate: " << percent(s.pass_rate) << "\n"
        << "Average score: " << fixed3(s.average_score) << " (threshold " << fixed3(s.threshold)
        << ", " << agenteval::eval::to_string(report.metadata.scoring_method) << ")\n";

    bool header = false;
    for (const auto& r : report.results) {
        if (r.passed) {
            continue;
        }
        if (!header) {
            oss << "\nFailures\n--------\n";
            header = true;
        }
        oss << "FAIL " << r.test_case_id << " (run " << r.run << ") score " << fixed3(r.score);
        if (r.error) {
            oss << ": " << *r.error;
        }
        oss << "\n";
    }
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace agenteval::eval {

json ReportWriter::to_json(const EvaluationReport& report) const {
    json results = json::array();
    for (const auto& result : report.results) {
        results.push_back(result_to_json(result));
    }
    const auto& s = report.summary;
    return json{
        {"summary",
         {
             {"total", s.total},
             {"passed", s.passed},
             {"failed", s.failed},
             {"pass_rate", s.pass_rate},
             {"average_score", s.average_score},
             {"threshold", s.threshold},
         }},
        {"results", std::move(results)},
        {"metadata",
         {
             {"timestamp", report.metadata.timestamp},
             {"scoring_method", std::string{to_string(report.metadata.scoring_method)}},
             {"threshold", report.metadata.threshold},
             {"has_errors", report.metadata.has_errors},
         }},
    };
}

std::string ReportWriter::render(const EvaluationReport& report, OutputFormat format) const {
    switch (format) {
        // Test files are not required to be UTF-8; invalid bytes become U+FFFD.
        case OutputFormat::Json:
            return to_json(report).dump(2, ' ', false, json::error_handler_t::replace);
        case OutputFormat::Markdown: return render_markdown(report);
        case OutputFormat::Text:     return render_text(report);
    }
    throw std::invalid_argument("Unsupported output format");
}

void ReportWriter::write(const std::filesystem::path& destination, const EvaluationReport& report,
                         OutputFormat format) const {
    write_file(destination, render(report, format));
}

}  // namespace agenteval::eval
