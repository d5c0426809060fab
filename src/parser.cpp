// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/parser.hpp"

#include "agenteval/errors.hpp"
#include "agenteval/fuzzy_match_parser.hpp"
#include "agenteval/text_processing.hpp"

#include <charconv>
#include <utility>

namespace {

using agenteval::Element;
using agenteval::ElementKind;
using agenteval::MessageBlock;
using agenteval::ParseError;
using agenteval::TestCase;

constexpr std::string_view kFrontmatterDelimiter = "---";

bool is_title_line(std::string_view line) {
    const auto trimmed = agenteval::text::trim_copy(line);
    return trimmed.rfind("# ", 0) == 0 || trimmed.rfind("## ", 0) == 0 || trimmed == "#" ||
           trimmed == "##";
}

bool is_section_header(std::string_view line) {
    return line.size() >= 2 && line[0] == '#' && line[1] == ' ';
}

bool is_fence_delimiter(std::string_view line) {
    return agenteval::text::trim_copy(line).rfind("```", 0) == 0;
}

bool is_blank(std::string_view line) {
    return agenteval::text::trim_copy(line).empty();
}

// Rethrows with the line number shifted into the caller's coordinate system.
[[noreturn]] void rethrow_shifted(const ParseError& e, std::size_t offset, const std::string& prefix) {
    std::optional<std::size_t> line;
    if (e.line()) {
        line = *e.line() + offset;
    }
    throw ParseError(prefix + e.detail(), line);
}

std::string unquote(std::string value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

int parse_runs(const std::string& raw, std::size_t line) {
    const auto value = agenteval::text::trim_copy(unquote(agenteval::text::trim_copy(raw)));
    int runs = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, runs);
    if (value.empty() || ec != std::errc{} || ptr != last || runs <= 0) {
        throw ParseError("Invalid runs value '" + raw + "': must be a positive integer", line);
    }
    return runs;
}

// Splits `tool use: <name> args: <payload>` at the first `args:`.
agenteval::ToolUsage split_tool_use(const std::string& remainder) {
    const auto lowered = agenteval::text::to_lower_copy(remainder);
    const auto pos = lowered.find("args:");
    if (pos == std::string::npos) {
        return {agenteval::text::trim_copy(remainder), {}};
    }
    return {agenteval::text::trim_copy(remainder.substr(0, pos)),
            agenteval::text::trim_copy(remainder.substr(pos + 5))};
}

// Folds the element stream into message blocks.
class BlockBuilder {
public:
    explicit BlockBuilder(TestCase& test_case) : test_case_{test_case} {}

    void consume(const Element& element) {
        switch (element.kind) {
            case ElementKind::Role:
                start_block(element);
                break;
            case ElementKind::Content:
                require_block(element, "Content");
                content_.push_back(element.value);
                break;
            case ElementKind::ToolUse:
                require_block(element, "Tool use");
                current_->tool_usages.push_back(split_tool_use(element.value));
                tool_lines_.push_back(element.source);
                break;
            case ElementKind::Args:
                attach_args(element);
                break;
            case ElementKind::ToolResponse:
                require_block(element, "Tool response");
                current_->tool_responses.push_back({element.value});
                tool_lines_.push_back(element.source);
                break;
        }
    }

    void finish() { flush(); }

private:
    void start_block(const Element& element) {
        flush();
        const auto role = agenteval::role_from_token(element.value);
        if (!role) {
            throw ParseError("Invalid role '" + element.value + "'", element.line);
        }
        current_ = MessageBlock{};
        current_->role = *role;
        block_line_ = element.line;
    }

    void require_block(const Element& element, const std::string& what) {
        if (!current_) {
            throw ParseError(what + " found without a role", element.line);
        }
    }

    // An args line with no tool use to attach to is ordinary prose.
    void attach_args(const Element& element) {
        require_block(element, "Args");
        if (current_->tool_usages.empty()) {
            content_.push_back(element.source);
            return;
        }
        auto& args = current_->tool_usages.back().args;
        args = args.empty() ? element.value : args + "\n" + element.value;
        tool_lines_.push_back(element.source);
    }

    void flush() {
        if (!current_) {
            return;
        }
        auto content = agenteval::text::join(content_, "\n");
        if (!tool_lines_.empty()) {
            const auto tools = agenteval::text::join(tool_lines_, "\n");
            content = content.empty() ? tools : content + "\n" + tools;
        }
        if (current_->role == agenteval::Role::Assistant) {
            try {
                auto assertions = agenteval::FuzzyMatchParser::parse_assertions(content);
                test_case_.fuzzy_match_assertions.insert(test_case_.fuzzy_match_assertions.end(),
                                                         assertions.begin(), assertions.end());
            } catch (const ParseError& e) {
                throw ParseError(e.detail(), block_line_);
            }
            content = agenteval::FuzzyMatchParser::clean_content(content);
        }
        current_->content = std::move(content);
        test_case_.message_blocks.push_back(std::move(*current_));
        current_.reset();
        content_.clear();
        tool_lines_.clear();
    }

    TestCase& test_case_;
    std::optional<MessageBlock> current_;
    std::vector<std::string> content_;
    std::vector<std::string> tool_lines_;
    std::size_t block_line_{0};
};

}  // namespace

namespace agenteval {

TestCase Parser::parse(std::string_view text, const std::string& name, const std::string& id) const {
    std::vector<std::string> ignored;
    return parse(text, name, id, ignored);
}

TestCase Parser::parse(std::string_view text, const std::string& name, const std::string& id,
                       std::vector<std::string>& warnings) const {
    auto lines = text::split_lines(text::normalize_newlines(text));

    // Blank the title line instead of erasing it so line numbers stay put.
    for (auto& line : lines) {
        if (is_blank(line)) {
            continue;
        }
        if (is_title_line(line)) {
            line.clear();
        }
        break;
    }

    TestCase test_case;
    test_case.name = name;
    test_case.id = id.empty() ? name : id;

    const auto elements = tokenizer_.tokenize(text::join(lines, "\n"), warnings);
    BlockBuilder builder{test_case};
    for (const auto& element : elements) {
        builder.consume(element);
    }
    builder.finish();

    validate_test_case(test_case);
    return test_case;
}

std::vector<TestCase> Parser::parse_multiple(std::string_view text, const std::string& base_name,
                                             const std::string& hierarchical_id) const {
    std::vector<std::string> ignored;
    return parse_multiple(text, base_name, hierarchical_id, ignored);
}

std::vector<TestCase> Parser::parse_multiple(std::string_view text, const std::string& base_name,
                                             const std::string& hierarchical_id,
                                             std::vector<std::string>& warnings) const {
    const auto lines = text::split_lines(text::normalize_newlines(text));
    const auto frontmatter = parse_frontmatter(lines);

    struct Section {
        std::string title;
        std::size_t header_line{0};  // 0-based
        std::vector<std::string> body;
    };
    std::vector<Section> sections;
    std::vector<std::string> preamble;

    bool previous_blank = true;
    bool in_fence = false;
    for (std::size_t i = frontmatter.body_line; i < lines.size(); ++i) {
        const auto& line = lines[i];
        const bool fence_delimiter = is_fence_delimiter(line);
        if (!in_fence && previous_blank && is_section_header(line)) {
            auto title = text::trim_copy(std::string_view{line}.substr(2));
            if (title.empty()) {
                throw ParseError("Test case header has no title", i + 1);
            }
            sections.push_back(Section{std::move(title), i, {}});
        } else if (sections.empty()) {
            preamble.push_back(line);
        } else {
            sections.back().body.push_back(line);
        }
        if (fence_delimiter) {
            in_fence = !in_fence;
        }
        previous_blank = is_blank(line);
    }

    std::vector<TestCase> out;
    if (sections.empty()) {
        try {
            auto test_case = parse(text::join(preamble, "\n"), base_name, hierarchical_id, warnings);
            test_case.runs = frontmatter.runs;
            out.push_back(std::move(test_case));
        } catch (const ParseError& e) {
            rethrow_shifted(e, frontmatter.body_line, {});
        }
        return out;
    }

    for (std::size_t i = 0; i < preamble.size(); ++i) {
        if (!is_blank(preamble[i])) {
            throw ParseError("Text found before the first test case header",
                             frontmatter.body_line + i + 1);
        }
    }

    for (const auto& section : sections) {
        const auto id =
            hierarchical_id.empty() ? section.title : hierarchical_id + "/" + section.title;
        try {
            auto test_case = parse(text::join(section.body, "\n"), section.title, id, warnings);
            test_case.runs = frontmatter.runs;
            out.push_back(std::move(test_case));
        } catch (const ParseError& e) {
            rethrow_shifted(e, section.header_line + 1, "test case '" + section.title + "': ");
        }
    }
    return out;
}

void Parser::validate_test_case(const TestCase& test_case) {
    if (test_case.message_blocks.empty()) {
        throw ParseError("Test case '" + test_case.name + "' must contain at least one message");
    }
    bool seen_non_system = false;
    for (const auto& block : test_case.message_blocks) {
        if (block.role != Role::System) {
            seen_non_system = true;
        } else if (seen_non_system) {
            throw ParseError("Test case '" + test_case.name +
                             "': system messages must come before all other messages");
        }
    }
}

Frontmatter Parser::parse_frontmatter(const std::vector<std::string>& lines) {
    Frontmatter out;
    if (lines.empty() || text::trim_copy(lines.front()) != kFrontmatterDelimiter) {
        return out;
    }
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto trimmed = text::trim_copy(lines[i]);
        if (trimmed == kFrontmatterDelimiter) {
            out.body_line = i + 1;
            return out;
        }
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        const auto colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (text::trim_copy(std::string_view{trimmed}.substr(0, colon)) == "runs") {
            out.runs = parse_runs(trimmed.substr(colon + 1), i + 1);
        }
    }
    throw ParseError("Frontmatter is not closed with '---'", 1);
}

}  // namespace agenteval
