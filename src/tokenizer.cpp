// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include "agenteval/tokenizer.hpp"

#include "agenteval/errors.hpp"
#include "agenteval/text_processing.hpp"
#include "agenteval/types.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace {

using agenteval::Element;
using agenteval::ElementKind;
using agenteval::LineClassification;
using agenteval::LineKind;
using agenteval::ParseError;
using agenteval::TokenizerState;

constexpr std::string_view kFence = "```";
constexpr std::string_view kToolUse = "tool use:";
constexpr std::string_view kToolResponse = "tool response:";
constexpr std::string_view kArgs = "args:";

std::string_view ltrim_view(std::string_view line) {
    const auto begin = line.find_first_not_of(" \t");
    return begin == std::string_view::npos ? std::string_view{} : line.substr(begin);
}

bool starts_with_ci(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        const auto a = std::tolower(static_cast<unsigned char>(text[i]));
        const auto b = std::tolower(static_cast<unsigned char>(prefix[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

bool is_horizontal_rule(std::string_view trimmed) {
    if (trimmed.size() < 3) {
        return false;
    }
    const char marker = trimmed.front();
    if (marker != '-' && marker != '*' && marker != '_') {
        return false;
    }
    std::size_t count = 0;
    for (char ch : trimmed) {
        if (ch == marker) {
            ++count;
        } else if (ch != ' ') {
            return false;
        }
    }
    return count >= 3;
}

bool is_ordered_list_item(std::string_view trimmed) {
    std::size_t digits = 0;
    while (digits < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[digits]))) {
        ++digits;
    }
    return digits > 0 && digits + 1 < trimmed.size() &&
           (trimmed[digits] == '.' || trimmed[digits] == ')') && trimmed[digits + 1] == ' ';
}

// Headers, list and task-list items, blockquotes, horizontal rules and table rows.
bool is_markdown_structure(std::string_view trimmed) {
    if (trimmed.empty()) {
        return false;
    }
    if (trimmed.front() == '#') {
        const auto hashes = trimmed.find_first_not_of('#');
        return hashes != std::string_view::npos && hashes <= 6 && trimmed[hashes] == ' ';
    }
    if (trimmed.front() == '>' || trimmed.front() == '|') {
        return true;
    }
    if (is_horizontal_rule(trimmed)) {
        return true;
    }
    if (trimmed.size() >= 2 && (trimmed[0] == '-' || trimmed[0] == '*' || trimmed[0] == '+') &&
        trimmed[1] == ' ') {
        return true;
    }
    return is_ordered_list_item(trimmed);
}

// Runs one tokenize() call. Holds every piece of mutable state so Tokenizer itself stays stateless.
class Machine {
public:
    explicit Machine(std::vector<std::string>& warnings) : warnings_{warnings} {}

    void feed(std::string_view line, std::size_t line_no) {
        line_ = line;
        line_no_ = line_no;
        klass_ = agenteval::Tokenizer::classify_line(line);
        const auto handler = kDispatch[static_cast<std::size_t>(state_)]
                                      [static_cast<std::size_t>(klass_.kind)];
        (this->*handler)();
    }

    std::vector<Element> finish() {
        if (state_ == TokenizerState::InFence) {
            warnings_.push_back("line " + std::to_string(fence_line_) +
                                ": code fence is never closed; block kept as-is");
            emit_fence();
        }
        flush_content();
        return std::move(elements_);
    }

private:
    using Handler = void (Machine::*)();

    void ignore() {}

    void reject() {
        throw ParseError("All messages must have a role marker", line_no_);
    }

    void flush() { flush_content(); }

    void start_role() {
        flush_content();
        push(ElementKind::Role, klass_.marker, klass_.marker);
        state_ = TokenizerState::InRole;
        auto remainder = std::string_view{klass_.remainder};
        if (!remainder.empty() && remainder.front() == ' ') {
            remainder.remove_prefix(1);
        }
        if (!remainder.empty()) {
            buffer_.emplace_back(remainder);
            buffer_line_ = line_no_;
        }
    }

    void emit_tool_use() { emit_marker_line(ElementKind::ToolUse); }
    void emit_tool_response() { emit_marker_line(ElementKind::ToolResponse); }
    void emit_args() { emit_marker_line(ElementKind::Args); }

    void append_content() {
        if (buffer_.empty()) {
            buffer_line_ = line_no_;
        }
        buffer_.emplace_back(line_);
    }

    void open_fence() {
        flush_content();
        fence_.clear();
        fence_.emplace_back(line_);
        fence_line_ = line_no_;
        state_ = TokenizerState::InFence;
    }

    void append_fence() { fence_.emplace_back(line_); }

    void close_fence() {
        fence_.emplace_back(line_);
        emit_fence();
        state_ = TokenizerState::InRole;
    }

    void emit_marker_line(ElementKind kind) {
        flush_content();
        push(kind, agenteval::text::trim_copy(klass_.remainder), agenteval::text::trim_copy(line_));
    }

    void emit_fence() {
        const auto block = agenteval::text::join(fence_, "\n");
        elements_.push_back(Element{ElementKind::Content, block, block, fence_line_});
        fence_.clear();
    }

    void flush_content() {
        if (buffer_.empty()) {
            return;
        }
        auto joined = agenteval::text::join(buffer_, "\n");
        elements_.push_back(Element{ElementKind::Content, joined, joined, buffer_line_});
        buffer_.clear();
    }

    void push(ElementKind kind, std::string value, std::string source) {
        elements_.push_back(Element{kind, std::move(value), std::move(source), line_no_});
    }

    using Table = std::array<std::array<Handler, 8>, 3>;
    static const Table kDispatch;

    std::vector<std::string>& warnings_;
    std::vector<Element> elements_;
    std::vector<std::string> buffer_;
    std::vector<std::string> fence_;
    TokenizerState state_{TokenizerState::Idle};
    std::string_view line_;
    std::size_t line_no_{0};
    std::size_t buffer_line_{0};
    std::size_t fence_line_{0};
    LineClassification klass_;
};

// Rows: TokenizerState. Columns: LineKind in declaration order
// (Blank, FenceDelimiter, ToolUse, ToolResponse, Args, RoleMarker, Markdown, Text).
const Machine::Table Machine::kDispatch{{
    // Idle
    {{&Machine::ignore, &Machine::reject, &Machine::emit_tool_use,
      &Machine::emit_tool_response, &Machine::emit_args, &Machine::start_role,
      &Machine::reject, &Machine::reject}},
    // InRole
    {{&Machine::flush, &Machine::open_fence, &Machine::emit_tool_use,
      &Machine::emit_tool_response, &Machine::emit_args, &Machine::start_role,
      &Machine::append_content, &Machine::append_content}},
    // InFence
    {{&Machine::append_fence, &Machine::close_fence, &Machine::append_fence,
      &Machine::append_fence, &Machine::append_fence, &Machine::append_fence,
      &Machine::append_fence, &Machine::append_fence}},
}};

}  // namespace

namespace agenteval {

std::string_view element_kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::Role:         return "role";
        case ElementKind::Content:      return "content";
        case ElementKind::ToolUse:      return "tool_use";
        case ElementKind::ToolResponse: return "tool_response";
        case ElementKind::Args:         return "args";
    }
    return "content";
}

LineClassification Tokenizer::classify_line(std::string_view line) {
    LineClassification out;
    const auto trimmed = ltrim_view(line);
    if (text::trim_copy(line).empty()) {
        out.kind = LineKind::Blank;
        return out;
    }
    if (trimmed.substr(0, kFence.size()) == kFence) {
        out.kind = LineKind::FenceDelimiter;
        out.remainder = std::string{trimmed.substr(kFence.size())};
        return out;
    }
    if (starts_with_ci(trimmed, kToolUse)) {
        out.kind = LineKind::ToolUse;
        out.remainder = std::string{trimmed.substr(kToolUse.size())};
        return out;
    }
    if (starts_with_ci(trimmed, kToolResponse)) {
        out.kind = LineKind::ToolResponse;
        out.remainder = std::string{trimmed.substr(kToolResponse.size())};
        return out;
    }
    if (starts_with_ci(trimmed, kArgs)) {
        out.kind = LineKind::Args;
        out.remainder = std::string{trimmed.substr(kArgs.size())};
        return out;
    }
    if (const auto colon = trimmed.find(':'); colon != std::string_view::npos) {
        const auto token = trimmed.substr(0, colon);
        if (role_from_token(token)) {
            out.kind = LineKind::RoleMarker;
            out.marker = text::to_lower_copy(text::trim_copy(token));
            out.remainder = std::string{trimmed.substr(colon + 1)};
            return out;
        }
    }
    out.kind = is_markdown_structure(trimmed) ? LineKind::Markdown : LineKind::Text;
    return out;
}

std::vector<Element> Tokenizer::tokenize(std::string_view text) const {
    std::vector<std::string> ignored;
    return tokenize(text, ignored);
}

std::vector<Element> Tokenizer::tokenize(std::string_view text,
                                         std::vector<std::string>& warnings) const {
    const auto normalized = text::normalize_newlines(text);
    const auto lines = text::split_lines(normalized);

    Machine machine{warnings};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        machine.feed(lines[i], i + 1);
    }
    auto elements = machine.finish();

    auto advisories = validate(elements);
    warnings.insert(warnings.end(), advisories.begin(), advisories.end());
    return elements;
}

std::vector<std::string> Tokenizer::validate(const std::vector<Element>& elements) {
    std::vector<std::string> warnings;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].kind != ElementKind::ToolUse) {
            continue;
        }
        // An inline `args:` payload on the tool-use line counts as its args.
        if (elements[i].value.find("args:") != std::string::npos) {
            continue;
        }
        const bool followed = i + 1 < elements.size() &&
                              (elements[i + 1].kind == ElementKind::Args ||
                               elements[i + 1].kind == ElementKind::ToolResponse);
        if (!followed) {
            warnings.push_back("line " + std::to_string(elements[i].line) + ": tool use '" +
                               elements[i].value +
                               "' is not followed by args or a tool response");
        }
    }
    return warnings;
}

}  // namespace agenteval
