/**
 * @file test_command_bridge.cpp
 * @brief Integration Tests for agents and embedding providers behind external commands
 *
 * Each test writes a small POSIX shell script that plays the external process. The bridge
 * invokes it as `sh <script> --input <request> --output <response>`.
 *
 * @author agenteval contributors
 * @date 2025
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 agenteval contributors

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "agenteval_eval/command_agent.hpp"
#include "agenteval_eval/command_embedding_provider.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using agenteval::eval::AgentInput;
using agenteval::eval::CommandAgent;
using agenteval::eval::CommandEmbeddingProvider;
using agenteval::eval::EmbeddingError;
using Catch::Approx;

namespace {

class ScriptDir {
public:
    ScriptDir() : root_(fs::temp_directory_path() / "agenteval_bridge_test") {
        fs::remove_all(root_);
        fs::create_directories(root_ / "work");
    }
    ~ScriptDir() { fs::remove_all(root_); }

    /// Writes `body` as a script and returns the command that runs it.
    std::string script(const std::string& name, const std::string& body) const {
        const auto path = root_ / name;
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
        return "sh '" + path.string() + "'";
    }

    [[nodiscard]] const fs::path& root() const { return root_; }
    [[nodiscard]] fs::path work() const { return root_ / "work"; }

private:
    fs::path root_;
};

std::string slurp(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

AgentInput prompt(const std::string& content) {
    AgentInput input;
    input.messages.push_back({"system", "be brief"});
    input.messages.push_back({"user", content});
    return input;
}

}  // namespace

/* ===================================================================== */
/* ==== AGENT ========================================================== */
/* ===================================================================== */

TEST_CASE("Command agent round trip", "[bridge][agent]") {
    ScriptDir dir;
    const auto captured = dir.root() / "captured.json";
    CommandAgent agent(dir.script("agent.sh",
                                  "cp \"$2\" '" + captured.string() + "'\n"
                                  "printf '{\"response\": \"pong\"}' > \"$4\""),
                       dir.work());

    REQUIRE_THROWS_AS(agent.send_input(prompt("ping")), std::logic_error);

    agent.initialize({"echo-model"});
    agent.authenticate({"secret"});
    const auto output = agent.send_input(prompt("ping"));

    REQUIRE_FALSE(output.error.has_value());
    REQUIRE(output.response == "pong");

    const auto request = nlohmann::json::parse(slurp(captured));
    REQUIRE(request["model"] == "echo-model");
    REQUIRE(request["api_key"] == "secret");
    REQUIRE(request["messages"].size() == 2);
    REQUIRE(request["messages"][1]["role"] == "user");
    REQUIRE(request["messages"][1]["content"] == "ping");

    // Exchange directories are cleaned up after each call.
    REQUIRE(fs::is_empty(dir.work()));

    agent.cleanup();
    REQUIRE_FALSE(agent.initialized());
}

TEST_CASE("Command agent with non-UTF-8 prompt text", "[bridge][agent]") {
    ScriptDir dir;
    const auto captured = dir.root() / "captured.json";
    CommandAgent agent(dir.script("agent.sh",
                                  "cp \"$2\" '" + captured.string() + "'\n"
                                  "printf '{\"response\": \"ok\"}' > \"$4\""),
                       dir.work());
    agent.initialize({"m"});
    agent.authenticate({""});

    const auto output = agent.send_input(prompt("caf\xE9"));

    REQUIRE_FALSE(output.error.has_value());
    REQUIRE(output.response == "ok");
    const auto request = nlohmann::json::parse(slurp(captured));
    REQUIRE(request["messages"][1]["content"] == "caf\xEF\xBF\xBD");
}

TEST_CASE("Command agent failures", "[bridge][agent]") {
    ScriptDir dir;

    SECTION("Structured errors are passed through") {
        CommandAgent agent(dir.script("agent.sh",
                                      "printf '{\"error\": {\"message\": \"quota exceeded\", \"code\": \"429\"}}' > \"$4\"\n"
                                      "exit 1"),
                           dir.work());
        agent.initialize({"m"});
        agent.authenticate({""});
        const auto output = agent.send_input(prompt("hi"));
        REQUIRE(output.error.has_value());
        REQUIRE(output.error->message == "quota exceeded");
        REQUIRE(output.error->code == "429");
    }

    SECTION("A crashing command becomes a bridge error") {
        CommandAgent agent(dir.script("agent.sh", "exit 3"), dir.work());
        agent.initialize({"m"});
        agent.authenticate({""});
        const auto output = agent.send_input(prompt("hi"));
        REQUIRE(output.error.has_value());
        REQUIRE(output.error->code == "bridge_error");
        REQUIRE(output.error->message.find("Missing response file") != std::string::npos);
    }

    SECTION("A response without text is rejected") {
        CommandAgent agent(dir.script("agent.sh", "printf '{\"answer\": 1}' > \"$4\""), dir.work());
        agent.initialize({"m"});
        agent.authenticate({""});
        const auto output = agent.send_input(prompt("hi"));
        REQUIRE(output.error.has_value());
        REQUIRE(output.error->message == "Response has no 'response' string");
    }

    SECTION("A model is required") {
        CommandAgent agent(dir.script("agent.sh", "exit 0"), dir.work());
        REQUIRE_THROWS_AS(agent.initialize({""}), std::invalid_argument);
    }
}

/* ===================================================================== */
/* ==== EMBEDDINGS ===================================================== */
/* ===================================================================== */

TEST_CASE("Command embedding provider", "[bridge][embedding]") {
    ScriptDir dir;

    SECTION("Returns the embedding vector") {
        CommandEmbeddingProvider provider({
            .command = dir.script("embed.sh", "printf '{\"embedding\": [0.5, -1, 2]}' > \"$4\""),
            .model = "hebo-embeddings",
            .api_key = "k",
            .work_dir = dir.work(),
        });
        const auto response = provider.generate_embedding("hello");
        REQUIRE(response.embedding.size() == 3);
        REQUIRE(response.embedding[0] == Approx(0.5));
        REQUIRE(response.embedding[1] == Approx(-1.0));
    }

    SECTION("Upstream status codes are preserved") {
        CommandEmbeddingProvider provider({
            .command = dir.script("embed.sh",
                                  "printf '{\"status\": 503, \"error\": \"overloaded\"}' > \"$4\"\nexit 1"),
            .model = "m",
            .api_key = "",
            .work_dir = dir.work(),
        });
        try {
            (void)provider.generate_embedding("hello");
            FAIL("expected an EmbeddingError");
        } catch (const EmbeddingError& e) {
            REQUIRE(e.status() == 503);
            REQUIRE(e.transient());
            REQUIRE(std::string{e.what()} == "Embedding request failed: overloaded");
        }
    }

    SECTION("A failed command is transient") {
        CommandEmbeddingProvider provider({
            .command = dir.script("embed.sh", "exit 2"),
            .model = "m",
            .api_key = "",
            .work_dir = dir.work(),
        });
        try {
            (void)provider.generate_embedding("hello");
            FAIL("expected an EmbeddingError");
        } catch (const EmbeddingError& e) {
            REQUIRE(e.status() == 500);
        }
    }

    SECTION("Empty embeddings are rejected") {
        CommandEmbeddingProvider provider({
            .command = dir.script("embed.sh", "printf '{\"embedding\": []}' > \"$4\""),
            .model = "m",
            .api_key = "",
            .work_dir = dir.work(),
        });
        try {
            (void)provider.generate_embedding("hello");
            FAIL("expected an EmbeddingError");
        } catch (const EmbeddingError& e) {
            REQUIRE_FALSE(e.transient());
        }
    }

    SECTION("Input validation") {
        REQUIRE_THROWS_AS(CommandEmbeddingProvider(CommandEmbeddingProvider::Settings{}), std::invalid_argument);
        CommandEmbeddingProvider provider({.command = "true", .model = "m", .api_key = "", .work_dir = dir.work()});
        REQUIRE_THROWS_WITH(provider.generate_embedding(""), "Text cannot be empty");
    }
}
