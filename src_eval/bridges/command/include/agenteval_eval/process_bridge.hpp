#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace agenteval::eval::process_bridge {

/**
 * \brief JSON-over-files subprocess exchange.
 *
 * A request document is written to `<work_dir>/<prefix><unique>/request.json`, the configured
 * command is run as
 *
 * \code{.txt}
 * <command> --input <request.json> --output <response.json>
 * \endcode
 *
 * and `response.json` is parsed back. The command string is passed to the shell unchanged, so it
 * may carry its own arguments (`python3 tools/agent.py --fast`). Paths are quoted.
 *
 * Work directories default to the system temp directory and are removed after each exchange
 * unless `keep_files` is set.
 */
struct Config {
    std::string command;
    std::filesystem::path work_dir{};
    std::string prefix{"agenteval_"};
    bool keep_files{false};
};

struct Exchange {
    int exit_code{0};
    nlohmann::json response;
};

/**
 * \brief Runs one request/response round trip.
 *
 * Returns false when the request cannot be written, the command exits non-zero, or the response
 * is missing or not valid JSON. Details are appended to `diag`. A non-zero exit still parses a
 * response if one was produced, so commands can report structured errors.
 */
bool exchange(const Config& config, const nlohmann::json& request, Exchange& out, std::string& diag);

}  // namespace agenteval::eval::process_bridge
