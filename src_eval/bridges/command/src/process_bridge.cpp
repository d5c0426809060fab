#include "agenteval_eval/process_bridge.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace agenteval::eval::process_bridge {

static std::string quote(const std::string& s) {
    std::ostringstream os;
    os << '\'';
    for (char ch : s) {
        if (ch == '\'') {
            os << "'\\''";
        } else {
            os << ch;
        }
    }
    os << '\'';
    return os.str();
}

static std::string quote(const fs::path& p) { return quote(p.string()); }

static bool write_text(const fs::path& p, const std::string& text, std::string& diag) {
    std::ofstream ofs(p, std::ios::binary);
    if (!ofs) {
        diag += "Failed to open for write: " + p.string() + "\n";
        return false;
    }
    ofs << text;
    if (!ofs) {
        diag += "Short write: " + p.string() + "\n";
        return false;
    }
    return true;
}

static bool read_text(const fs::path& p, std::string& out) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

// Unique per process, thread and call so concurrent exchanges never share a directory.
static fs::path make_unique_dir(const fs::path& base, const std::string& prefix) {
    static std::atomic<unsigned long long> counter{0};
    const auto now = std::chrono::system_clock::now();
    const auto since_epoch =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    std::ostringstream os;
    os << prefix << since_epoch << '_' << std::hash<std::thread::id>{}(std::this_thread::get_id())
       << '_' << counter.fetch_add(1);
    return base / os.str();
}

static int run_cmd(const std::string& cmd, std::string& diag) {
    const int rc = std::system(cmd.c_str());
    if (rc != 0) {
        diag += "cmd failed: " + cmd + " rc=" + std::to_string(rc) + "\n";
    }
    return rc;
}

bool exchange(const Config& config, const nlohmann::json& request, Exchange& out, std::string& diag) {
    if (config.command.empty()) {
        diag += "No command configured\n";
        return false;
    }

    std::error_code ec;
    const fs::path base = config.work_dir.empty() ? fs::temp_directory_path(ec) : config.work_dir;
    if (ec) {
        diag += "No temporary directory available: " + ec.message() + "\n";
        return false;
    }
    const fs::path dir = make_unique_dir(base, config.prefix);
    fs::create_directories(dir, ec);
    if (ec) {
        diag += "Failed to create work dir: " + dir.string() + " : " + ec.message() + "\n";
        return false;
    }

    const fs::path request_path = dir / "request.json";
    const fs::path response_path = dir / "response.json";

    bool ok = write_text(request_path,
                         request.dump(2, ' ', false, nlohmann::json::error_handler_t::replace), diag);
    if (ok) {
        std::ostringstream cmd;
        cmd << config.command << " --input " << quote(request_path) << " --output "
            << quote(response_path);
        out.exit_code = run_cmd(cmd.str(), diag);

        std::string body;
        if (!read_text(response_path, body)) {
            diag += "Missing response file: " + response_path.string() + "\n";
            ok = false;
        } else {
            try {
                out.response = nlohmann::json::parse(body);
            } catch (const nlohmann::json::parse_error& e) {
                diag += "Malformed response JSON: " + std::string{e.what()} + "\n";
                ok = false;
            }
        }
        if (out.exit_code != 0) {
            ok = false;
        }
    }

    if (!config.keep_files) {
        fs::remove_all(dir, ec);
    }
    return ok;
}

}  // namespace agenteval::eval::process_bridge
