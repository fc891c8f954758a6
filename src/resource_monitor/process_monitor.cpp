/**
 * @file process_monitor.cpp
 * @brief Parsing of /proc/self/status memory fields.
 */

#include "resource_monitor/process_monitor.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <string>

namespace sandbox_orchestrator {

namespace {

/**
 * @brief Parse a "<Key>:   <value> kB" line into bytes.
 */
uint64_t parse_kb_field(std::string_view line, std::string_view key) {
    std::istringstream iss(std::string(line.substr(key.size())));
    uint64_t kb = 0;
    iss >> kb;
    return kb * 1024;
}

}  // anonymous namespace

Result<ProcessMemory> parse_proc_status(std::string_view status_text) {
    ProcessMemory memory;
    bool has_rss = false;

    std::istringstream iss{std::string(status_text)};
    std::string line;
    while (std::getline(iss, line)) {
        if (line.starts_with("VmRSS:")) {
            memory.rss_bytes = parse_kb_field(line, "VmRSS:");
            has_rss = true;
        } else if (line.starts_with("VmSize:")) {
            memory.virtual_bytes = parse_kb_field(line, "VmSize:");
        } else if (line.starts_with("VmHWM:")) {
            memory.peak_rss_bytes = parse_kb_field(line, "VmHWM:");
        }
    }

    if (!has_rss) {
        return Error{ErrorCode::Internal, "No VmRSS field in process status"};
    }
    return memory;
}

Result<ProcessMemory> read_process_memory(const std::filesystem::path& status_path) {
    std::ifstream ifs(status_path);
    if (!ifs.is_open()) {
        return Error{ErrorCode::Internal, "Cannot open " + status_path.string()};
    }
    std::ostringstream contents;
    contents << ifs.rdbuf();
    return parse_proc_status(contents.str());
}

double process_uptime_seconds() {
    static const auto origin = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - origin).count();
}

}  // namespace sandbox_orchestrator
