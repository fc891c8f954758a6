/**
 * @file process_monitor.hpp
 * @brief Memory usage of the daemon process, read from /proc/self/status.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace sandbox_orchestrator {

/**
 * @brief Process memory figures in bytes.
 */
struct ProcessMemory {
    uint64_t rss_bytes{0};       ///< VmRSS
    uint64_t virtual_bytes{0};   ///< VmSize
    uint64_t peak_rss_bytes{0};  ///< VmHWM
};

/**
 * @brief Parse the body of a /proc/<pid>/status file.
 *
 * Fields missing from @p status_text stay zero; a text without VmRSS is an
 * error (kernel threads and non-Linux procfs do not report it).
 */
[[nodiscard]] Result<ProcessMemory> parse_proc_status(std::string_view status_text);

/**
 * @brief Read and parse @p status_path (defaults to the calling process).
 */
[[nodiscard]] Result<ProcessMemory> read_process_memory(
    const std::filesystem::path& status_path = "/proc/self/status");

/**
 * @brief Seconds since this process first called process_uptime_seconds().
 *
 * The daemon calls it once at startup to pin the origin.
 */
[[nodiscard]] double process_uptime_seconds();

}  // namespace sandbox_orchestrator
