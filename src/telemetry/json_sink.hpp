/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace sandbox_orchestrator {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The live file is `<prefix>.ndjson`; rotated files are
 * `<prefix>.1.ndjson` (newest) through `<prefix>.<max_files>.ndjson`.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] bool is_open() const noexcept { return current_file_.is_open(); }

    /// Byte-level size limit, for tests that cannot write megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout — useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output — useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory so tests can assert on emitted events.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] size_t count_containing(std::string_view needle) const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

}  // namespace sandbox_orchestrator
