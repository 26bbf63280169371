/**
 * @file log_sinks.hpp
 * @brief NDJSON log sinks: rotating file, stdout, and null.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace lan_beacon {

/**
 * @brief Appends NDJSON lines to `<log_dir>/<prefix>.ndjson`.
 *
 * When the active file exceeds the size limit it is renamed to
 * `<prefix>.1.ndjson`, older generations shift up by one, and anything
 * beyond `max_files` generations is deleted.
 */
class RotatingFileSink : public ILogSink {
public:
    RotatingFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~RotatingFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Override the rotation threshold in bytes (tests use tiny limits).
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path active_path() const;
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

private:
    void open_active();
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace lan_beacon
