/**
 * @file json_sink.hpp
 * @brief Log sinks: rotating NDJSON file, stdout, and a discarding sink.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace uras {

/**
 * @brief Writes NDJSON to <dir>/<prefix>.ndjson, rotating by size.
 *
 * On rotation <prefix>.ndjson becomes <prefix>.1.ndjson, older files shift
 * up by one, and anything past max_files is removed.
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

    /// Override the size limit in bytes (tests rotate with tiny files).
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace uras
