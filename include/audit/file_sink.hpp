#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace wpsgate {

/**
 * @brief Append-only JSONL audit file with size-based rotation
 *
 * Rotated files are named with numeric suffixes: audit.jsonl.1,
 * audit.jsonl.2, etc. Files beyond max_files are deleted.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "wpsgate-audit.jsonl";
        size_t max_file_size_bytes = 50ULL * 1024 * 1024;  // 50MB
        int max_files = 10;
    };

    /// @throws ConfigError if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace wpsgate
