#pragma once

#include "audit/audit_sink.hpp"

#include <string>
#include <vector>

namespace wpsgate {

/// Keeps audit lines in memory (CLI dry runs, tests)
class MemorySink : public IAuditSink {
public:
    [[nodiscard]] bool write(std::string_view json_line) override {
        lines_.emplace_back(json_line);
        return true;
    }
    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }

private:
    std::vector<std::string> lines_;
};

} // namespace wpsgate
