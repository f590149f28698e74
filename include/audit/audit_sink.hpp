#pragma once

#include <string>
#include <string_view>

namespace wpsgate {

/**
 * @brief Abstract interface for audit output destinations
 *
 * Each sink receives one serialized JSON line per audit event. AuditTrail
 * calls sinks while holding its own lock, so implementations need no
 * internal locking for writes.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write a single JSON-serialized audit event. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/wpsgate/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace wpsgate
