#pragma once

#include "submission/bank_connection.hpp"
#include "submission/connector.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace wpsgate {

/**
 * @brief File transfer seam for the SFTP connector
 */
class ISftpTransport {
public:
    virtual ~ISftpTransport() = default;

    /// @throws TransmissionError on any transfer failure
    virtual void upload(const std::string& content, const std::string& remote_path) = 0;

    /// @return nullopt if the remote file does not exist
    /// @throws TransmissionError if the server cannot be reached
    [[nodiscard]] virtual std::optional<std::string> download(const std::string& remote_path) = 0;
};

/**
 * @brief Transport driving the OpenSSH sftp client in batch mode
 *
 * Key-based authentication only (identity file or agent); BatchMode
 * prevents interactive prompts.
 */
class OpenSshSftpTransport : public ISftpTransport {
public:
    OpenSshSftpTransport(BankConnection connection, std::chrono::milliseconds timeout);

    void upload(const std::string& content, const std::string& remote_path) override;
    [[nodiscard]] std::optional<std::string> download(const std::string& remote_path) override;

private:
    struct RunResult {
        int status = 0;
        std::string output;
    };

    RunResult run_batch(const std::string& commands) const;

    const BankConnection connection_;
    const std::chrono::milliseconds timeout_;
};

/**
 * @brief Bank SFTP drop-box connector
 *
 * Uploads the SIF file to {upload_path}/{file_name}; the bank reference is
 * the file name. Status comes from the acknowledgement file
 * {download_path}/{file_name}.ACK whose first token is ACCEPTED/PROCESSED
 * or REJECTED, followed by the bank's message. No ACK yet means pending.
 */
class SftpConnector : public IBankConnector {
public:
    SftpConnector(BankConnection connection, std::unique_ptr<ISftpTransport> transport);

    [[nodiscard]] TransmitResult transmit(const TransmitRequest& request) override;
    [[nodiscard]] StatusResult check_status(const std::string& bank_reference) override;
    [[nodiscard]] const char* name() const override { return "sftp"; }

private:
    [[nodiscard]] static std::string join_path(const std::string& dir, const std::string& file);

    const BankConnection connection_;
    std::unique_ptr<ISftpTransport> transport_;
};

} // namespace wpsgate
