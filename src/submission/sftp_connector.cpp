#include "submission/sftp_connector.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <sys/wait.h>

namespace wpsgate {

namespace {

std::string shell_quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (const char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

// sftp batch files use double quotes for paths with spaces
std::string batch_quote(const std::string& value) {
    std::string out = "\"";
    for (const char ch : value) {
        if (ch == '"' || ch == '\\') out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

/// Scratch file removed on scope exit
class TempFile {
public:
    TempFile() : path_(std::filesystem::temp_directory_path() /
                       std::format("wpsgate-{}", utils::generate_uuid())) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    void write(const std::string& content) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) throw TransmissionError(std::format("cannot write {}", path_.string()));
        out << content;
        if (!out) throw TransmissionError(std::format("short write to {}", path_.string()));
    }

    [[nodiscard]] std::string read() const {
        std::ifstream in(path_, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    std::filesystem::path path_;
};

bool is_missing_file(const std::string& output) {
    const auto lower = utils::to_lower(output);
    return lower.find("not found") != std::string::npos ||
           lower.find("no such file") != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// OpenSSH transport
// ============================================================================

OpenSshSftpTransport::OpenSshSftpTransport(BankConnection connection,
                                           std::chrono::milliseconds timeout)
    : connection_(std::move(connection)), timeout_(timeout) {}

OpenSshSftpTransport::RunResult OpenSshSftpTransport::run_batch(const std::string& commands) const {
    TempFile batch;
    batch.write(commands);

    const auto connect_timeout = std::max<long long>(1, timeout_.count() / 1000);
    std::string command = std::format("sftp -q -b {} -P {} -o BatchMode=yes -o ConnectTimeout={}",
        shell_quote(batch.path().string()), connection_.sftp_port, connect_timeout);
    if (!connection_.sftp_key_file.empty()) {
        command += " -i " + shell_quote(connection_.sftp_key_file);
    }
    command += " " + shell_quote(connection_.sftp_username + "@" + connection_.sftp_host) + " 2>&1";

    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        throw TransmissionError("failed to launch sftp client");
    }

    std::array<char, 4096> buffer{};
    RunResult result;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output.append(buffer.data());
    }
    const int status = pclose(pipe);
    result.status = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

void OpenSshSftpTransport::upload(const std::string& content, const std::string& remote_path) {
    TempFile local;
    local.write(content);

    const auto result = run_batch(std::format("put {} {}\n",
        batch_quote(local.path().string()), batch_quote(remote_path)));
    if (result.status != 0) {
        throw TransmissionError(std::format("sftp upload to {}:{} failed (exit {}): {}",
            connection_.sftp_host, remote_path, result.status, utils::trim(result.output)));
    }
}

std::optional<std::string> OpenSshSftpTransport::download(const std::string& remote_path) {
    TempFile local;
    const auto result = run_batch(std::format("get {} {}\n",
        batch_quote(remote_path), batch_quote(local.path().string())));
    if (result.status != 0) {
        if (is_missing_file(result.output)) return std::nullopt;
        throw TransmissionError(std::format("sftp download of {}:{} failed (exit {}): {}",
            connection_.sftp_host, remote_path, result.status, utils::trim(result.output)));
    }
    return local.read();
}

// ============================================================================
// Connector
// ============================================================================

SftpConnector::SftpConnector(BankConnection connection, std::unique_ptr<ISftpTransport> transport)
    : connection_(std::move(connection)), transport_(std::move(transport)) {}

std::string SftpConnector::join_path(const std::string& dir, const std::string& file) {
    if (dir.empty()) return file;
    return dir.ends_with('/') ? dir + file : dir + "/" + file;
}

TransmitResult SftpConnector::transmit(const TransmitRequest& request) {
    const auto remote = join_path(connection_.sftp_upload_path, request.file_name);
    transport_->upload(request.payload, remote);

    TransmitResult result;
    result.accepted = true;
    result.bank_reference = request.file_name;
    result.response_code = "OK";
    result.response_message = std::format("File uploaded to {}", remote);
    return result;
}

StatusResult SftpConnector::check_status(const std::string& bank_reference) {
    const auto ack = transport_->download(join_path(connection_.sftp_download_path,
                                                    bank_reference + ".ACK"));
    StatusResult status;
    if (!ack) {
        status.status = BankStatus::PENDING;
        status.message = "acknowledgement not yet available";
        return status;
    }

    const auto text = utils::trim(*ack);
    const auto space = text.find_first_of(" \t\r\n");
    const auto token = utils::to_lower(text.substr(0, space));
    status.response_code = text.substr(0, space);
    status.message = space == std::string::npos ? std::string{} : utils::trim(text.substr(space));

    if (token == "accepted" || token == "processed") {
        status.status = BankStatus::SUCCESS;
    } else if (token == "rejected") {
        status.status = BankStatus::FAILED;
    } else {
        status.status = BankStatus::PENDING;
    }
    return status;
}

} // namespace wpsgate
