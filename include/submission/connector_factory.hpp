#pragma once

#include "submission/bank_connection.hpp"
#include "submission/connector.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wpsgate {

using ConnectorCreator = std::function<std::unique_ptr<IBankConnector>(
    const BankConnection&, std::chrono::milliseconds timeout)>;

/**
 * @brief Creates the connector for a connection's protocol
 *
 * Built-in creators cover REST, SOAP, SFTP (OpenSSH transport) and manual;
 * any protocol's creator can be replaced (custom bank adapters, tests).
 */
class ConnectorFactory {
public:
    ConnectorFactory();

    void register_creator(Protocol protocol, ConnectorCreator creator);

    /// @throws ConfigError if no creator is registered for the protocol
    [[nodiscard]] std::unique_ptr<IBankConnector> create(const BankConnection& connection,
                                                         std::chrono::milliseconds timeout) const;

private:
    std::unordered_map<Protocol, ConnectorCreator> creators_;
    mutable std::mutex mutex_;
};

} // namespace wpsgate
