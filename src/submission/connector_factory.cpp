#include "submission/connector_factory.hpp"
#include "submission/manual_connector.hpp"
#include "submission/rest_connector.hpp"
#include "submission/sftp_connector.hpp"
#include "submission/soap_connector.hpp"
#include "core/error.hpp"

#include <format>

namespace wpsgate {

ConnectorFactory::ConnectorFactory() {
    creators_[Protocol::REST] = [](const BankConnection& c, std::chrono::milliseconds t) {
        return std::make_unique<RestConnector>(c, t);
    };
    creators_[Protocol::SOAP] = [](const BankConnection& c, std::chrono::milliseconds t) {
        return std::make_unique<SoapConnector>(c, t);
    };
    creators_[Protocol::SFTP] = [](const BankConnection& c, std::chrono::milliseconds t) {
        return std::make_unique<SftpConnector>(c, std::make_unique<OpenSshSftpTransport>(c, t));
    };
    creators_[Protocol::MANUAL] = [](const BankConnection& c, std::chrono::milliseconds) {
        return std::make_unique<ManualConnector>(c);
    };
}

void ConnectorFactory::register_creator(Protocol protocol, ConnectorCreator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    creators_[protocol] = std::move(creator);
}

std::unique_ptr<IBankConnector> ConnectorFactory::create(const BankConnection& connection,
                                                         std::chrono::milliseconds timeout) const {
    ConnectorCreator creator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = creators_.find(connection.protocol);
        if (it == creators_.end()) {
            throw ConfigError(std::format("no connector for protocol {}",
                                          protocol_to_string(connection.protocol)));
        }
        creator = it->second;
    }
    return creator(connection, timeout);
}

} // namespace wpsgate
