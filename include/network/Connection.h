#pragma once

#include "Message.h"

#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace EdgeShare::Network {

// One TCP stream carrying newline-delimited JSON messages.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(std::shared_ptr<Connection>, const WireMessage&)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>, const std::string& reason, bool error)>;

    Connection(asio::ip::tcp::socket socket, uint32_t id);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start(MessageHandler msgHandler, DisconnectHandler discHandler);
    void send(const WireMessage& msg);
    void close(const std::string& reason = "closed locally");

    uint32_t getId() const { return id_; }
    std::string getRemoteAddress() const { return remoteAddressString_; }
    bool isActive() const { return active_.load(); }

private:
    void doRead();
    void handleRead(const std::error_code& error, size_t bytes_transferred);

    void doWrite();
    void handleWrite(const std::error_code& error, size_t bytes_transferred);

    void doClose(const std::string& reason, bool error);

    asio::ip::tcp::socket socket_;
    uint32_t id_;
    std::string remoteAddressString_;

    std::array<char, 4096> readBuffer_;
    MessageDecoder decoder_;

    std::queue<std::string> writeQueue_;
    std::mutex writeMutex_;
    std::atomic<bool> writing_{false};
    std::atomic<bool> active_{false};

    MessageHandler messageHandler_;
    DisconnectHandler disconnectHandler_;
};

}
