#include "network/Connection.h"
#include "utils/Logger.h"

namespace EdgeShare::Network {

Connection::Connection(asio::ip::tcp::socket socket, uint32_t id)
    : socket_(std::move(socket)),
      id_(id) {
    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remoteAddressString_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remoteAddressString_ = "unknown (error: " + ec.message() + ")";
    }
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    Utils::Logger::GetInstance().Debug("Connection " + std::to_string(id_) + " created for " + remoteAddressString_);
}

Connection::~Connection() {
    if (active_.exchange(false)) {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }
}

void Connection::start(MessageHandler msgHandler, DisconnectHandler discHandler) {
    messageHandler_ = std::move(msgHandler);
    disconnectHandler_ = std::move(discHandler);
    active_.store(true);
    doRead();
}

void Connection::send(const WireMessage& message) {
    if (!active_.load(std::memory_order_relaxed)) {
        Utils::Logger::GetInstance().Debug("Connection " + std::to_string(id_) + ": dropping " +
                                           messageTypeName(message) + " on inactive connection");
        return;
    }

    std::string line = encode(message);
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self, data = std::move(line)]() mutable {
        if (!self->active_.load(std::memory_order_relaxed)) return;

        bool should_start_write = false;
        {
            std::lock_guard<std::mutex> lock(self->writeMutex_);
            should_start_write = self->writeQueue_.empty() && !self->writing_.load(std::memory_order_relaxed);
            self->writeQueue_.push(std::move(data));
        }

        if (should_start_write) {
            self->doWrite();
        }
    });
}

void Connection::doWrite() {
    if (!active_.load(std::memory_order_relaxed)) {
        writing_ = false;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (writeQueue_.empty()) {
            writing_ = false;
            return;
        }
        writing_ = true;
    }

    // The front element stays queued until the write completes, so the buffer stays valid.
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(writeQueue_.front()),
        [this, self](const std::error_code& error, size_t bytes_transferred) {
            handleWrite(error, bytes_transferred);
        });
}

void Connection::handleWrite(const std::error_code& error, size_t /*bytes_transferred*/) {
    bool should_continue_writing = false;
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (!writeQueue_.empty()) {
            writeQueue_.pop();
        }
        if (!error && !writeQueue_.empty() && active_.load()) {
            should_continue_writing = true;
        } else {
            writing_ = false;
            if (error || !active_.load()) {
                std::queue<std::string> emptyQueue;
                std::swap(writeQueue_, emptyQueue);
            }
        }
    }

    if (error) {
        if (error != asio::error::operation_aborted) {
            Utils::Logger::GetInstance().Error("Connection " + std::to_string(id_) + " (" + remoteAddressString_ +
                                               ") write error: " + error.message());
        }
        doClose("write error: " + error.message(), true);
        return;
    }

    if (should_continue_writing) {
        doWrite();
    }
}

void Connection::doRead() {
    if (!active_.load()) return;

    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(readBuffer_),
        [this, self](const std::error_code& error, size_t bytes_transferred) {
            handleRead(error, bytes_transferred);
        });
}

void Connection::handleRead(const std::error_code& error, size_t bytes_transferred) {
    if (!active_.load()) return;

    if (error) {
        if (error == asio::error::eof) {
            Utils::Logger::GetInstance().Info("Connection " + std::to_string(id_) + " (" + remoteAddressString_ +
                                              ") closed by peer");
            doClose("peer closed the connection", true);
        } else if (error != asio::error::operation_aborted) {
            Utils::Logger::GetInstance().Error("Connection " + std::to_string(id_) + " (" + remoteAddressString_ +
                                               ") read error: " + error.message());
            doClose("read error: " + error.message(), true);
        }
        return;
    }

    decoder_.feed(readBuffer_.data(), bytes_transferred);
    for (const auto& message : decoder_.drain()) {
        if (!active_.load()) {
            return;
        }
        if (messageHandler_) {
            messageHandler_(shared_from_this(), message);
        }
    }

    doRead();
}

void Connection::close(const std::string& reason) {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self, reason]() {
        self->doClose(reason, false);
    });
}

void Connection::doClose(const std::string& reason, bool error) {
    if (!active_.exchange(false)) {
        return;
    }

    Utils::Logger::GetInstance().Info("Closing connection " + std::to_string(id_) + " (" + remoteAddressString_ +
                                      "). Reason: " + reason);

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    {
        // An in-flight write still references the front buffer; handleWrite drains it.
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (!writing_.load()) {
            std::queue<std::string> emptyQueue;
            std::swap(writeQueue_, emptyQueue);
        }
    }

    if (disconnectHandler_) {
        auto handler = std::move(disconnectHandler_);
        disconnectHandler_ = nullptr;
        handler(shared_from_this(), reason, error);
    }
    messageHandler_ = nullptr;
}

}
