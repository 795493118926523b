#include "network/SessionManager.h"
#include "utils/Logger.h"

#include <type_traits>

namespace EdgeShare::Network {

std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Disconnected: return "Disconnected";
        case SessionStatus::Listening: return "Listening";
        case SessionStatus::Connecting: return "Connecting";
        case SessionStatus::Handshaking: return "Handshaking";
        case SessionStatus::Connected: return "Connected";
        case SessionStatus::Failed: return "Failed";
    }
    return "Unknown";
}

std::string sessionRoleToString(SessionRole role) {
    return role == SessionRole::Host ? "host" : "client";
}

SessionManager::SessionManager(asio::io_context& io_context, SessionOptions options)
    : io_context_(io_context),
      acceptor_(io_context),
      resolver_(io_context),
      connectTimer_(io_context),
      handshakeTimer_(io_context),
      idleTimer_(io_context),
      keepaliveTimer_(io_context),
      options_(std::move(options)) {
    Utils::Logger::GetInstance().Debug("SessionManager created for '" + options_.name + "'");
}

SessionManager::~SessionManager() {
    accepting_ = false;
    asio::error_code ec;
    acceptor_.close(ec);
    cancelTimers();
    if (connection_) {
        connection_.reset();
    }
}

void SessionManager::setStatus(SessionStatus status, const std::string& text) {
    SessionStatus previous = status_.exchange(status);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_.status = status;
        snapshot_.role = role_;
        if (status == SessionStatus::Failed) {
            snapshot_.failureReason = text;
        }
    }
    if (previous == status) {
        return;
    }
    if (status == SessionStatus::Failed) {
        Utils::Logger::GetInstance().Error("Session: " + text);
    } else {
        Utils::Logger::GetInstance().Info("Session: " + text);
    }
    if (statusHandler_) {
        statusHandler_(status, text);
    }
}

SessionSnapshot SessionManager::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

bool SessionManager::startHost(uint16_t port) {
    auto& logger = Utils::Logger::GetInstance();
    role_ = SessionRole::Host;

    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        setStatus(SessionStatus::Failed, "Failed to open acceptor: " + ec.message());
        return false;
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        setStatus(SessionStatus::Failed, "Failed to bind port " + std::to_string(port) + ": " + ec.message());
        acceptor_.close(ec);
        return false;
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        setStatus(SessionStatus::Failed, "Failed to listen: " + ec.message());
        acceptor_.close(ec);
        return false;
    }

    listeningPort_ = acceptor_.local_endpoint(ec).port();
    accepting_ = true;
    logger.Debug("SessionManager: acceptor bound to port " + std::to_string(listeningPort_.load()));
    setStatus(SessionStatus::Listening, "Listening on port " + std::to_string(listeningPort_.load()));

    asio::post(io_context_, [this]() { doAccept(); });
    return true;
}

void SessionManager::doAccept() {
    if (!accepting_) {
        return;
    }
    acceptor_.async_accept(
        [this](std::error_code ec, asio::ip::tcp::socket socket) {
            handleAccept(ec, std::move(socket));
        });
}

void SessionManager::handleAccept(const std::error_code& ec, asio::ip::tcp::socket socket) {
    if (!accepting_) {
        return;
    }
    if (ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        Utils::Logger::GetInstance().Error("SessionManager: accept failed: " + ec.message());
        doAccept();
        return;
    }

    if (connection_ || status_.load() == SessionStatus::Handshaking || status_.load() == SessionStatus::Connected) {
        Utils::Logger::GetInstance().Warning("SessionManager: new peer connecting, dropping the current one");
        teardown("replaced by a new connection", false);
    }
    beginSession(std::move(socket));
    doAccept();
}

void SessionManager::connect(const std::string& host, uint16_t port) {
    asio::dispatch(io_context_, [this, host, port]() {
        if (accepting_) {
            Utils::Logger::GetInstance().Warning("SessionManager: connect ignored, this side is hosting");
            return;
        }
        if (connection_ || status_.load() == SessionStatus::Connecting) {
            teardown("reconnecting", false);
        }
        role_ = SessionRole::Client;
        currentHost_ = host;
        currentPort_ = port;
        setStatus(SessionStatus::Connecting, "Connecting to " + host + ":" + std::to_string(port));
        armConnectTimer();
        doResolve(host, port);
    });
}

void SessionManager::doResolve(const std::string& host, uint16_t port) {
    uint64_t attempt = attempt_;
    resolver_.async_resolve(host, std::to_string(port),
        [this, attempt](const std::error_code& ec, const asio::ip::tcp::resolver::results_type& endpoints) {
            if (attempt != attempt_) {
                return;
            }
            handleResolve(ec, endpoints);
        });
}

void SessionManager::handleResolve(const std::error_code& ec, const asio::ip::tcp::resolver::results_type& endpoints) {
    if (ec) {
        teardown("could not resolve " + currentHost_ + ": " + ec.message(), true);
        return;
    }

    uint64_t attempt = attempt_;
    // The connect operation uses the socket until its handler runs, even after an abort,
    // so the handler owns a reference and teardown only closes it.
    auto socket = std::make_shared<asio::ip::tcp::socket>(io_context_);
    pendingSocket_ = socket;
    asio::async_connect(*socket, endpoints,
        [this, attempt, socket](const std::error_code& connectEc, const asio::ip::tcp::endpoint& endpoint) {
            if (attempt != attempt_) {
                return;
            }
            handleTcpConnect(connectEc, endpoint);
        });
}

void SessionManager::handleTcpConnect(const std::error_code& ec, const asio::ip::tcp::endpoint& endpoint) {
    if (status_.load() != SessionStatus::Connecting || !pendingSocket_) {
        return;
    }
    if (ec) {
        teardown("could not connect to " + currentHost_ + ":" + std::to_string(currentPort_) + ": " + ec.message(), true);
        return;
    }
    Utils::Logger::GetInstance().Debug("SessionManager: TCP connected to " + endpoint.address().to_string());
    connectTimer_.cancel();
    asio::ip::tcp::socket socket = std::move(*pendingSocket_);
    pendingSocket_.reset();
    beginSession(std::move(socket));
}

void SessionManager::beginSession(asio::ip::tcp::socket socket) {
    auto connection = std::make_shared<Connection>(std::move(socket), nextConnectionId_++);
    connection_ = connection;
    lastReceived_ = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_.peerAddress = connection->getRemoteAddress();
        snapshot_.peerName.clear();
        snapshot_.peerScreenLayout.clear();
        snapshot_.failureReason.clear();
    }
    setStatus(SessionStatus::Handshaking, "Handshaking with " + connection->getRemoteAddress());

    connection->start(
        [this](std::shared_ptr<Connection> c, const WireMessage& m) { handleMessage(std::move(c), m); },
        [this](std::shared_ptr<Connection> c, const std::string& reason, bool error) {
            handleConnectionClosed(std::move(c), reason, error);
        });

    armHandshakeTimer();
    armIdleTimer();

    if (role_ == SessionRole::Host) {
        connection->send(Hello{PROTOCOL_VERSION, options_.name});
    }
}

void SessionManager::handleMessage(std::shared_ptr<Connection> connection, const WireMessage& message) {
    if (connection != connection_) {
        return;
    }
    lastReceived_ = std::chrono::steady_clock::now();
    auto& logger = Utils::Logger::GetInstance();

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Ping>) {
            connection->send(Pong{});
        } else if constexpr (std::is_same_v<T, Pong>) {
            logger.Trace("Session: pong");
        } else if constexpr (std::is_same_v<T, Hello>) {
            handleHello(m);
        } else if constexpr (std::is_same_v<T, Connected>) {
            if (role_ == SessionRole::Client && status_.load() == SessionStatus::Handshaking) {
                markConnected();
            } else {
                logger.Warning("Session: unexpected 'connected' in state " + sessionStatusToString(status_.load()));
            }
        } else if constexpr (std::is_same_v<T, ScreenInfo>) {
            {
                std::lock_guard<std::mutex> lock(snapshotMutex_);
                snapshot_.peerScreenLayout = m.screens;
            }
            logger.Info("Session: peer reported " + std::to_string(m.screens.size()) + " screen(s), bounds " +
                        Core::boundsToString(Core::computeCombinedBounds(m.screens)));
            if (screenInfoHandler_) {
                screenInfoHandler_(m.screens);
            }
        } else if constexpr (std::is_same_v<T, ErrorMessage>) {
            logger.Error("Session: peer reported error: " + m.message);
            if (messageHandler_) {
                messageHandler_(message);
            }
        } else if constexpr (std::is_same_v<T, Unknown>) {
            logger.Debug("Session: discarding message of unknown type '" + m.type + "'");
        } else {
            if (status_.load() != SessionStatus::Connected) {
                logger.Warning("Session: '" + messageTypeName(message) + "' before handshake completed, ignoring");
                return;
            }
            if (messageHandler_) {
                messageHandler_(message);
            }
        }
    }, message);
}

void SessionManager::handleHello(const Hello& hello) {
    auto& logger = Utils::Logger::GetInstance();
    if (status_.load() != SessionStatus::Handshaking) {
        logger.Warning("Session: duplicate hello ignored");
        return;
    }
    if (hello.version != PROTOCOL_VERSION) {
        logger.Warning("Session: peer speaks protocol " + hello.version + ", this side " + PROTOCOL_VERSION);
    }
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_.peerName = hello.name.empty() ? snapshot_.peerAddress : hello.name;
    }

    if (role_ == SessionRole::Host) {
        connection_->send(Connected{});
        markConnected();
        sendLocalScreenInfo();
    } else {
        connection_->send(Hello{PROTOCOL_VERSION, options_.name});
        sendLocalScreenInfo();
    }
}

void SessionManager::markConnected() {
    handshakeTimer_.cancel();
    std::string peerName;
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        peerName = snapshot_.peerName;
    }
    setStatus(SessionStatus::Connected, "Connected to " + peerName);
    armKeepalive();
    if (connectedHandler_) {
        connectedHandler_(peerName);
    }
}

void SessionManager::sendLocalScreenInfo() {
    if (!connection_) {
        return;
    }
    if (localLayout_.empty()) {
        Utils::Logger::GetInstance().Warning("Session: no local screen layout known, not sending screen_info");
        return;
    }
    connection_->send(ScreenInfo{localLayout_});
}

void SessionManager::handleConnectionClosed(std::shared_ptr<Connection> connection, const std::string& reason, bool error) {
    if (connection != connection_) {
        return;
    }
    teardown(reason, error);
}

void SessionManager::send(const WireMessage& message) {
    asio::dispatch(io_context_, [this, message]() {
        if (!connection_ || status_.load() != SessionStatus::Connected) {
            Utils::Logger::GetInstance().Debug("Session: not connected, dropping " + messageTypeName(message));
            return;
        }
        connection_->send(message);
    });
}

void SessionManager::setLocalScreenLayout(const Core::ScreenLayout& layout) {
    asio::dispatch(io_context_, [this, layout]() {
        localLayout_ = layout;
    });
}

void SessionManager::sendScreenInfo(const Core::ScreenLayout& layout) {
    asio::dispatch(io_context_, [this, layout]() {
        localLayout_ = layout;
        if (connection_ && status_.load() == SessionStatus::Connected) {
            connection_->send(ScreenInfo{localLayout_});
        }
    });
}

void SessionManager::stop() {
    asio::dispatch(io_context_, [this]() {
        accepting_ = false;
        asio::error_code ec;
        acceptor_.close(ec);
        listeningPort_ = 0;
        teardown("session stopped", false);
        setStatus(SessionStatus::Disconnected, "Disconnected");
    });
}

void SessionManager::armConnectTimer() {
    uint64_t attempt = attempt_;
    connectTimer_.expires_after(options_.connectTimeout);
    connectTimer_.async_wait([this, attempt](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || attempt != attempt_) {
            return;
        }
        if (status_.load() == SessionStatus::Connecting) {
            teardown("connect timeout after " + std::to_string(options_.connectTimeout.count()) + "ms", true);
        }
    });
}

void SessionManager::armHandshakeTimer() {
    uint64_t attempt = attempt_;
    handshakeTimer_.expires_after(options_.handshakeTimeout);
    handshakeTimer_.async_wait([this, attempt](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || attempt != attempt_) {
            return;
        }
        if (status_.load() == SessionStatus::Handshaking) {
            teardown("handshake timeout", true);
        }
    });
}

void SessionManager::armIdleTimer() {
    uint64_t attempt = attempt_;
    idleTimer_.expires_at(lastReceived_ + options_.idleTimeout);
    idleTimer_.async_wait([this, attempt](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || attempt != attempt_ || !connection_) {
            return;
        }
        if (std::chrono::steady_clock::now() - lastReceived_ >= options_.idleTimeout) {
            Utils::Logger::GetInstance().Warning("Session: no traffic from peer for " +
                                                 std::to_string(options_.idleTimeout.count()) + "ms");
            teardown("idle timeout", true);
            return;
        }
        armIdleTimer();
    });
}

void SessionManager::armKeepalive() {
    uint64_t attempt = attempt_;
    keepaliveTimer_.expires_after(options_.pingInterval);
    keepaliveTimer_.async_wait([this, attempt](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || attempt != attempt_) {
            return;
        }
        if (connection_ && status_.load() == SessionStatus::Connected) {
            connection_->send(Ping{});
            armKeepalive();
        }
    });
}

void SessionManager::cancelTimers() {
    connectTimer_.cancel();
    handshakeTimer_.cancel();
    idleTimer_.cancel();
    keepaliveTimer_.cancel();
}

void SessionManager::teardown(const std::string& reason, bool failed) {
    attempt_++;
    cancelTimers();

    SessionStatus previous = status_.load();
    bool hadSession = connection_ != nullptr || previous == SessionStatus::Connecting ||
                      previous == SessionStatus::Handshaking || previous == SessionStatus::Connected;

    std::shared_ptr<Connection> connection = std::move(connection_);
    connection_.reset();
    if (connection) {
        connection->close(reason);
    }
    if (pendingSocket_) {
        asio::error_code ec;
        pendingSocket_->close(ec);
        pendingSocket_.reset();
    }
    resolver_.cancel();

    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_.peerName.clear();
        snapshot_.peerAddress.clear();
        snapshot_.peerScreenLayout.clear();
    }

    if (!hadSession) {
        return;
    }

    if (failed) {
        setStatus(SessionStatus::Failed, reason);
    }
    if (disconnectedHandler_) {
        disconnectedHandler_(reason);
    }
    setStatus(SessionStatus::Disconnected, "Disconnected (" + reason + ")");
    if (role_ == SessionRole::Host && accepting_) {
        setStatus(SessionStatus::Listening, "Listening on port " + std::to_string(listeningPort_.load()));
    }
}

}
