#pragma once

#include "Connection.h"
#include "Message.h"
#include "core/ScreenGeometry.h"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace EdgeShare::Network {

enum class SessionRole {
    Host,
    Client
};

enum class SessionStatus {
    Disconnected,
    Listening,
    Connecting,
    Handshaking,
    Connected,
    Failed
};

std::string sessionStatusToString(SessionStatus status);
std::string sessionRoleToString(SessionRole role);

struct SessionOptions {
    std::string name = "edgeshare";
    std::chrono::milliseconds idleTimeout{10000};
    std::chrono::milliseconds pingInterval{5000};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds handshakeTimeout{5000};
};

// Read-only copy of the session for other threads.
struct SessionSnapshot {
    SessionRole role = SessionRole::Host;
    SessionStatus status = SessionStatus::Disconnected;
    std::string failureReason;
    std::string peerName;
    std::string peerAddress;
    Core::ScreenLayout peerScreenLayout;
};

// Owns the single peer connection: listen or connect, handshake, keepalive
// and teardown. Everything except the snapshot accessors runs on the
// io_context thread; public entry points post there themselves.
class SessionManager {
public:
    using ConnectedHandler = std::function<void(const std::string& peerName)>;
    using DisconnectedHandler = std::function<void(const std::string& reason)>;
    using ScreenInfoHandler = std::function<void(const Core::ScreenLayout& layout)>;
    using MessageHandler = std::function<void(const WireMessage& message)>;
    using StatusHandler = std::function<void(SessionStatus status, const std::string& text)>;

    SessionManager(asio::io_context& io_context, SessionOptions options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Binds synchronously so a bad port is reported to the caller at once.
    // Port 0 picks an ephemeral port, see listeningPort().
    bool startHost(uint16_t port = DEFAULT_PORT);
    void connect(const std::string& host, uint16_t port = DEFAULT_PORT);
    void stop();

    void send(const WireMessage& message);
    void setLocalScreenLayout(const Core::ScreenLayout& layout);
    // Stores the layout and pushes it to a connected peer.
    void sendScreenInfo(const Core::ScreenLayout& layout);

    void setConnectedHandler(ConnectedHandler handler) { connectedHandler_ = std::move(handler); }
    void setDisconnectedHandler(DisconnectedHandler handler) { disconnectedHandler_ = std::move(handler); }
    void setScreenInfoHandler(ScreenInfoHandler handler) { screenInfoHandler_ = std::move(handler); }
    void setMessageHandler(MessageHandler handler) { messageHandler_ = std::move(handler); }
    void setStatusHandler(StatusHandler handler) { statusHandler_ = std::move(handler); }

    SessionStatus getStatus() const { return status_.load(); }
    bool isConnected() const { return status_.load() == SessionStatus::Connected; }
    SessionSnapshot snapshot() const;
    uint16_t listeningPort() const { return listeningPort_.load(); }
    const SessionOptions& options() const { return options_; }

private:
    void setStatus(SessionStatus status, const std::string& text);

    void doAccept();
    void handleAccept(const std::error_code& ec, asio::ip::tcp::socket socket);

    void doResolve(const std::string& host, uint16_t port);
    void handleResolve(const std::error_code& ec, const asio::ip::tcp::resolver::results_type& endpoints);
    void handleTcpConnect(const std::error_code& ec, const asio::ip::tcp::endpoint& endpoint);

    void beginSession(asio::ip::tcp::socket socket);
    void handleMessage(std::shared_ptr<Connection> connection, const WireMessage& message);
    void handleHello(const Hello& hello);
    void handleConnectionClosed(std::shared_ptr<Connection> connection, const std::string& reason, bool error);
    void markConnected();
    void sendLocalScreenInfo();

    void armHandshakeTimer();
    void armConnectTimer();
    void armIdleTimer();
    void armKeepalive();
    void cancelTimers();

    // Single teardown path for every way a session ends.
    void teardown(const std::string& reason, bool failed);

    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::resolver resolver_;
    std::shared_ptr<asio::ip::tcp::socket> pendingSocket_;
    asio::steady_timer connectTimer_;
    asio::steady_timer handshakeTimer_;
    asio::steady_timer idleTimer_;
    asio::steady_timer keepaliveTimer_;

    SessionOptions options_;
    SessionRole role_ = SessionRole::Host;
    std::atomic<SessionStatus> status_{SessionStatus::Disconnected};
    std::atomic<uint16_t> listeningPort_{0};
    bool accepting_ = false;
    // Bumped on every teardown so handlers of an older attempt bail out.
    uint64_t attempt_ = 0;

    std::shared_ptr<Connection> connection_;
    uint32_t nextConnectionId_ = 1;
    std::chrono::steady_clock::time_point lastReceived_;
    std::string currentHost_;
    uint16_t currentPort_ = 0;

    Core::ScreenLayout localLayout_;

    mutable std::mutex snapshotMutex_;
    SessionSnapshot snapshot_;

    ConnectedHandler connectedHandler_;
    DisconnectedHandler disconnectedHandler_;
    ScreenInfoHandler screenInfoHandler_;
    MessageHandler messageHandler_;
    StatusHandler statusHandler_;
};

}
