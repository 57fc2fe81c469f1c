/**
 * @file WebSocketGateway.hpp
 * @brief libwebsockets transport for the session protocol.
 */

#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "application/SessionGateway.hpp"

struct lws;
struct lws_context;

namespace webforge::infrastructure {

/**
 * @class WebSocketGateway
 * @brief One WebSocket connection per session; text frames carry JSON.
 *
 * All socket work happens on the service thread. Run threads only mark a
 * session dirty and wake the loop with lws_cancel_service().
 */
class WebSocketGateway {
public:
    WebSocketGateway(application::SessionGateway& sessions, int port);
    ~WebSocketGateway();

    WebSocketGateway(const WebSocketGateway&) = delete;
    WebSocketGateway& operator=(const WebSocketGateway&) = delete;

    /** @brief Creates the context and starts the service thread. False if the port cannot be bound. */
    bool start();
    void stop();

    bool isRunning() const { return m_running; }
    int port() const { return m_port; }

private:
    friend struct LwsBridge;

    struct Connection {
        std::string sessionId;
        std::string partial;             ///< Reassembly of a fragmented message.
        std::deque<std::string> pending; ///< Encoded frames not yet written.
    };

    void onEstablished(lws* wsi);
    void onClosed(lws* wsi);
    void onReceive(lws* wsi, const char* data, size_t len, bool final);
    int onWritable(lws* wsi);
    void onWake();
    void markDirty(const std::string& sessionId);

    application::SessionGateway& m_sessions;
    int m_port;

    lws_context* m_context = nullptr;
    std::thread m_thread;
    std::atomic<bool> m_running{false};

    std::map<lws*, Connection> m_connections; // service thread only

    std::mutex m_dirtyMutex;
    std::set<std::string> m_dirty;
};

} // namespace webforge::infrastructure
