#include "infrastructure/WebSocketGateway.hpp"
#include "infrastructure/EventCodec.hpp"

#include <cstring>
#include <iostream>
#include <vector>
#include <libwebsockets.h>

namespace webforge::infrastructure {

namespace {
constexpr size_t kMaxMessageSize = 256 * 1024;
}

struct LwsBridge {
    static int Callback(lws* wsi, enum lws_callback_reasons reason, void* /*user*/, void* in, size_t len) {
        auto* self = static_cast<WebSocketGateway*>(lws_context_user(lws_get_context(wsi)));
        if (!self) return 0;

        switch (reason) {
        case LWS_CALLBACK_ESTABLISHED:
            self->onEstablished(wsi);
            break;
        case LWS_CALLBACK_CLOSED:
            self->onClosed(wsi);
            break;
        case LWS_CALLBACK_RECEIVE:
            self->onReceive(wsi, static_cast<const char*>(in), len,
                            lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0);
            break;
        case LWS_CALLBACK_SERVER_WRITEABLE:
            return self->onWritable(wsi);
        case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
            self->onWake();
            break;
        default:
            break;
        }
        return 0;
    }
};

namespace {
struct lws_protocols kProtocols[] = {
    {
        "webforge",
        LwsBridge::Callback,
        0,
        0,
        0, nullptr, 0
    },
    LWS_PROTOCOL_LIST_TERM
};
}

WebSocketGateway::WebSocketGateway(application::SessionGateway& sessions, int port)
    : m_sessions(sessions), m_port(port) {}

WebSocketGateway::~WebSocketGateway() {
    stop();
}

bool WebSocketGateway::start() {
    if (m_running) {
        std::cerr << "[Gateway] Already running" << std::endl;
        return false;
    }

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = m_port;
    info.protocols = kProtocols;
    info.gid = -1;
    info.uid = -1;
    info.user = this;
    info.options = LWS_SERVER_OPTION_VALIDATE_UTF8;

    m_context = lws_create_context(&info);
    if (!m_context) {
        std::cerr << "[Gateway] Failed to create libwebsockets context on port " << m_port << std::endl;
        return false;
    }

    m_sessions.SetWakeHandler([this](const std::string& sessionId) { markDirty(sessionId); });

    m_running = true;
    m_thread = std::thread([this]() {
        while (m_running) {
            lws_service(m_context, 50);
        }
    });
    std::cout << "[Gateway] Listening on ws://localhost:" << m_port << std::endl;
    return true;
}

void WebSocketGateway::stop() {
    if (!m_running) return;
    m_sessions.SetWakeHandler(nullptr);
    m_running = false;
    lws_cancel_service(m_context);
    if (m_thread.joinable()) m_thread.join();

    // Destroying the context fires CLOSED for every open connection.
    lws_context_destroy(m_context);
    m_context = nullptr;
    m_connections.clear();
    std::cout << "[Gateway] Stopped" << std::endl;
}

void WebSocketGateway::markDirty(const std::string& sessionId) {
    {
        std::lock_guard<std::mutex> lock(m_dirtyMutex);
        m_dirty.insert(sessionId);
    }
    if (m_running && m_context) lws_cancel_service(m_context);
}

void WebSocketGateway::onEstablished(lws* wsi) {
    Connection connection;
    connection.sessionId = m_sessions.OpenSession();
    std::cout << "[Gateway] Session " << connection.sessionId << " established" << std::endl;
    m_connections[wsi] = std::move(connection);
}

void WebSocketGateway::onClosed(lws* wsi) {
    auto it = m_connections.find(wsi);
    if (it == m_connections.end()) return;
    std::cout << "[Gateway] Session " << it->second.sessionId << " closed" << std::endl;
    m_sessions.CloseSession(it->second.sessionId);
    m_connections.erase(it);
}

void WebSocketGateway::onReceive(lws* wsi, const char* data, size_t len, bool final) {
    auto it = m_connections.find(wsi);
    if (it == m_connections.end()) return;
    Connection& connection = it->second;

    if (connection.partial.size() + len > kMaxMessageSize) {
        connection.partial.clear();
        m_sessions.RejectMalformed(connection.sessionId, "Command exceeds the maximum message size");
        return;
    }
    connection.partial.append(data, len);
    if (!final) return;

    const std::string text = std::move(connection.partial);
    connection.partial.clear();

    std::string error;
    auto command = EventCodec::DecodeCommand(text, error);
    if (!command) {
        m_sessions.RejectMalformed(connection.sessionId, error);
        return;
    }
    m_sessions.HandleCommand(connection.sessionId, *command);
}

int WebSocketGateway::onWritable(lws* wsi) {
    auto it = m_connections.find(wsi);
    if (it == m_connections.end()) return 0;
    Connection& connection = it->second;

    for (const auto& event : m_sessions.Drain(connection.sessionId)) {
        connection.pending.push_back(EventCodec::Encode(event));
    }
    if (connection.pending.empty()) return 0;

    const std::string message = std::move(connection.pending.front());
    connection.pending.pop_front();

    std::vector<unsigned char> buffer(LWS_PRE + message.size());
    std::memcpy(buffer.data() + LWS_PRE, message.data(), message.size());
    const int written = lws_write(wsi, buffer.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
    if (written < static_cast<int>(message.size())) {
        std::cerr << "[Gateway] Write failed for " << connection.sessionId << ", closing" << std::endl;
        return -1;
    }

    if (!connection.pending.empty()) lws_callback_on_writable(wsi);
    return 0;
}

void WebSocketGateway::onWake() {
    std::set<std::string> dirty;
    {
        std::lock_guard<std::mutex> lock(m_dirtyMutex);
        dirty.swap(m_dirty);
    }
    if (dirty.empty()) return;
    for (const auto& [wsi, connection] : m_connections) {
        if (dirty.count(connection.sessionId)) lws_callback_on_writable(wsi);
    }
}

} // namespace webforge::infrastructure
