// cdp_client.cpp

#include "cdp_client.hpp"

#include <stdexcept>

#include "errors.hpp"

// Full-page screenshots of tall pages arrive as one large base64 frame
#define CDP_MAX_MESSAGE_SIZE (256 * 1024 * 1024)

CdpClient::CdpClient(const std::string& uri, std::chrono::steady_clock::time_point deadline,
                     Logger& logger)
    : logger(logger), deadline(deadline), open(false), closed(false), next_id(0) {
    // Failures surface through call(); websocketpp's own logging stays quiet
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);

    client.init_asio();
    client.set_max_message_size(CDP_MAX_MESSAGE_SIZE);

    client.set_open_handler(websocketpp::lib::bind(
        &CdpClient::on_open,
        this,
        websocketpp::lib::placeholders::_1
    ));
    client.set_close_handler(websocketpp::lib::bind(
        &CdpClient::on_close,
        this,
        websocketpp::lib::placeholders::_1
    ));
    client.set_fail_handler(websocketpp::lib::bind(
        &CdpClient::on_fail,
        this,
        websocketpp::lib::placeholders::_1
    ));
    client.set_message_handler(websocketpp::lib::bind(
        &CdpClient::on_message,
        this,
        websocketpp::lib::placeholders::_1,
        websocketpp::lib::placeholders::_2
    ));

    websocketpp::lib::error_code ec;
    ws_client::connection_ptr con = client.get_connection(uri, ec);
    if (ec) {
        throw SessionError("cannot connect to DevTools at " + uri + ": " + ec.message());
    }
    hdl = con->get_handle();
    client.connect(con);

    io_thread = std::thread([this]() {
        try {
            client.run();
        } catch (const std::exception& e) {
            mark_closed(std::string("websocket loop failed: ") + e.what());
        }
    });

    std::unique_lock<std::mutex> lock(mutex);
    bool settled = cv.wait_until(lock, deadline, [this] { return open || closed; });
    if (settled && open) {
        return;
    }
    std::string reason = close_reason;
    lock.unlock();
    shutdown();
    if (!settled) {
        throw TimeoutError("DevTools connection to " + uri + " timed out");
    }
    throw SessionError("DevTools connection to " + uri + " failed: " + reason);
}

CdpClient::~CdpClient() {
    shutdown();
}

void CdpClient::shutdown() {
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        was_open = open && !closed;
    }
    if (was_open) {
        websocketpp::lib::error_code ec;
        client.close(hdl, websocketpp::close::status::going_away, "session finished", ec);
        if (ec) {
            logger.warning("Error closing DevTools connection: " + ec.message());
        }
    }

    // Stop the client's internal ASIO loop
    client.stop();
    if (io_thread.joinable()) {
        io_thread.join();
    }
}

nlohmann::json CdpClient::call(const std::string& method, const nlohmann::json& params,
                               const std::string& session_id) {
    long id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw SessionError(method + ": DevTools connection closed: " + close_reason);
        }
        id = ++next_id;
    }

    nlohmann::json message;
    message["id"] = id;
    message["method"] = method;
    message["params"] = params;
    if (!session_id.empty()) {
        message["sessionId"] = session_id;
    }

    websocketpp::lib::error_code ec;
    client.send(hdl, message.dump(), websocketpp::frame::opcode::text, ec);
    if (ec) {
        throw SessionError(method + ": send failed: " + ec.message());
    }

    std::unique_lock<std::mutex> lock(mutex);
    bool settled = cv.wait_until(lock, deadline, [&] { return closed || responses.count(id) > 0; });

    auto it = responses.find(id);
    if (it == responses.end()) {
        if (!settled) {
            throw TimeoutError(method + ": no response before the session deadline");
        }
        throw SessionError(method + ": DevTools connection closed: " + close_reason);
    }
    nlohmann::json response = std::move(it->second);
    responses.erase(it);
    lock.unlock();

    if (response.contains("error")) {
        const nlohmann::json& error = response["error"];
        throw std::runtime_error(method + ": " + error.value("message", std::string("unknown error")));
    }
    if (response.contains("result")) {
        return response["result"];
    }
    return nlohmann::json::object();
}

void CdpClient::on_open(websocketpp::connection_hdl) {
    std::lock_guard<std::mutex> lock(mutex);
    open = true;
    cv.notify_all();
}

void CdpClient::on_close(websocketpp::connection_hdl h) {
    ws_client::connection_ptr con = client.get_con_from_hdl(h);
    mark_closed("closed by browser (" + con->get_remote_close_reason() + ")");
}

void CdpClient::on_fail(websocketpp::connection_hdl h) {
    ws_client::connection_ptr con = client.get_con_from_hdl(h);
    mark_closed(con->get_ec().message());
}

void CdpClient::on_message(websocketpp::connection_hdl, ws_client::message_ptr msg) {
    nlohmann::json message = nlohmann::json::parse(msg->get_payload(), nullptr, false);
    if (message.is_discarded()) {
        logger.warning("Ignoring malformed DevTools message");
        return;
    }

    if (message.contains("id")) {
        std::lock_guard<std::mutex> lock(mutex);
        responses[message["id"].get<long>()] = std::move(message);
        cv.notify_all();
        return;
    }

    std::string method = message.value("method", std::string());
    if (method == "Inspector.targetCrashed" || method == "Target.targetCrashed") {
        mark_closed("renderer crashed");
    } else if (method == "Target.detachedFromTarget") {
        mark_closed("page detached");
    }
}

void CdpClient::mark_closed(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!closed) {
        closed = true;
        close_reason = reason;
    }
    cv.notify_all();
}
