// cdp_client.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "logger.hpp"

typedef websocketpp::client<websocketpp::config::asio_client> ws_client;

// Synchronous DevTools protocol client. Messages are pumped on a background
// asio thread; call() blocks the caller until the matching response arrives,
// the connection drops, or the deadline passes.
class CdpClient {
public:
    CdpClient(const std::string& uri, std::chrono::steady_clock::time_point deadline, Logger& logger);
    ~CdpClient();

    CdpClient(const CdpClient&) = delete;
    CdpClient& operator=(const CdpClient&) = delete;

    // Returns the "result" object. Throws std::runtime_error on protocol
    // errors, SessionError on disconnect or crash, TimeoutError on deadline.
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& params = nlohmann::json::object(),
                        const std::string& session_id = "");

private:
    void on_open(websocketpp::connection_hdl hdl);
    void on_close(websocketpp::connection_hdl hdl);
    void on_fail(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, ws_client::message_ptr msg);
    void mark_closed(const std::string& reason);
    void shutdown();

    Logger& logger;
    std::chrono::steady_clock::time_point deadline;

    ws_client client;
    websocketpp::connection_hdl hdl;
    std::thread io_thread;

    std::mutex mutex;
    std::condition_variable cv;
    bool open;
    bool closed;
    std::string close_reason;
    long next_id;
    std::map<long, nlohmann::json> responses;
};
