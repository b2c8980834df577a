// chrome_engine.hpp

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cdp_client.hpp"
#include "chrome_process.hpp"
#include "logger.hpp"
#include "render_engine.hpp"

// RenderEngine backed by a headless Chromium driven over the DevTools
// protocol. One browser process and one page per engine.
class ChromeEngine : public RenderEngine {
public:
    ChromeEngine(const std::string& binary, const CaptureConfig& config,
                 std::chrono::milliseconds timeout, Logger& logger);

    void set_extra_headers(const std::map<std::string, std::string>& headers) override;
    void navigate(const std::string& url) override;
    bool is_visible(const std::string& selector) override;
    void evaluate(const std::string& script) override;
    std::vector<unsigned char> capture_full_page(int quality) override;

private:
    nlohmann::json page_call(const std::string& method,
                             const nlohmann::json& params = nlohmann::json::object());
    nlohmann::json run_script(const std::string& expression);

    Logger& logger;

    // Declaration order matters: the connection closes before the process dies
    std::unique_ptr<ChromeProcess> process;
    std::unique_ptr<CdpClient> client;
    std::string session_id;
};

class ChromeEngineFactory : public RenderEngineFactory {
public:
    ChromeEngineFactory(const std::string& binary, Logger& logger);

    std::unique_ptr<RenderEngine> launch(const CaptureConfig& config,
                                         std::chrono::milliseconds timeout) override;

private:
    std::string binary;
    Logger& logger;
};

// Decodes a base64 screenshot payload and checks that it is a readable image.
// Throws std::runtime_error otherwise.
std::vector<unsigned char> decode_screenshot(const std::string& base64_data, int& width, int& height);
