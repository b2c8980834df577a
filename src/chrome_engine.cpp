// chrome_engine.cpp

#include "chrome_engine.hpp"

#include <cmath>
#include <opencv2/opencv.hpp> // Screenshot validation
#include <stdexcept>
#include <websocketpp/base64/base64.hpp>

#include "errors.hpp"
#include "utils.hpp"

ChromeEngine::ChromeEngine(const std::string& binary, const CaptureConfig& config,
                           std::chrono::milliseconds timeout, Logger& logger)
    : logger(logger) {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;

    process = std::make_unique<ChromeProcess>(binary, config, deadline, logger);
    client = std::make_unique<CdpClient>(process->browser_ws_url(), deadline, logger);

    nlohmann::json target = client->call("Target.createTarget", {{"url", "about:blank"}});
    std::string target_id = target.value("targetId", std::string());
    if (target_id.empty()) {
        throw SessionError("browser did not create a page");
    }

    nlohmann::json attached =
        client->call("Target.attachToTarget", {{"targetId", target_id}, {"flatten", true}});
    session_id = attached.value("sessionId", std::string());
    if (session_id.empty()) {
        throw SessionError("could not attach to the browser page");
    }

    page_call("Page.enable");
    page_call("Runtime.enable");
    page_call("Emulation.setDeviceMetricsOverride", {
        {"width", config.width},
        {"height", config.height},
        {"deviceScaleFactor", 1},
        {"mobile", false},
    });
}

nlohmann::json ChromeEngine::page_call(const std::string& method, const nlohmann::json& params) {
    return client->call(method, params, session_id);
}

nlohmann::json ChromeEngine::run_script(const std::string& expression) {
    nlohmann::json result = page_call("Runtime.evaluate", {
        {"expression", expression},
        {"returnByValue", true},
        {"awaitPromise", true},
    });

    if (result.contains("exceptionDetails")) {
        const nlohmann::json& details = result["exceptionDetails"];
        std::string description = details.value("text", std::string("script threw"));
        if (details.contains("exception")) {
            description = details["exception"].value("description", description);
        }
        throw std::runtime_error("script error: " + description);
    }
    if (result.contains("result")) {
        return result["result"].value("value", nlohmann::json());
    }
    return nlohmann::json();
}

void ChromeEngine::set_extra_headers(const std::map<std::string, std::string>& headers) {
    nlohmann::json header_map = nlohmann::json::object();
    for (const auto& header : headers) {
        header_map[header.first] = header.second;
    }
    page_call("Network.enable");
    page_call("Network.setExtraHTTPHeaders", {{"headers", header_map}});
}

void ChromeEngine::navigate(const std::string& url) {
    nlohmann::json result = page_call("Page.navigate", {{"url", url}});
    std::string error_text = result.value("errorText", std::string());
    if (!error_text.empty()) {
        throw NavigationError("navigation to " + url + " failed: " + error_text);
    }
    logger.info("Navigated to " + url);
}

bool ChromeEngine::is_visible(const std::string& selector) {
    std::string expression =
        "(function() {\n"
        "  const el = document.querySelector(" + js_string_literal(selector) + ");\n"
        "  if (!el) return false;\n"
        "  const style = window.getComputedStyle(el);\n"
        "  if (style.display === 'none' || style.visibility === 'hidden') return false;\n"
        "  const rect = el.getBoundingClientRect();\n"
        "  return rect.width > 0 && rect.height > 0;\n"
        "})()";
    nlohmann::json value = run_script(expression);
    return value.is_boolean() && value.get<bool>();
}

void ChromeEngine::evaluate(const std::string& script) {
    run_script(script);
}

std::vector<unsigned char> ChromeEngine::capture_full_page(int quality) {
    nlohmann::json metrics = page_call("Page.getLayoutMetrics");
    const char* size_key = metrics.contains("cssContentSize") ? "cssContentSize" : "contentSize";
    if (!metrics.contains(size_key)) {
        throw std::runtime_error("layout metrics did not report a content size");
    }
    double width = std::ceil(metrics[size_key].value("width", 0.0));
    double height = std::ceil(metrics[size_key].value("height", 0.0));
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("page has no content to capture");
    }

    nlohmann::json params = {
        {"captureBeyondViewport", true},
        {"fromSurface", true},
        {"clip", {{"x", 0}, {"y", 0}, {"width", width}, {"height", height}, {"scale", 1}}},
    };
    // PNG is lossless; only a reduced quality needs JPEG
    if (quality >= 100) {
        params["format"] = "png";
    } else {
        params["format"] = "jpeg";
        params["quality"] = quality;
    }

    nlohmann::json shot = page_call("Page.captureScreenshot", params);
    std::string data = shot.value("data", std::string());
    if (data.empty()) {
        throw std::runtime_error("browser returned no screenshot data");
    }

    int decoded_width = 0, decoded_height = 0;
    std::vector<unsigned char> image = decode_screenshot(data, decoded_width, decoded_height);
    logger.info("Screenshot " + std::to_string(decoded_width) + "x" + std::to_string(decoded_height) +
                " (" + std::to_string(image.size()) + " bytes)");
    return image;
}

std::vector<unsigned char> decode_screenshot(const std::string& base64_data, int& width, int& height) {
    std::string raw = websocketpp::base64_decode(base64_data);
    std::vector<unsigned char> bytes(raw.begin(), raw.end());
    if (bytes.empty()) {
        throw std::runtime_error("screenshot data is empty");
    }

    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw std::runtime_error("screenshot data is not a readable image");
    }
    width = image.cols;
    height = image.rows;
    return bytes;
}

ChromeEngineFactory::ChromeEngineFactory(const std::string& binary, Logger& logger)
    : binary(binary), logger(logger) {}

std::unique_ptr<RenderEngine> ChromeEngineFactory::launch(const CaptureConfig& config,
                                                          std::chrono::milliseconds timeout) {
    return std::make_unique<ChromeEngine>(binary, config, timeout, logger);
}
