// render_engine.hpp

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "settings.hpp"

// One headless page. Calls block until the engine answers and throw
// std::runtime_error (or a subclass from errors.hpp) on failure.
class RenderEngine {
public:
    virtual ~RenderEngine() {}

    virtual void set_extra_headers(const std::map<std::string, std::string>& headers) = 0;
    virtual void navigate(const std::string& url) = 0;
    virtual bool is_visible(const std::string& selector) = 0;
    virtual void evaluate(const std::string& script) = 0;
    virtual std::vector<unsigned char> capture_full_page(int quality) = 0;
};

// Starts engines. The timeout bounds every call the returned engine makes so a
// hung browser cannot outlive its session.
class RenderEngineFactory {
public:
    virtual ~RenderEngineFactory() {}

    virtual std::unique_ptr<RenderEngine> launch(const CaptureConfig& config,
                                                 std::chrono::milliseconds timeout) = 0;
};
