// capturer.cpp

#include "capturer.hpp"

#include <exception>
#include <map>
#include <sstream>

#include "errors.hpp"
#include "settings.hpp"
#include "utils.hpp"

namespace {

// Runs one capture step, folding any failure into a CaptureError that names it.
template <typename Step>
void run_step(const std::string& name, Step step) {
    try {
        step();
    } catch (const CaptureError&) {
        throw;
    } catch (const std::exception& e) {
        throw CaptureError(name + " failed: " + e.what());
    }
}

} // namespace

std::string watermark_script(const std::string& text) {
    std::stringstream js;
    js << "(function() {\n"
       << "  const text = " << js_string_literal(text) << ";\n"
       << "  const watermark = document.createElement('div');\n"
       << "  watermark.style.cssText = 'position: fixed; top: 50%; left: 50%; "
          "transform: translate(-50%, -50%) rotate(-45deg); font-size: 72px; "
          "font-family: Arial, sans-serif; color: rgba(0, 0, 0, 0.15); white-space: nowrap; "
          "pointer-events: none; user-select: none; z-index: 9999; letter-spacing: 2px;';\n"
       << "  watermark.innerText = text;\n"
       << "  document.body.appendChild(watermark);\n"
       << "  const pattern = document.createElement('div');\n"
       << "  pattern.style.cssText = 'position: fixed; top: 0; left: 0; width: 100%; height: 100%; "
          "display: flex; flex-wrap: wrap; justify-content: center; align-items: center; gap: 100px; "
          "transform: rotate(-45deg); pointer-events: none; z-index: 9998;';\n"
       << "  for (let i = 0; i < 9; i++) {\n"
       << "    const mark = document.createElement('div');\n"
       << "    mark.style.cssText = 'color: rgba(0, 0, 0, 0.075); font-size: 36px; "
          "font-family: Arial, sans-serif; white-space: nowrap; letter-spacing: 1px;';\n"
       << "    mark.innerText = text;\n"
       << "    pattern.appendChild(mark);\n"
       << "  }\n"
       << "  document.body.appendChild(pattern);\n"
       << "})();\n";
    return js.str();
}

Capturer::Capturer(const CaptureOptions& options, Logger& logger) : options(options), logger(logger) {}

void Capturer::wait_until_visible(BrowserSession& session, const std::string& selector) {
    for (;;) {
        if (session.expired()) {
            throw NavigationError("page never became ready: \"" + selector +
                                  "\" not visible before the session deadline");
        }
        bool visible = false;
        try {
            visible = session.engine().is_visible(selector);
        } catch (const TimeoutError& e) {
            // no answer before the deadline counts as never ready
            throw NavigationError("page never became ready: \"" + selector + "\" (" + e.what() + ")");
        }
        if (visible) {
            return;
        }

        std::chrono::milliseconds left = session.remaining();
        if (left <= options.poll_interval) {
            session.clock().sleep_for(left);
            throw NavigationError("page never became ready: \"" + selector +
                                  "\" not visible before the session deadline");
        }
        session.clock().sleep_for(options.poll_interval);
    }
}

std::vector<unsigned char> Capturer::capture(BrowserSession& session, const std::string& target_url) {
    std::vector<unsigned char> image;

    run_step("set headers", [&] {
        std::map<std::string, std::string> headers;
        headers["User-Agent"] = options.user_agent;
        session.engine().set_extra_headers(headers);
    });

    run_step("navigate", [&] { session.engine().navigate(target_url); });

    run_step("wait for readiness", [&] { wait_until_visible(session, options.ready_selector); });

    run_step("settle", [&] { session.sleep_for(options.settle); });

    if (options.watermark_enabled) {
        std::string text = options.watermark_text.empty() ? host_of(target_url) : options.watermark_text;
        run_step("inject watermark", [&] {
            session.engine().evaluate(watermark_script(text));
            session.sleep_for(options.overlay_delay);
        });
    }

    run_step("capture full page", [&] { image = session.engine().capture_full_page(options.quality); });

    if (image.empty()) {
        throw CaptureError("capture full page failed: engine returned an empty image");
    }

    logger.info("Captured " + std::to_string(image.size()) + " bytes from " + target_url);
    return image;
}
