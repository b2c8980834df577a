// settings.cpp

#include "settings.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils.hpp"

namespace {

int parse_int(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value \"" + value + "\" for " + key);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("invalid value \"" + value + "\" for " + key);
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value.empty() || value == "1" || value == "true" || value == "yes") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no") {
        return false;
    }
    throw std::invalid_argument("invalid value \"" + value + "\" for " + key);
}

// Splits "-name=value" / "--name" into name and optional inline value.
bool split_flag(const std::string& arg, std::string& name, std::string& value, bool& has_value) {
    if (arg.size() < 2 || arg[0] != '-') {
        return false;
    }
    std::string body = arg.substr(arg[1] == '-' ? 2 : 1);
    std::string::size_type eq = body.find('=');
    has_value = eq != std::string::npos;
    name = has_value ? body.substr(0, eq) : body;
    value = has_value ? body.substr(eq + 1) : "";
    return !name.empty();
}

} // namespace

void CaptureConfig::validate() const {
    if (width <= 0) {
        throw std::invalid_argument("width must be positive, got " + std::to_string(width));
    }
    if (height <= 0) {
        throw std::invalid_argument("height must be positive, got " + std::to_string(height));
    }
    if (interval.count() <= 0) {
        throw std::invalid_argument("sleep interval must be positive");
    }
}

Settings::Settings() {
#ifdef __APPLE__
    chrome_path = "/Applications/Google Chrome.app/Contents/MacOS/Google Chrome";
    applier = "osascript";
#else
    chrome_path = "chromium";
    applier = "gsettings";
#endif
}

void Settings::validate() const {
    capture.validate();
    if (url.empty()) {
        throw std::invalid_argument("url must not be empty");
    }
    if (max_retries < 1) {
        throw std::invalid_argument("max_retries must be at least 1");
    }
    if (retry_delay.count() < 0) {
        throw std::invalid_argument("retry_delay_seconds must not be negative");
    }
    if (session_timeout.count() <= 0) {
        throw std::invalid_argument("session_timeout_seconds must be positive");
    }
    if (settle.count() < 0) {
        throw std::invalid_argument("settle_ms must not be negative");
    }
    if (applier != "osascript" && applier != "gsettings") {
        throw std::invalid_argument("unknown applier \"" + applier + "\" (expected osascript or gsettings)");
    }
}

bool apply_setting(Settings& settings, const std::string& key, const std::string& value) {
    if (key == "width") {
        settings.capture.width = parse_int(key, value);
    } else if (key == "height") {
        settings.capture.height = parse_int(key, value);
    } else if (key == "sleep") {
        settings.capture.interval = std::chrono::minutes(parse_int(key, value));
    } else if (key == "url") {
        settings.url = value;
    } else if (key == "user_agent") {
        settings.user_agent = value;
    } else if (key == "ready_selector") {
        settings.ready_selector = value;
    } else if (key == "watermark") {
        if (value == "off" || value == "none" || value == "false") {
            settings.watermark_enabled = false;
            settings.watermark_text.clear();
        } else {
            settings.watermark_enabled = true;
            settings.watermark_text = value;
        }
    } else if (key == "chrome") {
        settings.chrome_path = value;
    } else if (key == "applier") {
        settings.applier = value;
    } else if (key == "output_dir" || key == "out") {
        settings.output_dir = value;
    } else if (key == "log_file") {
        settings.log_file = value;
    } else if (key == "status_file") {
        settings.status_file = value;
    } else if (key == "max_retries") {
        settings.max_retries = parse_int(key, value);
    } else if (key == "retry_delay_seconds") {
        settings.retry_delay = std::chrono::seconds(parse_int(key, value));
    } else if (key == "session_timeout_seconds") {
        settings.session_timeout = std::chrono::seconds(parse_int(key, value));
    } else if (key == "settle_ms") {
        settings.settle = std::chrono::milliseconds(parse_int(key, value));
    } else if (key == "once") {
        settings.once = parse_bool(key, value);
    } else {
        return false;
    }
    return true;
}

bool load_config_file(const std::string& path, Settings& settings) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        size_t equals_pos = stripped.find('=');
        if (equals_pos == std::string::npos) {
            settings.warnings.push_back(path + ":" + std::to_string(line_number) +
                                        ": ignoring line without '='");
            continue;
        }

        // Strip leading/trailing whitespace from key and value
        std::string key = trim(stripped.substr(0, equals_pos));
        std::string value = trim(stripped.substr(equals_pos + 1));

        if (!apply_setting(settings, key, value)) {
            settings.warnings.push_back(path + ":" + std::to_string(line_number) +
                                        ": unknown key \"" + key + "\"");
        }
    }
    return true;
}

ParseResult parse_args(int argc, const char* const argv[], Settings& settings) {
    std::string name, value;
    bool has_value = false;

    // The config file goes first so explicit flags override it
    for (int i = 1; i < argc; ++i) {
        if (!split_flag(argv[i], name, value, has_value) || name != "config") {
            continue;
        }
        if (!has_value) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("flag needs an argument: -config");
            }
            value = argv[++i];
        }
        if (!load_config_file(value, settings)) {
            throw std::invalid_argument("cannot open config file: " + value);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!split_flag(arg, name, value, has_value)) {
            throw std::invalid_argument("unexpected argument: " + arg);
        }

        if (name == "h" || name == "help") {
            return ParseResult::Help;
        }
        if (name == "once") {
            settings.once = has_value ? parse_bool("-once", value) : true;
            continue;
        }
        if (name != "config" && name != "width" && name != "height" && name != "sleep" &&
            name != "url" && name != "out") {
            throw std::invalid_argument("flag provided but not defined: -" + name);
        }
        if (!has_value) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("flag needs an argument: -" + name);
            }
            value = argv[++i];
        }
        if (name == "config") {
            continue;
        }
        apply_setting(settings, name, value);
    }
    return ParseResult::Run;
}

std::string usage(const std::string& program) {
    std::stringstream ss;
    ss << "Usage of " << program << ":\n"
       << "  -width int     Width of the screenshot/window (default 3440)\n"
       << "  -height int    Height of the screenshot/window (default 1440)\n"
       << "  -sleep int     Sleep time in minutes between screenshots (default 10)\n"
       << "  -url string    Page to capture (default " << DEFAULT_TARGET_URL << ")\n"
       << "  -out string    Output directory (default $HOME/" << SCREENSHOTS_DIR_NAME << ")\n"
       << "  -config path   key = value settings file\n"
       << "  -once          Run a single cycle and exit\n";
    return ss.str();
}

std::string host_of(const std::string& url) {
    std::string rest = url;
    std::string::size_type scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
    }
    std::string::size_type end = rest.find_first_of("/?#");
    if (end != std::string::npos) {
        rest = rest.substr(0, end);
    }
    std::string::size_type at = rest.find('@');
    if (at != std::string::npos) {
        rest = rest.substr(at + 1);
    }
    std::string::size_type colon = rest.find(':');
    if (colon != std::string::npos) {
        rest = rest.substr(0, colon);
    }
    return rest;
}
