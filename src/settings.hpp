// settings.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

// --- Defaults ---
#define DEFAULT_TARGET_URL "https://isbaileybutlerintheoffice.today"
#define DEFAULT_USER_AGENT "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36"
#define DEFAULT_STATUS_FILE "/tmp/pagewall_status.json"
#define SCREENSHOTS_DIR_NAME "Screenshots"
#define LOG_FILE_NAME "pagewall.log"

// Viewport and cadence. Fixed once the scheduler starts.
struct CaptureConfig {
    int width = 3440;
    int height = 1440;
    std::chrono::seconds interval = std::chrono::minutes(10);

    // Throws std::invalid_argument unless width, height and interval are positive.
    void validate() const;
};

struct Settings {
    CaptureConfig capture;

    std::string url = DEFAULT_TARGET_URL;
    std::string user_agent = DEFAULT_USER_AGENT;
    std::string ready_selector = "body";

    // Empty text means "use the target host"
    bool watermark_enabled = true;
    std::string watermark_text;

    std::string chrome_path;
    std::string applier;

    // Empty output_dir resolves to $HOME/Screenshots at startup
    std::string output_dir;
    std::string log_file;
    std::string status_file = DEFAULT_STATUS_FILE;

    int max_retries = 3;
    std::chrono::seconds retry_delay = std::chrono::seconds(30);
    std::chrono::seconds session_timeout = std::chrono::minutes(3);
    std::chrono::milliseconds settle = std::chrono::milliseconds(5000);
    std::chrono::milliseconds overlay_delay = std::chrono::milliseconds(500);

    bool once = false;

    // Unknown config keys, reported once the logger exists
    std::vector<std::string> warnings;

    Settings();

    // Throws std::invalid_argument on the first bad value.
    void validate() const;
};

// Reads "key = value" lines. Returns false if the file cannot be opened;
// throws std::invalid_argument on malformed values.
bool load_config_file(const std::string& path, Settings& settings);

// Applies one key from either the config file or the command line.
// Returns false for unknown keys.
bool apply_setting(Settings& settings, const std::string& key, const std::string& value);

enum class ParseResult { Run, Help };

// Go-style flags: -name value, -name=value, --name=value. A -config file is
// loaded first so explicit flags win over it. Throws std::invalid_argument.
ParseResult parse_args(int argc, const char* const argv[], Settings& settings);

std::string usage(const std::string& program);

// "https://example.com:8080/path" -> "example.com"
std::string host_of(const std::string& url);
