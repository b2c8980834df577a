// background_applier.cpp

#include "background_applier.hpp"

#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

int ShellCommandRunner::run(const std::string& command, std::string& output) {
    return run_command(command, output);
}

std::string applescript_string(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += "\"";
    return out;
}

OsascriptApplier::OsascriptApplier(CommandRunner& runner, Logger& logger, bool desktop_fallback)
    : runner(runner), logger(logger), desktop_fallback(desktop_fallback) {}

std::string OsascriptApplier::lock_screen_script(const std::string& image_path) {
    return "tell application \"System Events\"\n"
           "\ttell every desktop\n"
           "\t\tset pictures folder to " + applescript_string(parent_dir(image_path)) + "\n"
           "\t\tset picture to " + applescript_string(image_path) + "\n"
           "\tend tell\n"
           "end tell";
}

std::string OsascriptApplier::desktop_script(const std::string& image_path) {
    return "tell application \"Finder\" to set desktop picture to POSIX file " +
           applescript_string(image_path);
}

void OsascriptApplier::apply(const std::string& image_path) {
    std::string output;
    int code = runner.run("osascript -e " + shell_quote(lock_screen_script(image_path)), output);
    if (code == 0) {
        return;
    }

    std::string primary = "failed to set lock screen: exit status " + std::to_string(code) +
                          " (output: " + trim(output) + ")";
    if (!desktop_fallback) {
        throw ApplyError(primary);
    }

    logger.warning(primary + "; falling back to desktop picture");
    code = runner.run("osascript -e " + shell_quote(desktop_script(image_path)), output);
    if (code != 0) {
        throw ApplyError(primary + "; fallback failed: exit status " + std::to_string(code) +
                         " (output: " + trim(output) + ")");
    }
    logger.warning("Desktop picture set, lock screen left unchanged");
}

GsettingsApplier::GsettingsApplier(CommandRunner& runner, Logger& logger)
    : runner(runner), logger(logger) {}

void GsettingsApplier::apply(const std::string& image_path) {
    std::string uri = shell_quote("file://" + image_path);
    std::string output;

    int code = runner.run("gsettings set org.gnome.desktop.background picture-uri " + uri, output);
    if (code != 0) {
        throw ApplyError("failed to set desktop background: exit status " + std::to_string(code) +
                         " (output: " + trim(output) + ")");
    }

    const char* optional_keys[] = {
        "org.gnome.desktop.background picture-uri-dark",
        "org.gnome.desktop.screensaver picture-uri",
    };
    for (const char* key : optional_keys) {
        code = runner.run(std::string("gsettings set ") + key + " " + uri, output);
        if (code != 0) {
            logger.warning(std::string("Could not set ") + key + ": " + trim(output));
        }
    }
}

std::unique_ptr<BackgroundApplier> make_background_applier(const std::string& name,
                                                           CommandRunner& runner,
                                                           Logger& logger) {
    if (name == "osascript") {
        return std::make_unique<OsascriptApplier>(runner, logger);
    }
    if (name == "gsettings") {
        return std::make_unique<GsettingsApplier>(runner, logger);
    }
    throw std::invalid_argument("unknown applier \"" + name + "\"");
}
