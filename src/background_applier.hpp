// background_applier.hpp

#pragma once

#include <memory>
#include <string>

#include "logger.hpp"

// Runs a shell command, returning its exit code and combined output.
class CommandRunner {
public:
    virtual ~CommandRunner() {}
    virtual int run(const std::string& command, std::string& output) = 0;
};

class ShellCommandRunner : public CommandRunner {
public:
    int run(const std::string& command, std::string& output) override;
};

// Sets an image file as the desktop / lock-screen picture. Throws ApplyError
// carrying the OS diagnostic output on failure.
class BackgroundApplier {
public:
    virtual ~BackgroundApplier() {}
    virtual void apply(const std::string& image_path) = 0;
};

// macOS: System Events sets every desktop's pictures folder to the image's
// directory and the picture to the image. If that fails the Finder desktop
// picture is tried before giving up.
class OsascriptApplier : public BackgroundApplier {
public:
    OsascriptApplier(CommandRunner& runner, Logger& logger, bool desktop_fallback = true);
    void apply(const std::string& image_path) override;

    static std::string lock_screen_script(const std::string& image_path);
    static std::string desktop_script(const std::string& image_path);

private:
    CommandRunner& runner;
    Logger& logger;
    bool desktop_fallback;
};

// GNOME: background picture-uri is required; the dark variant and the lock
// screen key are best effort because older releases lack them.
class GsettingsApplier : public BackgroundApplier {
public:
    GsettingsApplier(CommandRunner& runner, Logger& logger);
    void apply(const std::string& image_path) override;

private:
    CommandRunner& runner;
    Logger& logger;
};

// "osascript" or "gsettings"; throws std::invalid_argument otherwise.
std::unique_ptr<BackgroundApplier> make_background_applier(const std::string& name,
                                                           CommandRunner& runner,
                                                           Logger& logger);

// Escapes text for an AppleScript double-quoted string.
std::string applescript_string(const std::string& text);
