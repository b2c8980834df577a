// chrome_process.cpp

#include "chrome_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

// DevTools writes "<port>\n<browser path>" here once it is listening
#define DEVTOOLS_PORT_FILE "DevToolsActivePort"

ChromeProcess::ChromeProcess(const std::string& binary, const CaptureConfig& config,
                             std::chrono::steady_clock::time_point deadline, Logger& logger)
    : logger(logger), pid(-1) {
    char dir_template[] = "/tmp/pagewall-chrome-XXXXXX";
    if (mkdtemp(dir_template) == nullptr) {
        throw SessionError(std::string("cannot create browser profile directory: ") + strerror(errno));
    }
    profile_dir = dir_template;

    std::vector<std::string> args = {
        binary,
        "--headless",
        "--disable-gpu",
        "--no-sandbox",
        "--disable-dev-shm-usage",
        "--no-first-run",
        "--no-default-browser-check",
        "--hide-scrollbars",
        "--mute-audio",
        "--remote-debugging-port=0",
        "--user-data-dir=" + profile_dir,
        "--window-size=" + std::to_string(config.width) + "," + std::to_string(config.height),
        "about:blank",
    };

    // Built before fork: the child must not allocate
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid = fork();
    if (pid == -1) {
        std::string reason = strerror(errno);
        remove_tree(profile_dir);
        throw SessionError("fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: keep the browser's chatter out of our log
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    try {
        wait_for_devtools(deadline);
    } catch (const std::exception&) {
        terminate();
        throw;
    }
}

ChromeProcess::~ChromeProcess() {
    terminate();
}

void ChromeProcess::wait_for_devtools(std::chrono::steady_clock::time_point deadline) {
    std::string port_file = join_path(profile_dir, DEVTOOLS_PORT_FILE);

    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            pid = -1;
            int code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
            if (code == 127) {
                throw SessionError("browser binary could not be executed");
            }
            throw SessionError("browser exited during startup with status " + std::to_string(code));
        }

        std::ifstream file(port_file);
        std::string port, path;
        if (file.is_open() && std::getline(file, port) && std::getline(file, path) &&
            !port.empty() && !path.empty()) {
            ws_url = "ws://127.0.0.1:" + trim(port) + trim(path);
            logger.info("Browser started (pid " + std::to_string(pid) + ")");
            return;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    throw TimeoutError("browser did not open its DevTools endpoint in time");
}

void ChromeProcess::terminate() {
    if (pid > 0) {
        kill(pid, SIGTERM);

        // Give it two seconds to exit cleanly before forcing it
        int status = 0;
        bool reaped = false;
        for (int i = 0; i < 20 && !reaped; ++i) {
            if (waitpid(pid, &status, WNOHANG) == pid) {
                reaped = true;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
        if (!reaped) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
        }
        pid = -1;
    }

    if (!profile_dir.empty()) {
        if (!remove_tree(profile_dir)) {
            logger.warning("Could not remove browser profile " + profile_dir);
        }
        profile_dir.clear();
    }
}
