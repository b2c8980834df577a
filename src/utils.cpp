// utils.cpp

#include "utils.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <ftw.h>
#include <iomanip>
#include <iostream>
#include <pwd.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

bool create_dir(const std::string& path, int mode) {
    if (path.empty()) {
        return false;
    }

    // Walk the path so every missing parent gets created too
    std::string::size_type pos = 0;
    do {
        pos = path.find('/', pos + 1);
        std::string partial = path.substr(0, pos);
        if (partial.empty()) {
            continue;
        }
        if (mkdir(partial.c_str(), static_cast<mode_t>(mode)) == -1 && errno != EEXIST) {
            std::cerr << "Error creating directory " << partial << ": " << strerror(errno) << std::endl;
            return false;
        }
    } while (pos != std::string::npos);

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        std::cerr << "Error creating directory " << path << ": not a directory" << std::endl;
        return false;
    }
    return true;
}

static int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
    return ::remove(path);
}

bool remove_tree(const std::string& path) {
    if (!file_exists(path)) {
        return true;
    }
    return nftw(path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS) == 0;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

// Formats seconds (double) into HH:MM:SS string format.
std::string format_duration(double seconds) {
    // Round to the nearest second
    long total_seconds = static_cast<long>(std::round(seconds));
    long h = total_seconds / 3600;
    long m = (total_seconds % 3600) / 60;
    long s = total_seconds % 60;

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(2) << h << ":"
       << std::setfill('0') << std::setw(2) << m << ":"
       << std::setfill('0') << std::setw(2) << s;
    return ss.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local;
    localtime_r(&t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return ss.str();
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return pw->pw_dir;
    }
    return "";
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir[dir.size() - 1] == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

std::string parent_dir(const std::string& path) {
    std::string::size_type slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

int run_command(const std::string& command, std::string& output) {
    output.clear();
    // Subshell so stderr of every part of a compound command is captured
    std::string full = "(" + command + ") 2>&1";

    FILE* pipe = popen(full.c_str(), "r");
    if (pipe == nullptr) {
        output = std::string("popen failed: ") + strerror(errno);
        return -1;
    }

    char buffer[512];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    // WEXITSTATUS requires <sys/wait.h>
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + WTERMSIG(status);
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string trim(const std::string& value) {
    std::string::size_type first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    std::string::size_type last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string js_string_literal(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\'':
            out += "\\'";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '<':
            // keeps "</script>" inert if the text ever lands in markup
            out += "\\x3c";
            break;
        default:
            out += c;
        }
    }
    out += "'";
    return out;
}
