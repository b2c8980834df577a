// artifact_store.cpp

#include "artifact_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "errors.hpp"
#include "utils.hpp"

std::string artifact_path(const std::string& dir, std::chrono::system_clock::time_point when) {
    std::string stem = join_path(dir, ARTIFACT_PREFIX + format_timestamp(when));
    std::string path = stem + ARTIFACT_EXTENSION;
    for (int n = 1; file_exists(path); ++n) {
        path = stem + "_" + std::to_string(n) + ARTIFACT_EXTENSION;
    }
    return path;
}

void write_artifact(const std::string& path, const std::vector<unsigned char>& bytes) {
    std::string temp_path = path + ".part";

    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PersistError("failed to save screenshot: cannot open " + temp_path + ": " + strerror(errno));
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        std::remove(temp_path.c_str());
        throw PersistError("failed to save screenshot: write to " + temp_path + " failed");
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::string reason = strerror(errno);
        std::remove(temp_path.c_str());
        throw PersistError("failed to save screenshot: cannot rename to " + path + ": " + reason);
    }
}
