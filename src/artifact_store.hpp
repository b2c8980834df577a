// artifact_store.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

#define ARTIFACT_PREFIX "status_"
#define ARTIFACT_EXTENSION ".png"

// <dir>/status_<YYYYMMDD_HHMMSS>.png. If that name is already taken a numeric
// suffix is added, so earlier artifacts are never overwritten.
std::string artifact_path(const std::string& dir, std::chrono::system_clock::time_point when);

// Writes to a ".part" file and renames it into place. On any failure the
// temporary file is removed and PersistError is thrown.
void write_artifact(const std::string& path, const std::vector<unsigned char>& bytes);
