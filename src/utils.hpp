#pragma once

#include <chrono>
#include <string>

// Creates a directory and any missing parents. Returns true if successful or
// if it already exists.
bool create_dir(const std::string& path, int mode = 0755);

// Removes a directory tree. Missing paths count as success.
bool remove_tree(const std::string& path);

bool file_exists(const std::string& path);

// Changes seconds into HH:MM:SS format
std::string format_duration(double seconds);

// Local time as YYYYMMDD_HHMMSS
std::string format_timestamp(std::chrono::system_clock::time_point when);

// $HOME, falling back to the password database. Empty if neither is known.
std::string home_directory();

std::string join_path(const std::string& dir, const std::string& name);
std::string parent_dir(const std::string& path);

// Runs a shell command and captures stdout and stderr together.
// Returns the exit code, or -1 if the shell could not be started.
int run_command(const std::string& command, std::string& output);

// Wraps a value in single quotes for /bin/sh.
std::string shell_quote(const std::string& value);

std::string trim(const std::string& value);

// Single-quoted JavaScript string literal with quotes and newlines escaped.
std::string js_string_literal(const std::string& text);
