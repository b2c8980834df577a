// errors.hpp

#pragma once

#include <stdexcept>
#include <string>

// --- Attempt-local failures ---
// Every one of these is caught at the retry boundary and logged; none of them
// stops the scheduler.

// Rendering engine failed to launch, crashed, or the session ran out of time.
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& what) : std::runtime_error(what) {}
};

class TimeoutError : public SessionError {
public:
    explicit TimeoutError(const std::string& what) : SessionError(what) {}
};

// Any step of a capture failed. The message names the step and the cause.
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

// The page never became ready before the session deadline.
class NavigationError : public CaptureError {
public:
    explicit NavigationError(const std::string& what) : CaptureError(what) {}
};

class PersistError : public std::runtime_error {
public:
    explicit PersistError(const std::string& what) : std::runtime_error(what) {}
};

// OS background call failed; the message carries the raw diagnostic output.
class ApplyError : public std::runtime_error {
public:
    explicit ApplyError(const std::string& what) : std::runtime_error(what) {}
};
