#pragma once
#include <stdexcept>
#include <string>

namespace chordrelay {

// Malformed or missing client input. Raised before any store mutation.
class BadRequest : public std::runtime_error {
public:
    explicit BadRequest(const std::string& what) : std::runtime_error(what) {}
};

// A named resource (agent profile) does not exist.
class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& what) : std::runtime_error(what) {}
};

// Another turn for the same session is still in flight.
class SessionBusy : public std::runtime_error {
public:
    explicit SessionBusy(const std::string& session_id)
        : std::runtime_error("Session busy: " + session_id) {}
};

// The backend connection could not be established.
class UpstreamUnavailable : public std::runtime_error {
public:
    explicit UpstreamUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// The backend answered with a non-success status.
class UpstreamRejected : public std::runtime_error {
public:
    UpstreamRejected(long status_code, std::string body, const std::string& what)
        : std::runtime_error(what), status_code_(status_code), body_(std::move(body)) {}

    long status_code() const { return status_code_; }
    const std::string& body() const { return body_; }

private:
    long status_code_;
    std::string body_;
};

// Mid-stream error record or abrupt end of the backend stream.
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace chordrelay
