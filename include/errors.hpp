#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace volley {

// Base of every failure raised by the transport.
class RequestException : public std::runtime_error {
public:
    explicit RequestException(const std::string& what) : std::runtime_error(what) {}
};

// Raised by Response::raise_for_status() for 4xx and 5xx responses.
class HTTPError : public RequestException {
public:
    HTTPError(const std::string& what, int status_code)
        : RequestException(what), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

// DNS failure, refused connection, reset peer
class ConnectionError : public virtual RequestException {
public:
    explicit ConnectionError(const std::string& what)
        : RequestException(what) {}
};

class SSLError : public ConnectionError {
public:
    explicit SSLError(const std::string& what)
        : RequestException(what), ConnectionError(what) {}
};

class Timeout : public virtual RequestException {
public:
    explicit Timeout(const std::string& what)
        : RequestException(what) {}
};

// No connection could be established in time. Both a ConnectionError and a Timeout.
class ConnectTimeout : public ConnectionError, public Timeout {
public:
    explicit ConnectTimeout(const std::string& what)
        : RequestException(what), ConnectionError(what), Timeout(what) {}
};

// The server went silent for longer than the read timeout.
class ReadTimeout : public Timeout {
public:
    explicit ReadTimeout(const std::string& what)
        : RequestException(what), Timeout(what) {}
};

class InvalidURL : public RequestException {
public:
    explicit InvalidURL(const std::string& what) : RequestException(what) {}
};

class MissingSchema : public InvalidURL {
public:
    explicit MissingSchema(const std::string& what) : InvalidURL(what) {}
};

class InvalidSchema : public InvalidURL {
public:
    explicit InvalidSchema(const std::string& what) : InvalidURL(what) {}
};

class TooManyRedirects : public RequestException {
public:
    explicit TooManyRedirects(const std::string& what) : RequestException(what) {}
};

class ChunkedEncodingError : public RequestException {
public:
    explicit ChunkedEncodingError(const std::string& what) : RequestException(what) {}
};

class ContentDecodingError : public RequestException {
public:
    explicit ContentDecodingError(const std::string& what) : RequestException(what) {}
};

// A streamed body can be iterated only once.
class StreamConsumedError : public RequestException {
public:
    explicit StreamConsumedError(const std::string& what) : RequestException(what) {}
};

// Renders a captured failure as "<kind>: <message>" for logs and handlers.
std::string describe(const std::exception_ptr& error);

} // namespace volley
