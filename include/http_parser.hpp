#pragma once

#include "compression.hpp"
#include "connection_pool.hpp"
#include "response.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace volley {

// Buffered reads over a Connection
class WireReader {
public:
    explicit WireReader(std::unique_ptr<Connection> conn);

    // One line without its CRLF, or nullopt if the peer closed first.
    // Throws ConnectionError for lines over 64 KiB.
    std::optional<std::string> read_line();

    // Buffered bytes first, then the socket. 0 when the peer closed.
    size_t read_some(uint8_t* dst, size_t max);

    size_t bytes_received() const { return total_received_; }
    bool has_buffered() const { return pos_ < buf_.size(); }

    Connection& connection() { return *conn_; }
    std::unique_ptr<Connection> release() { return std::move(conn_); }

private:
    bool fill();

    std::unique_ptr<Connection> conn_;
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
    size_t total_received_ = 0;
};

struct ResponseHead {
    int http_minor = 1;
    int status_code = 0;
    std::string reason;
    Headers headers;

    bool keep_alive() const;
};

// Status line and headers of the next final response. Interim 1xx responses
// are skipped. Throws ConnectionError when the peer closes or sends garbage.
ResponseHead read_response_head(WireReader& reader);

enum class BodyFraming {
    None,
    ContentLength,
    Chunked,
    UntilClose
};

// RFC 9112 section 6.3 body length rules
BodyFraming body_framing(const std::string& method, const ResponseHead& head,
                         size_t& content_length);

// Reads a framed body and undoes its Content-Encoding. Once the last byte
// is read the connection goes to `on_complete` for reuse; an abandoned
// reader closes it instead.
class WireBodyReader : public BodyReader {
public:
    using ReleaseFn = std::function<void(std::unique_ptr<Connection>)>;

    WireBodyReader(std::unique_ptr<WireReader> reader, BodyFraming framing,
                   size_t content_length, std::unique_ptr<Decoder> decoder,
                   bool keep_alive, ReleaseFn on_complete);

    size_t read(uint8_t* buf, size_t len) override;

private:
    size_t next_raw(uint8_t* buf, size_t len);
    size_t next_chunked(uint8_t* buf, size_t len);
    void hand_back();

    std::unique_ptr<WireReader> reader_;
    BodyFraming framing_;
    size_t remaining_;
    std::unique_ptr<Decoder> decoder_;
    bool keep_alive_;
    ReleaseFn on_complete_;

    size_t chunk_left_ = 0;
    bool need_crlf_ = false;
    bool chunks_done_ = false;

    std::vector<uint8_t> out_;
    size_t out_pos_ = 0;
    bool done_ = false;
};

} // namespace volley
