#include "http_parser.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace volley {

namespace {

constexpr size_t kMaxLine = 65536;
constexpr size_t kMaxHeaders = 256;
constexpr size_t kReadSize = 16384;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool has_token(const std::optional<std::string>& value, const std::string& token) {
    return value && lower(*value).find(token) != std::string::npos;
}

// "HTTP/1.1 200 OK"
void parse_status_line(const std::string& line, ResponseHead& head) {
    if (line.size() < 12 || line.compare(0, 7, "HTTP/1.") != 0 ||
        !std::isdigit(static_cast<unsigned char>(line[7])) || line[8] != ' ') {
        throw ConnectionError("Bad status line: '" + line.substr(0, 64) + "'");
    }
    head.http_minor = line[7] - '0';

    int code = 0;
    for (size_t i = 9; i < 12; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            throw ConnectionError("Bad status code in: '" + line.substr(0, 64) + "'");
        }
        code = code * 10 + (line[i] - '0');
    }
    head.status_code = code;
    head.reason = line.size() > 13 ? line.substr(13) : "";
}

} // namespace

WireReader::WireReader(std::unique_ptr<Connection> conn)
    : conn_(std::move(conn)) {
}

bool WireReader::fill() {
    if (pos_ > 0 && pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    }
    uint8_t tmp[kReadSize];
    size_t n = conn_->recv_some(tmp, sizeof(tmp));
    if (n == 0) {
        return false;
    }
    total_received_ += n;
    buf_.insert(buf_.end(), tmp, tmp + n);
    return true;
}

std::optional<std::string> WireReader::read_line() {
    size_t scanned = pos_;
    while (true) {
        auto begin = buf_.begin() + static_cast<std::ptrdiff_t>(scanned);
        auto nl = std::find(begin, buf_.end(), static_cast<uint8_t>('\n'));
        if (nl != buf_.end()) {
            size_t end = static_cast<size_t>(nl - buf_.begin());
            std::string line(buf_.begin() + static_cast<std::ptrdiff_t>(pos_), nl);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            pos_ = end + 1;
            return line;
        }
        scanned = buf_.size();
        if (buf_.size() - pos_ > kMaxLine) {
            throw ConnectionError("Header line too long");
        }
        size_t consumed = pos_;
        if (!fill()) {
            return std::nullopt;
        }
        // fill() may have compacted the buffer
        if (consumed != pos_) {
            scanned = pos_;
        }
    }
}

size_t WireReader::read_some(uint8_t* dst, size_t max) {
    if (!has_buffered() && !fill()) {
        return 0;
    }
    size_t n = std::min(max, buf_.size() - pos_);
    std::memcpy(dst, buf_.data() + pos_, n);
    pos_ += n;
    return n;
}

bool ResponseHead::keep_alive() const {
    auto connection = headers.get("Connection");
    if (http_minor >= 1) {
        return !has_token(connection, "close");
    }
    return has_token(connection, "keep-alive");
}

ResponseHead read_response_head(WireReader& reader) {
    while (true) {
        auto status_line = reader.read_line();
        if (!status_line) {
            throw ConnectionError("Connection closed before a response was received");
        }
        if (status_line->empty()) {
            continue; // stray CRLF after a previous body
        }

        ResponseHead head;
        parse_status_line(*status_line, head);

        std::string last_name;
        size_t count = 0;
        while (true) {
            auto line = reader.read_line();
            if (!line) {
                throw ConnectionError("Connection closed while reading headers");
            }
            if (line->empty()) {
                break;
            }
            if (++count > kMaxHeaders) {
                throw ConnectionError("Too many response headers");
            }

            // obs-fold continuation
            if ((line->front() == ' ' || line->front() == '\t') && !last_name.empty()) {
                auto prev = head.headers.get(last_name);
                head.headers.set(last_name, prev.value_or("") + " " + trim(*line));
                continue;
            }

            size_t colon = line->find(':');
            if (colon == std::string::npos || colon == 0) {
                throw ConnectionError("Malformed header line: '" + line->substr(0, 64) + "'");
            }
            last_name = line->substr(0, colon);
            head.headers.add(last_name, trim(line->substr(colon + 1)));
        }

        // 101 is final, it hands the connection over
        if (head.status_code >= 100 && head.status_code < 200 && head.status_code != 101) {
            continue;
        }
        return head;
    }
}

BodyFraming body_framing(const std::string& method, const ResponseHead& head,
                         size_t& content_length) {
    content_length = 0;

    if (method == "HEAD" || head.status_code < 200 ||
        head.status_code == 204 || head.status_code == 304) {
        return BodyFraming::None;
    }

    if (has_token(head.headers.get("Transfer-Encoding"), "chunked")) {
        return BodyFraming::Chunked;
    }

    auto length = head.headers.get("Content-Length");
    if (length) {
        std::string value = trim(*length);
        // Identical repeated values were folded with ", "
        size_t comma = value.find(',');
        if (comma != std::string::npos) {
            value = trim(value.substr(0, comma));
        }
        if (value.empty() || value.size() > 18 ||
            !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw ConnectionError("Invalid Content-Length: '" + *length + "'");
        }
        content_length = std::stoull(value);
        return content_length == 0 ? BodyFraming::None : BodyFraming::ContentLength;
    }

    return BodyFraming::UntilClose;
}

WireBodyReader::WireBodyReader(std::unique_ptr<WireReader> reader, BodyFraming framing,
                               size_t content_length, std::unique_ptr<Decoder> decoder,
                               bool keep_alive, ReleaseFn on_complete)
    : reader_(std::move(reader)),
      framing_(framing),
      remaining_(content_length),
      decoder_(std::move(decoder)),
      keep_alive_(keep_alive),
      on_complete_(std::move(on_complete)) {
}

size_t WireBodyReader::read(uint8_t* buf, size_t len) {
    while (out_pos_ >= out_.size()) {
        if (done_) {
            return 0;
        }
        out_.clear();
        out_pos_ = 0;

        uint8_t raw[kReadSize];
        size_t n = next_raw(raw, sizeof(raw));
        if (n == 0) {
            if (decoder_) {
                decoder_->finish(out_);
            }
            done_ = true;
            hand_back();
            continue;
        }

        if (decoder_) {
            decoder_->feed(raw, n, out_);
        } else {
            out_.assign(raw, raw + n);
        }
    }

    size_t take = std::min(len, out_.size() - out_pos_);
    std::memcpy(buf, out_.data() + out_pos_, take);
    out_pos_ += take;
    return take;
}

size_t WireBodyReader::next_raw(uint8_t* buf, size_t len) {
    switch (framing_) {
        case BodyFraming::ContentLength: {
            if (remaining_ == 0) {
                return 0;
            }
            size_t n = reader_->read_some(buf, std::min(len, remaining_));
            if (n == 0) {
                throw ConnectionError("Connection closed with " + std::to_string(remaining_) +
                                      " bytes of the body outstanding");
            }
            remaining_ -= n;
            return n;
        }
        case BodyFraming::Chunked:
            return next_chunked(buf, len);
        case BodyFraming::UntilClose:
            return reader_->read_some(buf, len);
        case BodyFraming::None:
        default:
            return 0;
    }
}

size_t WireBodyReader::next_chunked(uint8_t* buf, size_t len) {
    if (chunk_left_ == 0) {
        if (chunks_done_) {
            return 0;
        }

        if (need_crlf_) {
            auto crlf = reader_->read_line();
            if (!crlf || !crlf->empty()) {
                throw ChunkedEncodingError("Missing CRLF after chunk data");
            }
            need_crlf_ = false;
        }

        auto size_line = reader_->read_line();
        if (!size_line) {
            throw ChunkedEncodingError("Connection closed before the last chunk");
        }

        std::string size_text = trim(size_line->substr(0, size_line->find(';')));
        if (size_text.empty() || size_text.size() > 15) {
            throw ChunkedEncodingError("Invalid chunk size: '" + size_line->substr(0, 32) + "'");
        }
        size_t size = 0;
        for (char c : size_text) {
            int digit;
            if (c >= '0' && c <= '9') digit = c - '0';
            else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else throw ChunkedEncodingError("Invalid chunk size: '" + size_text + "'");
            size = size * 16 + static_cast<size_t>(digit);
        }

        if (size == 0) {
            // Trailer fields are read and dropped
            while (true) {
                auto trailer = reader_->read_line();
                if (!trailer) {
                    throw ChunkedEncodingError("Connection closed inside the chunked trailer");
                }
                if (trailer->empty()) {
                    break;
                }
            }
            chunks_done_ = true;
            return 0;
        }
        chunk_left_ = size;
    }

    size_t n = reader_->read_some(buf, std::min(len, chunk_left_));
    if (n == 0) {
        throw ChunkedEncodingError("Connection closed in the middle of a chunk");
    }
    chunk_left_ -= n;
    if (chunk_left_ == 0) {
        need_crlf_ = true;
    }
    return n;
}

void WireBodyReader::hand_back() {
    if (!reader_) {
        return;
    }
    bool reusable = keep_alive_ && framing_ != BodyFraming::UntilClose && !reader_->has_buffered();
    if (reusable && on_complete_) {
        on_complete_(reader_->release());
    }
    reader_.reset();
}

} // namespace volley
