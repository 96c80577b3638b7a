#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace volley {

// Header map with case-insensitive lookup. Keeps the spelling of the last set().
class Headers {
public:
    using value_type = std::pair<std::string, std::string>;

    Headers() = default;
    Headers(std::initializer_list<value_type> init);

    void set(const std::string& key, const std::string& value);

    // Repeated fields are folded into one comma-separated value.
    void add(const std::string& key, const std::string& value);

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;
    bool erase(const std::string& key);

    // Entries of `other` replace entries with the same name.
    void update(const Headers& other);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& entry : entries_) {
            fn(entry.second.first, entry.second.second);
        }
    }

private:
    static std::string lower(const std::string& s);

    // lowercase name -> (original name, value)
    std::map<std::string, value_type> entries_;
};

// Source of a body that has not been read off the wire yet.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Fills up to `len` decoded bytes. Returns 0 once the body is complete.
    virtual size_t read(uint8_t* buf, size_t len) = 0;
};

using ChunkCallback = std::function<void(const uint8_t* data, size_t len)>;

class Response {
public:
    int status_code = 0;
    std::string reason;
    Headers headers;

    // Final URL, after redirects
    std::string url;
    std::chrono::milliseconds elapsed{0};

    // Responses that led here through redirects, oldest first
    std::vector<Response> history;

    bool was_compressed = false;

    // True for status codes below 400
    bool ok() const { return status_code > 0 && status_code < 400; }

    bool is_redirect() const;

    // Throws HTTPError for 4xx and 5xx.
    void raise_for_status() const;

    // Whole body. Reads a streamed body to the end on first use.
    const std::vector<uint8_t>& content() const;

    std::string text() const;

    // Delivers the body in pieces of at most chunk_size bytes. A streamed body
    // is read lazily and can be iterated once; afterwards StreamConsumedError.
    void iter_content(size_t chunk_size, const ChunkCallback& fn) const;

    bool is_streaming() const { return reader_ != nullptr; }

    void set_content(std::vector<uint8_t> body);
    void set_body_reader(std::shared_ptr<BodyReader> reader);

    // Drops an unread streamed body. The connection is not reused.
    void close();

private:
    mutable std::vector<uint8_t> content_;
    mutable std::shared_ptr<BodyReader> reader_;
    mutable bool drained_ = false;
};

} // namespace volley
