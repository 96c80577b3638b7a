#include "response.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace volley {

Headers::Headers(std::initializer_list<value_type> init) {
    for (const auto& [key, value] : init) {
        set(key, value);
    }
}

std::string Headers::lower(const std::string& s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void Headers::set(const std::string& key, const std::string& value) {
    entries_[lower(key)] = {key, value};
}

void Headers::add(const std::string& key, const std::string& value) {
    auto it = entries_.find(lower(key));
    if (it == entries_.end()) {
        entries_.emplace(lower(key), value_type{key, value});
        return;
    }
    it->second.second += ", ";
    it->second.second += value;
}

std::optional<std::string> Headers::get(const std::string& key) const {
    auto it = entries_.find(lower(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.second;
}

bool Headers::contains(const std::string& key) const {
    return entries_.find(lower(key)) != entries_.end();
}

bool Headers::erase(const std::string& key) {
    return entries_.erase(lower(key)) > 0;
}

void Headers::update(const Headers& other) {
    for (const auto& entry : other.entries_) {
        entries_[entry.first] = entry.second;
    }
}

bool Response::is_redirect() const {
    return headers.contains("Location") &&
           (status_code == 301 || status_code == 302 || status_code == 303 ||
            status_code == 307 || status_code == 308);
}

void Response::raise_for_status() const {
    std::string kind;
    if (status_code >= 400 && status_code < 500) {
        kind = "Client Error";
    } else if (status_code >= 500 && status_code < 600) {
        kind = "Server Error";
    } else {
        return;
    }
    throw HTTPError(std::to_string(status_code) + " " + kind + ": " + reason +
                    " for url: " + url, status_code);
}

const std::vector<uint8_t>& Response::content() const {
    if (drained_) {
        throw StreamConsumedError("The content for this response was already consumed");
    }
    if (reader_) {
        uint8_t buffer[16384];
        size_t n;
        while ((n = reader_->read(buffer, sizeof(buffer))) > 0) {
            content_.insert(content_.end(), buffer, buffer + n);
        }
        reader_.reset();
    }
    return content_;
}

std::string Response::text() const {
    const auto& body = content();
    return std::string(body.begin(), body.end());
}

void Response::iter_content(size_t chunk_size, const ChunkCallback& fn) const {
    if (chunk_size == 0) {
        chunk_size = 1;
    }

    if (drained_) {
        throw StreamConsumedError("The content for this response was already consumed");
    }

    if (!reader_) {
        for (size_t pos = 0; pos < content_.size(); pos += chunk_size) {
            fn(content_.data() + pos, std::min(chunk_size, content_.size() - pos));
        }
        return;
    }

    // Hand out the stream directly, nothing is buffered.
    auto reader = std::move(reader_);
    drained_ = true;
    std::vector<uint8_t> buffer(chunk_size);
    size_t n;
    while ((n = reader->read(buffer.data(), buffer.size())) > 0) {
        fn(buffer.data(), n);
    }
}

void Response::set_content(std::vector<uint8_t> body) {
    content_ = std::move(body);
    reader_.reset();
    drained_ = false;
}

void Response::set_body_reader(std::shared_ptr<BodyReader> reader) {
    content_.clear();
    reader_ = std::move(reader);
    drained_ = false;
}

void Response::close() {
    if (reader_) {
        reader_.reset();
        drained_ = true;
    }
}

} // namespace volley
