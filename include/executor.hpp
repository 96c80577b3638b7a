#pragma once

#include "async_request.hpp"
#include "response.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace volley {

// Told about each failed request. Whatever it throws reaches the caller of
// map() or ResponseStream::next().
using ExceptionHandler = std::function<void(const AsyncRequest&, std::exception_ptr)>;

// Pull-based request generator; nullopt ends it.
using RequestSource = std::function<std::optional<AsyncRequest>()>;

constexpr size_t kDefaultStreamSize = 5;

// Runs every request on a pool of `size` threads (one per core when unset or
// zero) and blocks until all of them finish. Successful responses come back
// in input order; failures go to `handler` or are dropped.
std::vector<Response> map(std::vector<AsyncRequest> requests, bool stream = false,
                          std::optional<size_t> size = std::nullopt,
                          const ExceptionHandler& handler = nullptr);

template <typename InputIt>
std::vector<Response> map(InputIt first, InputIt last, bool stream = false,
                          std::optional<size_t> size = std::nullopt,
                          const ExceptionHandler& handler = nullptr) {
    return map(std::vector<AsyncRequest>(first, last), stream, size, handler);
}

// Lazy sequence of responses in completion order. Single pass and move-only.
// Destroying it early cancels queued requests and joins the pool. Iterators
// point at the stream object itself, so moving the stream invalidates them.
class ResponseStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Response;
        using difference_type = std::ptrdiff_t;
        using pointer = Response*;
        using reference = Response&;

        iterator() = default;
        explicit iterator(ResponseStream* stream);

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }
        iterator& operator++();

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return stream_ != other.stream_; }

    private:
        void advance();

        ResponseStream* stream_ = nullptr;
        std::optional<Response> current_;
    };

    // Throws std::system_error when the pool cannot start.
    ResponseStream(RequestSource source, bool stream, size_t size, ExceptionHandler handler);
    ~ResponseStream();

    ResponseStream(ResponseStream&&) noexcept;
    ResponseStream& operator=(ResponseStream&&) noexcept;

    // Blocks for the next successful response. nullopt once the source is
    // exhausted and nothing is in flight.
    std::optional<Response> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // Stops early: queued requests are cancelled, running ones are waited for.
    void close();

    bool done() const;

    // Requests submitted and not yet collected
    size_t in_flight() const;

    // Worker threads still running; 0 after the stream ends
    size_t live_workers() const;

private:
    class State;
    std::unique_ptr<State> state_;
};

// Pulls from `source` as worker slots free up, at most `size` in flight.
ResponseStream imap(RequestSource source, bool stream = false,
                    size_t size = kDefaultStreamSize,
                    const ExceptionHandler& handler = nullptr);

ResponseStream imap(std::vector<AsyncRequest> requests, bool stream = false,
                    size_t size = kDefaultStreamSize,
                    const ExceptionHandler& handler = nullptr);

// The range must outlive the stream.
template <typename InputIt>
ResponseStream imap(InputIt first, InputIt last, bool stream = false,
                    size_t size = kDefaultStreamSize,
                    const ExceptionHandler& handler = nullptr) {
    RequestSource source = [first, last]() mutable -> std::optional<AsyncRequest> {
        if (first == last) {
            return std::nullopt;
        }
        return *first++;
    };
    return imap(std::move(source), stream, size, handler);
}

} // namespace volley
