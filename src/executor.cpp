#include "executor.hpp"
#include "completion_queue.hpp"
#include "logging.hpp"
#include "worker_pool.hpp"

namespace volley {

std::vector<Response> map(std::vector<AsyncRequest> requests, bool stream,
                          std::optional<size_t> size, const ExceptionHandler& handler) {
    std::vector<ExecutionUnit> units;
    units.reserve(requests.size());
    for (auto& request : requests) {
        units.emplace_back(std::move(request));
    }

    size_t workers = (size && *size > 0) ? *size : WorkerPool::default_size();
    log_debug() << "map: " << units.size() << " requests on " << workers << " workers";

    {
        WorkerPool pool(workers);
        for (auto& unit : units) {
            ExecutionUnit* target = &unit;
            pool.submit([target, stream] { target->execute(stream); });
        }
        pool.close();
        pool.join();
    }

    std::vector<Response> results;
    results.reserve(units.size());
    for (auto& unit : units) {
        if (unit.succeeded()) {
            results.push_back(std::move(unit.response()));
        } else if (unit.failed() && handler) {
            handler(unit.request(), unit.exception());
        }
    }
    return results;
}

class ResponseStream::State {
public:
    State(RequestSource source, bool stream, size_t size, ExceptionHandler handler)
        : source_(std::move(source)),
          stream_(stream),
          size_(size == 0 ? WorkerPool::default_size() : size),
          handler_(std::move(handler)),
          pool_(size_) {
        log_debug() << "imap: streaming with " << size_ << " workers";
    }

    ~State() {
        finish();
    }

    std::optional<Response> next() {
        while (!finished_) {
            refill();
            if (in_flight_ == 0) {
                finish();
                break;
            }

            auto unit = queue_.pop();
            if (!unit) {
                finish();
                break;
            }
            --in_flight_;

            if ((*unit)->succeeded()) {
                return std::move((*unit)->response());
            }
            if (handler_) {
                handler_((*unit)->request(), (*unit)->exception());
            }
        }
        return std::nullopt;
    }

    void finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        if (in_flight_ > 0) {
            log_debug() << "imap: stopped with " << in_flight_ << " requests in flight";
        }
        pool_.cancel();
        queue_.close();
        pool_.close();
        pool_.join();
        in_flight_ = 0;
    }

    bool finished() const { return finished_; }
    size_t in_flight() const { return in_flight_; }
    size_t live_workers() const { return pool_.live_workers(); }

private:
    // Tops the pool up to `size_` requests in flight
    void refill() {
        while (!exhausted_ && in_flight_ < size_) {
            std::optional<AsyncRequest> request = source_();
            if (!request) {
                exhausted_ = true;
                break;
            }

            auto unit = std::make_shared<ExecutionUnit>(std::move(*request));
            auto token = pool_.token();
            auto* queue = &queue_;
            bool stream = stream_;
            pool_.submit([unit, token, queue, stream] {
                if (token->cancelled()) {
                    return;
                }
                unit->execute(stream);
                queue->push(unit);
            });
            ++in_flight_;
        }
    }

    RequestSource source_;
    bool stream_;
    size_t size_;
    ExceptionHandler handler_;

    // Declared before the pool so workers never outlive it
    CompletionQueue<std::shared_ptr<ExecutionUnit>> queue_;
    WorkerPool pool_;

    size_t in_flight_ = 0;
    bool exhausted_ = false;
    bool finished_ = false;
};

ResponseStream::iterator::iterator(ResponseStream* stream)
    : stream_(stream) {
    advance();
}

ResponseStream::iterator& ResponseStream::iterator::operator++() {
    advance();
    return *this;
}

void ResponseStream::iterator::advance() {
    current_ = stream_->next();
    if (!current_) {
        stream_ = nullptr;
    }
}

ResponseStream::ResponseStream(RequestSource source, bool stream, size_t size,
                               ExceptionHandler handler)
    : state_(std::make_unique<State>(std::move(source), stream, size, std::move(handler))) {
}

ResponseStream::~ResponseStream() = default;

ResponseStream::ResponseStream(ResponseStream&&) noexcept = default;
ResponseStream& ResponseStream::operator=(ResponseStream&&) noexcept = default;

std::optional<Response> ResponseStream::next() {
    if (!state_) {
        return std::nullopt;
    }
    return state_->next();
}

void ResponseStream::close() {
    if (state_) {
        state_->finish();
    }
}

bool ResponseStream::done() const {
    return !state_ || state_->finished();
}

size_t ResponseStream::in_flight() const {
    return state_ ? state_->in_flight() : 0;
}

size_t ResponseStream::live_workers() const {
    return state_ ? state_->live_workers() : 0;
}

ResponseStream imap(RequestSource source, bool stream, size_t size,
                    const ExceptionHandler& handler) {
    return ResponseStream(std::move(source), stream, size, handler);
}

ResponseStream imap(std::vector<AsyncRequest> requests, bool stream, size_t size,
                    const ExceptionHandler& handler) {
    auto owned = std::make_shared<std::vector<AsyncRequest>>(std::move(requests));
    size_t index = 0;
    RequestSource source = [owned, index]() mutable -> std::optional<AsyncRequest> {
        if (index >= owned->size()) {
            return std::nullopt;
        }
        return std::move((*owned)[index++]);
    };
    return ResponseStream(std::move(source), stream, size, handler);
}

} // namespace volley
