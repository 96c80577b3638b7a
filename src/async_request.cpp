#include "async_request.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace volley {

AsyncRequest::AsyncRequest(std::string method, std::string url,
                           RequestOptions options,
                           std::shared_ptr<Transport> session,
                           ResponseHook callback)
    : method_(std::move(method)),
      url_(std::move(url)),
      options_(std::move(options)),
      session_(std::move(session)) {
    if (!session_) {
        session_ = std::make_shared<Session>();
    }
    if (callback) {
        options_.hooks.response.push_back(std::move(callback));
    }
}

ExecutionUnit::ExecutionUnit(AsyncRequest request)
    : request_(std::move(request)) {
}

ExecutionUnit& ExecutionUnit::execute(bool stream) {
    if (executed()) {
        throw std::logic_error("Request to " + request_.url() + " was already executed");
    }

    RequestOptions overrides;
    overrides.stream = stream;
    RequestOptions merged = request_.options().merged_with(overrides);

    try {
        outcome_ = request_.session()->request(request_.method(), request_.url(), merged);
    } catch (...) {
        outcome_ = std::current_exception();
        log_debug() << request_.method() << " " << request_.url() << " failed: "
                    << describe(std::get<std::exception_ptr>(outcome_));
    }
    return *this;
}

Response& ExecutionUnit::response() {
    if (!succeeded()) {
        throw std::logic_error("Request to " + request_.url() + " has no response");
    }
    return std::get<Response>(outcome_);
}

std::exception_ptr ExecutionUnit::exception() const {
    if (!failed()) {
        return nullptr;
    }
    return std::get<std::exception_ptr>(outcome_);
}

AsyncRequest request(const std::string& method, const std::string& url,
                     RequestOptions options, std::shared_ptr<Transport> session,
                     ResponseHook callback) {
    return AsyncRequest(method, url, std::move(options), std::move(session),
                        std::move(callback));
}

AsyncRequest get(const std::string& url, RequestOptions options,
                 std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("GET", url, std::move(options), std::move(session), std::move(callback));
}

AsyncRequest options(const std::string& url, RequestOptions options,
                     std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("OPTIONS", url, std::move(options), std::move(session), std::move(callback));
}

AsyncRequest head(const std::string& url, RequestOptions options,
                  std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("HEAD", url, std::move(options), std::move(session), std::move(callback));
}

AsyncRequest post(const std::string& url, RequestOptions options,
                  std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("POST", url, std::move(options), std::move(session), std::move(callback));
}

AsyncRequest put(const std::string& url, RequestOptions options,
                 std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("PUT", url, std::move(options), std::move(session), std::move(callback));
}

AsyncRequest patch(const std::string& url, RequestOptions options,
                   std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("PATCH", url, std::move(options), std::move(session), std::move(callback));
}

AsyncRequest delete_(const std::string& url, RequestOptions options,
                     std::shared_ptr<Transport> session, ResponseHook callback) {
    return request("DELETE", url, std::move(options), std::move(session), std::move(callback));
}

} // namespace volley
