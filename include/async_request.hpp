#pragma once

#include "options.hpp"
#include "response.hpp"
#include "session.hpp"
#include <exception>
#include <memory>
#include <string>
#include <variant>

namespace volley {

// One HTTP call waiting to be run. The method and URL never change after
// construction. Without a session the request gets a private Session.
class AsyncRequest {
public:
    AsyncRequest(std::string method, std::string url,
                 RequestOptions options = {},
                 std::shared_ptr<Transport> session = nullptr,
                 ResponseHook callback = nullptr);

    const std::string& method() const { return method_; }
    const std::string& url() const { return url_; }
    const RequestOptions& options() const { return options_; }
    const std::shared_ptr<Transport>& session() const { return session_; }

private:
    std::string method_;
    std::string url_;
    RequestOptions options_;
    std::shared_ptr<Transport> session_;
};

// A request plus the outcome of running it once.
class ExecutionUnit {
public:
    explicit ExecutionUnit(AsyncRequest request);

    // Runs the request with `stream` overriding the stored flag. Transport
    // failures are captured, never thrown. Throws std::logic_error when
    // called a second time.
    ExecutionUnit& execute(bool stream);

    const AsyncRequest& request() const { return request_; }

    bool executed() const { return !std::holds_alternative<std::monostate>(outcome_); }
    bool succeeded() const { return std::holds_alternative<Response>(outcome_); }
    bool failed() const { return std::holds_alternative<std::exception_ptr>(outcome_); }

    // Throws std::logic_error unless the unit succeeded
    Response& response();

    // Null unless the unit failed
    std::exception_ptr exception() const;

private:
    AsyncRequest request_;
    std::variant<std::monostate, Response, std::exception_ptr> outcome_;
};

// Shortcuts
AsyncRequest request(const std::string& method, const std::string& url,
                     RequestOptions options = {},
                     std::shared_ptr<Transport> session = nullptr,
                     ResponseHook callback = nullptr);

AsyncRequest get(const std::string& url, RequestOptions options = {},
                 std::shared_ptr<Transport> session = nullptr,
                 ResponseHook callback = nullptr);
AsyncRequest options(const std::string& url, RequestOptions options = {},
                     std::shared_ptr<Transport> session = nullptr,
                     ResponseHook callback = nullptr);
AsyncRequest head(const std::string& url, RequestOptions options = {},
                  std::shared_ptr<Transport> session = nullptr,
                  ResponseHook callback = nullptr);
AsyncRequest post(const std::string& url, RequestOptions options = {},
                  std::shared_ptr<Transport> session = nullptr,
                  ResponseHook callback = nullptr);
AsyncRequest put(const std::string& url, RequestOptions options = {},
                 std::shared_ptr<Transport> session = nullptr,
                 ResponseHook callback = nullptr);
AsyncRequest patch(const std::string& url, RequestOptions options = {},
                   std::shared_ptr<Transport> session = nullptr,
                   ResponseHook callback = nullptr);

// `delete` is a keyword
AsyncRequest delete_(const std::string& url, RequestOptions options = {},
                     std::shared_ptr<Transport> session = nullptr,
                     ResponseHook callback = nullptr);

} // namespace volley
