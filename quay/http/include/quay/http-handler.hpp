#pragma once

#include <functional>
#include <utility>

#include "quay/http-request.hpp"
#include "quay/response-writer.hpp"

namespace quay {

// Anything able to answer a request. Implementations must be callable concurrently from several connection threads.
class HttpHandler {
 public:
  HttpHandler() noexcept = default;
  HttpHandler(const HttpHandler&) = delete;
  HttpHandler(HttpHandler&&) = delete;
  HttpHandler& operator=(const HttpHandler&) = delete;
  HttpHandler& operator=(HttpHandler&&) = delete;

  virtual ~HttpHandler() = default;

  virtual void serve(const HttpRequest& request, ResponseWriter& writer) const = 0;
};

// Adapts a callable to the HttpHandler interface.
class HandlerFunc final : public HttpHandler {
 public:
  using Func = std::function<void(const HttpRequest&, ResponseWriter&)>;

  explicit HandlerFunc(Func func) : _func(std::move(func)) {}

  void serve(const HttpRequest& request, ResponseWriter& writer) const override { _func(request, writer); }

 private:
  Func _func;
};

}  // namespace quay
