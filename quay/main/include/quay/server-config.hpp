#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "quay/static-file-config.hpp"

namespace quay {

struct ServerConfig {
  static constexpr std::string_view kDefaultPort = "8080";
  static constexpr std::string_view kDefaultStaticDir = "./static";

  // Builds the configuration from the PORT and STATIC_DIR environment variables.
  // An unset or empty variable selects the default value. All other parameters keep their default.
  static ServerConfig FromEnvironment();

  // ============================
  // Listener parameters
  // ============================
  // TCP port to bind, as a decimal number or a service name. "0" lets the OS pick an ephemeral free port, the
  // effective one is then available through HttpServer::port().
  // It is only resolved when the server binds: an invalid value is a listen failure, not a validation error.
  std::string port{kDefaultPort};
  // Maximum length of the queue of pending connections.
  int listenBacklog{1024};

  // ============================
  // Static files
  // ============================
  // Root directory served for all request paths. It does not need to exist at startup.
  std::filesystem::path staticDir{kDefaultStaticDir};
  StaticFileConfig staticFiles;

  // ============================
  // Request parsing & timeouts
  // ============================
  // Maximum duration to receive a complete request head, and to wait for the next request on an idle persistent
  // connection.
  std::chrono::milliseconds readTimeout{std::chrono::seconds{10}};
  // Maximum duration of each blocking send on a connection.
  std::chrono::milliseconds writeTimeout{std::chrono::seconds{10}};
  // Maximum size of a request head (request line + header fields). Larger heads get a 431 response.
  std::size_t maxHeaderBytes{std::size_t{1} << 20};

  // ============================
  // Shutdown
  // ============================
  // Deadline for in-flight connections to complete after a termination signal.
  std::chrono::milliseconds shutdownTimeout{std::chrono::seconds{5}};

  // Throws std::invalid_argument if a timeout or size limit is not strictly positive, or if the static files
  // configuration is invalid.
  void validate() const;

  // Address as printed in logs, ":<port>".
  [[nodiscard]] std::string listenAddress() const { return ":" + port; }

  ServerConfig& withPort(std::string_view value) {
    port = value;
    return *this;
  }

  ServerConfig& withStaticDir(std::filesystem::path dir) {
    staticDir = std::move(dir);
    return *this;
  }

  ServerConfig& withStaticFileConfig(StaticFileConfig cfg) {
    staticFiles = std::move(cfg);
    return *this;
  }

  ServerConfig& withReadTimeout(std::chrono::milliseconds timeout) {
    readTimeout = timeout;
    return *this;
  }

  ServerConfig& withWriteTimeout(std::chrono::milliseconds timeout) {
    writeTimeout = timeout;
    return *this;
  }

  ServerConfig& withMaxHeaderBytes(std::size_t maxBytes) {
    maxHeaderBytes = maxBytes;
    return *this;
  }

  ServerConfig& withShutdownTimeout(std::chrono::milliseconds timeout) {
    shutdownTimeout = timeout;
    return *this;
  }
};

}  // namespace quay
