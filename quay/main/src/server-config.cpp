#include "quay/server-config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace quay {

namespace {

std::string_view EnvOrDefault(const char* name, std::string_view defaultValue) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return defaultValue;
  }
  return value;
}

}  // namespace

ServerConfig ServerConfig::FromEnvironment() {
  ServerConfig config;
  config.port = EnvOrDefault("PORT", kDefaultPort);
  config.staticDir = EnvOrDefault("STATIC_DIR", kDefaultStaticDir);
  return config;
}

void ServerConfig::validate() const {
  if (readTimeout.count() <= 0) {
    throw std::invalid_argument("read timeout should be strictly positive");
  }
  if (writeTimeout.count() <= 0) {
    throw std::invalid_argument("write timeout should be strictly positive");
  }
  if (shutdownTimeout.count() <= 0) {
    throw std::invalid_argument("shutdown timeout should be strictly positive");
  }
  if (maxHeaderBytes == 0) {
    throw std::invalid_argument("max header bytes should be strictly positive");
  }
  if (listenBacklog <= 0) {
    throw std::invalid_argument("listen backlog should be strictly positive");
  }
  staticFiles.validate();
}

}  // namespace quay
