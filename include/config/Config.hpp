// Runtime configuration (immutable once main() has built it)
#pragma once

#include <cstddef>
#include <string>

namespace markdownd {

struct ServerConfig {
  std::string host;       // listen host, empty = all interfaces
  int port;               // listen port
  std::string listenAddr; // as given, for the startup banner
  std::string rootPath;   // absolute, canonical, slash-terminated
  std::string indexName;  // served for an empty request path
  std::string logFile;    // empty = stderr
  int headerTimeoutMs;    // time to receive full headers
  size_t clientMaxBodySize;  // bytes
  ServerConfig()
      : port(8080),
        listenAddr(":8080"),
        indexName("index.md"),
        headerTimeoutMs(5000),
        clientMaxBodySize(1 << 20) {}
};

}  // namespace markdownd
