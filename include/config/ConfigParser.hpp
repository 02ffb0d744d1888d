#pragma once

#include <string>
#include <vector>

#include "config/Config.hpp"
#include "util/Result.hpp"

namespace markdownd {

// Builds a ServerConfig from the command line and an optional config file.
// Command-line flags win over directives read from the file.
class ConfigParser {
 public:
  ConfigParser();

  bool ParseArgs(int argc, char **argv, ServerConfig &out);
  bool ParseFile(const char *path, ServerConfig &out);

  bool HelpRequested() const { return m_helpRequested; }
  const std::string &Error() const { return m_error; }

  // "host:port", ":port" or "port"; host must be an IPv4 literal, "localhost"
  // or empty.
  static bool ParseListenAddress(const std::string &addr, std::string &host,
                                 int &port);

  // Canonical absolute directory with a trailing slash, or why it is
  // unusable as a document root.
  static Result<std::string, std::string> PrepareRoot(const std::string &dir);

 private:
  bool ParseLine(const std::string &line, ServerConfig &out);
  bool ApplyListen(const std::string &value, ServerConfig &out);

  bool m_helpRequested;
  std::string m_error;
};

}  // namespace markdownd
