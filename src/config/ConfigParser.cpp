#include "config/ConfigParser.hpp"

#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace markdownd {

namespace {

std::vector<std::string> tokenize(const std::string &line) {
  std::vector<std::string> tokens;
  std::string::size_type start = 0;
  while (start < line.size()) {
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t' ||
                                   line[start] == '\n' || line[start] == '\r'))
      ++start;
    if (start >= line.size()) break;
    std::string::size_type end = start;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t' &&
           line[end] != '\n' && line[end] != '\r')
      ++end;
    tokens.push_back(line.substr(start, end - start));
    start = end;
  }
  return tokens;
}

bool parseNumber(const std::string &s, long &out) {
  if (s.empty()) return false;
  char *end = 0;
  errno = 0;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v < 0) return false;
  out = v;
  return true;
}

}  // namespace

ConfigParser::ConfigParser() : m_helpRequested(false) {}

bool ConfigParser::ParseListenAddress(const std::string &addr,
                                      std::string &host, int &port) {
  std::string h;
  std::string p = addr;
  std::string::size_type colon = addr.rfind(':');
  if (colon != std::string::npos) {
    h = addr.substr(0, colon);
    p = addr.substr(colon + 1);
  }
  long value = 0;
  if (!parseNumber(p, value) || value > 65535) return false;
  if (h == "localhost") h = "127.0.0.1";
  if (!h.empty()) {
    // dotted quad only
    int dots = 0;
    for (size_t i = 0; i < h.size(); ++i) {
      if (h[i] == '.')
        ++dots;
      else if (h[i] < '0' || h[i] > '9')
        return false;
    }
    if (dots != 3) return false;
  }
  host = h;
  port = (int)value;
  return true;
}

Result<std::string, std::string> ConfigParser::PrepareRoot(
    const std::string &dir) {
  typedef Result<std::string, std::string> R;
  if (dir.empty()) return R::Err("empty directory argument");
  char buf[PATH_MAX];
  if (::realpath(dir.c_str(), buf) == 0)
    return R::Err(dir + ": " + std::strerror(errno));
  struct stat st;
  if (::stat(buf, &st) != 0) return R::Err(dir + ": " + std::strerror(errno));
  if (!S_ISDIR(st.st_mode)) return R::Err(dir + ": not a directory");
  std::string root(buf);
  if (root[root.size() - 1] != '/') root += '/';
  return R::Ok(root);
}

bool ConfigParser::ApplyListen(const std::string &value, ServerConfig &out) {
  std::string host;
  int port = 0;
  if (!ParseListenAddress(value, host, port)) {
    m_error = "invalid listen address: " + value;
    return false;
  }
  out.host = host;
  out.port = port;
  out.listenAddr = value;
  return true;
}

bool ConfigParser::ParseArgs(int argc, char **argv, ServerConfig &out) {
  m_helpRequested = false;
  m_error.clear();

  std::vector<std::pair<std::string, std::string> > flags;
  std::vector<std::string> positional;
  int i = 1;
  for (; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg.size() < 2 || arg[0] != '-') break;  // first non-flag
    std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
    std::string value;
    bool hasValue = false;
    std::string::size_type eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
      hasValue = true;
    }
    if (name == "h" || name == "help") {
      m_helpRequested = true;
      return false;
    }
    if (name != "http" && name != "log" && name != "index" && name != "conf") {
      m_error = "flag provided but not defined: -" + name;
      return false;
    }
    if (!hasValue) {
      if (i + 1 >= argc) {
        m_error = "flag needs an argument: -" + name;
        return false;
      }
      value = argv[++i];
    }
    flags.push_back(std::make_pair(name, value));
  }
  for (; i < argc; ++i) positional.push_back(argv[i]);

  for (size_t f = 0; f < flags.size(); ++f) {
    if (flags[f].first == "conf" && !ParseFile(flags[f].second.c_str(), out))
      return false;
  }
  for (size_t f = 0; f < flags.size(); ++f) {
    const std::string &name = flags[f].first;
    const std::string &value = flags[f].second;
    if (name == "http") {
      if (!ApplyListen(value, out)) return false;
    } else if (name == "log") {
      out.logFile = value;
    } else if (name == "index") {
      if (value.empty()) {
        m_error = "invalid index name: " + value;
        return false;
      }
      out.indexName = value;
    }
  }

  if (positional.size() == 1) {
    out.rootPath = positional[0];
  } else if (!(positional.empty() && !out.rootPath.empty())) {
    m_error = "need exactly one directory argument";
    return false;
  }
  return true;
}

bool ConfigParser::ParseFile(const char *path, ServerConfig &out) {
  FILE *f = std::fopen(path, "r");
  if (!f) {
    m_error = std::string("open config ") + path + ": " + std::strerror(errno);
    return false;
  }
  char line[512];
  int lineNo = 0;
  while (std::fgets(line, sizeof(line), f)) {
    ++lineNo;
    std::string s(line);
    if (!ParseLine(s, out)) {
      char num[16];
      std::sprintf(num, "%d", lineNo);
      if (m_error.empty()) m_error = "invalid directive";
      m_error = std::string(path) + ":" + num + ": " + m_error;
      std::fclose(f);
      return false;
    }
  }
  std::fclose(f);
  return true;
}

bool ConfigParser::ParseLine(const std::string &line, ServerConfig &out) {
  m_error.clear();
  std::vector<std::string> tokens = tokenize(line);
  if (tokens.empty() || tokens[0][0] == '#') return true;
  if (tokens.size() != 2) {
    m_error = "expected '<directive> <value>'";
    return false;
  }
  const std::string &key = tokens[0];
  const std::string &val = tokens[1];
  long n = 0;
  if (key == "listen") {
    return ApplyListen(val, out);
  } else if (key == "root") {
    out.rootPath = val;
  } else if (key == "index") {
    out.indexName = val;
  } else if (key == "log") {
    out.logFile = val;
  } else if (key == "header_timeout") {
    if (!parseNumber(val, n) || n > INT_MAX) {
      m_error = "invalid header_timeout: " + val;
      return false;
    }
    out.headerTimeoutMs = (int)n;
  } else if (key == "client_max_body_size") {
    if (!parseNumber(val, n)) {
      m_error = "invalid client_max_body_size: " + val;
      return false;
    }
    out.clientMaxBodySize = (size_t)n;
  } else {
    m_error = "unknown directive: " + key;
    return false;
  }
  return true;
}

}  // namespace markdownd
