#pragma once

#include <time.h>

#include <string>

#include "config/Config.hpp"
#include "core/MarkdownRenderer.hpp"
#include "core/RenderDispatcher.hpp"
#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"
#include "log/Logger.hpp"

namespace markdownd {

// Value of the Server response header.
std::string ServerHeaderValue();

// Per-request state. Lives on the stack of RequestPipeline::Handle().
struct RequestContext {
  std::string requestId;     // log correlation only
  std::string urlPath;       // decoded, attacker controlled
  std::string resolvedPath;  // set once the path passed resolution
  struct timespec startTime;
  RequestContext();
};

// Unique-per-process ids: a start-time prefix and a counter.
class RequestIdSource {
 public:
  RequestIdSource();
  std::string Next();

 private:
  unsigned long m_prefix;
  unsigned long m_counter;
};

/**
 * Turns one parsed request into one response.
 *
 * Every failure (bad method, traversal, missing file, symlink hop, read or
 * render error) yields the same 404 so a client cannot tell "forbidden" from
 * "missing"; the reason only goes to the log. Bytes are read only from a path
 * that passed both the root-prefix check and the symlink check.
 */
class RequestPipeline {
 public:
  RequestPipeline(const ServerConfig &config, const MarkdownRenderer &renderer,
                  Logger &log);

  HttpResponse Handle(const HttpRequest &request,
                      const std::string &remoteAddr);

  // The uniform not-found response body and headers.
  static void SetNotFound(HttpResponse &resp);

 private:
  RequestPipeline(const RequestPipeline &);
  RequestPipeline &operator=(const RequestPipeline &);

  void Serve(const HttpRequest &request, RequestContext &ctx,
             HttpResponse &resp);

  const ServerConfig &m_config;
  RenderDispatcher m_dispatcher;
  Logger &m_log;
  RequestIdSource m_ids;
};

}  // namespace markdownd
