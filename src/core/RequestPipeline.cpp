#include "core/RequestPipeline.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <exception>

#include "core/ContentClassifier.hpp"
#include "core/FileSystem.hpp"
#include "core/PathResolver.hpp"
#include "core/StaticFileServer.hpp"
#include "core/SymlinkGuard.hpp"
#include "markdownd.h"
#include "util/Strings.hpp"

namespace markdownd {

namespace {

const char kNotFoundBody[] = "404 page not found\n";

long elapsedMicros(const struct timespec &start) {
  struct timespec now;
  ::clock_gettime(CLOCK_MONOTONIC, &now);
  return (long)(now.tv_sec - start.tv_sec) * 1000000L +
         (long)(now.tv_nsec - start.tv_nsec) / 1000L;
}

// Logs the handling time when the request leaves Handle(), whichever branch
// produced the response.
class LatencyLog {
 public:
  LatencyLog(Logger &log, const RequestContext &ctx, const HttpResponse &resp)
      : m_log(log), m_ctx(ctx), m_resp(resp) {}
  ~LatencyLog() {
    Logger::Line(m_log, "done") << m_ctx.requestId << " status="
                                << m_resp.status << " closed after "
                                << elapsedMicros(m_ctx.startTime) << "us";
  }

 private:
  LatencyLog(const LatencyLog &);
  LatencyLog &operator=(const LatencyLog &);

  Logger &m_log;
  const RequestContext &m_ctx;
  const HttpResponse &m_resp;
};

}  // namespace

std::string ServerHeaderValue() {
  return std::string("markdownd/") + MARKDOWND_VERSION;
}

RequestContext::RequestContext() {
  startTime.tv_sec = 0;
  startTime.tv_nsec = 0;
}

RequestIdSource::RequestIdSource() : m_counter(0) {
  m_prefix = ((unsigned long)std::time(0) ^ ((unsigned long)::getpid() << 16)) &
             0xffffffffUL;
}

std::string RequestIdSource::Next() {
  char buf[40];
  std::sprintf(buf, "%08lx-%lu", m_prefix, ++m_counter);
  return buf;
}

RequestPipeline::RequestPipeline(const ServerConfig &config,
                                 const MarkdownRenderer &renderer, Logger &log)
    : m_config(config), m_dispatcher(renderer), m_log(log) {}

void RequestPipeline::SetNotFound(HttpResponse &resp) {
  std::string server;
  std::string frame;
  resp.Header("Server", server);
  resp.Header("X-Frame-Options", frame);
  resp.headers.clear();
  if (!server.empty()) resp.SetHeader("Server", server);
  if (!frame.empty()) resp.SetHeader("X-Frame-Options", frame);
  resp.status = 404;
  resp.omitBody = false;
  resp.SetHeader("Content-Type", "text/plain; charset=utf-8");
  resp.SetHeader("X-Content-Type-Options", "nosniff");
  resp.body = kNotFoundBody;
}

HttpResponse RequestPipeline::Handle(const HttpRequest &request,
                                     const std::string &remoteAddr) {
  RequestContext ctx;
  ::clock_gettime(CLOCK_MONOTONIC, &ctx.startTime);
  ctx.requestId = m_ids.Next();
  ctx.urlPath = request.path;

  HttpResponse resp;
  resp.SetHeader("Server", ServerHeaderValue());
  resp.SetHeader("X-Frame-Options", "DENY");
  LatencyLog latency(m_log, ctx, resp);

  std::string agent;
  request.Header("User-Agent", agent);
  agent = Logger::Escape(agent);
  std::string method = Logger::Escape(request.method);
  std::string uri = Logger::Escape(request.uri);
  if (request.method != "GET") {
    Logger::Line(m_log, "bad-method")
        << ctx.requestId << " " << remoteAddr << " " << method << " " << uri
        << " " << agent;
    SetNotFound(resp);
    return resp;
  }
  Logger::Line(m_log, "req") << ctx.requestId << " " << remoteAddr << " "
                             << method << " " << uri << " " << agent;
  try {
    Serve(request, ctx, resp);
  } catch (const std::exception &e) {
    Logger::Line(m_log, "error") << ctx.requestId << " " << e.what();
    SetNotFound(resp);
  }
  return resp;
}

void RequestPipeline::Serve(const HttpRequest &request, RequestContext &ctx,
                            HttpResponse &resp) {
  const std::string &root = m_config.rootPath;

  Result<std::string, std::string> resolved =
      ResolveRequestPath(root, ctx.urlPath, m_config.indexName);
  if (resolved.IsErr()) {
    Logger::Line(m_log, "bad-path") << ctx.requestId << " "
                                    << Logger::Escape(ctx.urlPath) << ": "
                                    << resolved.UnwrapErr();
    SetNotFound(resp);
    return;
  }
  std::string path = resolved.Unwrap();
  Logger::Line(m_log, "req") << ctx.requestId << " "
                             << Logger::Escape(ctx.urlPath) << " -> "
                             << Logger::Escape(path);

  Option<std::string> sibling = RenderDispatcher::FindMarkdownSibling(path);
  if (sibling.IsSome()) {
    Logger::Line(m_log, "req") << ctx.requestId << " " << Logger::Escape(path)
                               << " -> " << Logger::Escape(sibling.Unwrap());
    path = sibling.Unwrap();
  }

  int err = 0;
  if (!CanOpen(path, &err)) {
    if (err == ENOENT || err == ENOTDIR)
      Logger::Line(m_log, "404") << ctx.requestId << " "
                                 << Logger::Escape(path);
    else
      Logger::Line(m_log, "404") << ctx.requestId << " error opening file: "
                                 << std::strerror(err) << " "
                                 << Logger::Escape(path);
    SetNotFound(resp);
    return;
  }

  std::string realPath;
  if (!IsSymlinkSafe(path, &realPath)) {
    Logger::Line(m_log, "symlink") << ctx.requestId << " "
                                   << Logger::Escape(path) << " resolves to '"
                                   << Logger::Escape(realPath)
                                   << "', serving 404";
    SetNotFound(resp);
    return;
  }

  if (!HasPrefix(path, root)) {
    Logger::Line(m_log, "bad-path") << ctx.requestId << " "
                                    << Logger::Escape(path)
                                    << " does not have prefix " << root;
    SetNotFound(resp);
    return;
  }
  ctx.resolvedPath = path;

  Result<FileContents, std::string> file = ReadRegularFile(ctx.resolvedPath);
  if (file.IsErr()) {
    Logger::Line(m_log, "404") << ctx.requestId << " error reading file: "
                               << file.UnwrapErr() << " "
                               << Logger::Escape(ctx.resolvedPath);
    SetNotFound(resp);
    return;
  }
  std::time_t modified = file.Unwrap().modified;
  ClassificationResult content = Classify(ctx.resolvedPath, file.Unwrap().data);

  Result<RenderOutput, std::string> rendered =
      m_dispatcher.Dispatch(ctx.resolvedPath, content, request.rawQuery);
  if (rendered.IsErr()) {
    Logger::Line(m_log, "404") << ctx.requestId << " " << rendered.UnwrapErr()
                               << " " << Logger::Escape(ctx.resolvedPath);
    SetNotFound(resp);
    return;
  }
  RenderOutput &out = rendered.Unwrap();
  Logger::Line(m_log, BranchName(out.branch))
      << ctx.requestId << " category=" << CategoryName(content.category) << " ("
      << content.mimeType << ") " << Logger::Escape(ctx.resolvedPath);
  if (out.branch == kBranchStatic) {
    ServeStaticFile(request, ctx.resolvedPath, content.bytes, modified,
                    content.mimeType, resp);
    return;
  }
  resp.status = 200;
  if (!out.contentType.empty()) resp.SetHeader("Content-Type", out.contentType);
  resp.body.swap(out.body);
}

}  // namespace markdownd
