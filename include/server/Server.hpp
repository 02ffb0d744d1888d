#pragma once

#include <poll.h>

#include <map>
#include <string>
#include <vector>

#include "config/Config.hpp"
#include "core/RequestPipeline.hpp"
#include "http/HttpRequest.hpp"
#include "log/Logger.hpp"
#include "server/FD.hpp"

namespace markdownd {

struct ClientConnection {
  FD m_fd;
  std::string m_remoteAddr;
  std::string m_readBuf;
  std::string m_writeBuf;
  bool m_wantWrite;
  HttpRequest m_request;
  HttpRequestParser m_parser;

  unsigned long m_createdAtMs;
  unsigned long m_lastActivityMs;

  enum Phase {
    kPhaseAccepted,
    kPhaseHeaders,
    kPhaseRespond,
    kPhaseClosing
  } m_phase;

  explicit ClientConnection(size_t maxBodySize = 1 << 20)
      : m_wantWrite(false),
        m_parser(maxBodySize),
        m_createdAtMs(0),
        m_lastActivityMs(0),
        m_phase(kPhaseAccepted) {}
};

// Single-threaded poll(2) loop. One request per connection: every response
// is written with "Connection: close" and the socket is closed once flushed.
class Server {
 public:
  Server(const ServerConfig &config, RequestPipeline &pipeline, Logger &log);

  bool Init();
  bool PollOnce(int timeoutMs);
  int ComputePollTimeout() const;  // until the earliest header deadline
  void ProcessEvents();
  void Shutdown();

 private:
  Server(const Server &);
  Server &operator=(const Server &);

  bool OpenListeningSocket();
  void AcceptNew(int listenFd);
  void HandleReadable(ClientConnection &conn);
  void HandleWritable(ClientConnection &conn);
  void Respond(ClientConnection &conn, const HttpResponse &resp);
  void CloseConnection(int fd);
  void SweepTimeouts();
  void BuildPollFds(std::vector<struct pollfd> &pfds);

  const ServerConfig &m_config;
  RequestPipeline &m_pipeline;
  Logger &m_log;
  FD m_listenSocket;
  std::map<int, ClientConnection> m_clients;
  std::vector<struct pollfd> m_pfds;
};

}  // namespace markdownd
