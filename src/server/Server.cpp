#include "server/Server.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include "http/HttpResponse.hpp"

namespace markdownd {

namespace {

bool setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;
  return true;
}

unsigned long nowMillis() {
  struct timespec ts;
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return (unsigned long)ts.tv_sec * 1000UL +
         (unsigned long)ts.tv_nsec / 1000000UL;
}

std::string peerName(const sockaddr_in &addr) {
  char ip[INET_ADDRSTRLEN];
  if (!::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) return "?";
  char buf[INET_ADDRSTRLEN + 8];
  std::sprintf(buf, "%s:%u", ip, (unsigned)ntohs(addr.sin_port));
  return buf;
}

// Minimal plain-text response for failures detected before the request
// reaches the pipeline.
HttpResponse transportError(int status) {
  HttpResponse resp;
  char body[64];
  std::sprintf(body, "%d %s\n", status, ReasonPhrase(status));
  resp.status = status;
  resp.SetHeader("Server", ServerHeaderValue());
  resp.SetHeader("X-Frame-Options", "DENY");
  resp.SetHeader("Content-Type", "text/plain; charset=utf-8");
  resp.body = body;
  return resp;
}

}  // namespace

Server::Server(const ServerConfig &config, RequestPipeline &pipeline,
               Logger &log)
    : m_config(config), m_pipeline(pipeline), m_log(log) {}

bool Server::Init() { return OpenListeningSocket(); }

bool Server::OpenListeningSocket() {
  FD sock(::socket(AF_INET, SOCK_STREAM, 0));
  if (!sock.Valid()) {
    Logger::Line(m_log, "fatal") << "socket: " << std::strerror(errno);
    return false;
  }
  int yes = 1;
  if (::setsockopt(sock.Get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) <
      0) {
    Logger::Line(m_log, "fatal") << "setsockopt: " << std::strerror(errno);
    return false;
  }
  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons((unsigned short)m_config.port);
  if (m_config.host.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, m_config.host.c_str(), &addr.sin_addr) != 1) {
    Logger::Line(m_log, "fatal") << "bad listen host " << m_config.host;
    return false;
  }
  if (::bind(sock.Get(), (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    Logger::Line(m_log, "fatal") << "bind " << m_config.listenAddr << ": "
                                 << std::strerror(errno);
    return false;
  }
  if (::listen(sock.Get(), 128) < 0) {
    Logger::Line(m_log, "fatal") << "listen: " << std::strerror(errno);
    return false;
  }
  if (!setNonBlocking(sock.Get())) {
    Logger::Line(m_log, "fatal") << "nonblock: " << std::strerror(errno);
    return false;
  }
  m_listenSocket.Reset(sock.Release());
  return true;
}

bool Server::PollOnce(int timeoutMs) {
  BuildPollFds(m_pfds);
  if (m_pfds.empty()) return true;
  int dyn = ComputePollTimeout();
  if (dyn >= 0 && (timeoutMs < 0 || dyn < timeoutMs)) timeoutMs = dyn;
  int ret = ::poll(&m_pfds[0], m_pfds.size(), timeoutMs);
  if (ret < 0) {
    if (errno == EINTR) {
      m_pfds.clear();
      return true;
    }
    Logger::Line(m_log, "fatal") << "poll: " << std::strerror(errno);
    return false;
  }
  return true;
}

int Server::ComputePollTimeout() const {
  if (m_clients.empty() || m_config.headerTimeoutMs <= 0) return -1;
  unsigned long nowMs = nowMillis();
  long best = -1;
  for (std::map<int, ClientConnection>::const_iterator it = m_clients.begin();
       it != m_clients.end(); ++it) {
    const ClientConnection &c = it->second;
    if (c.m_phase != ClientConnection::kPhaseAccepted &&
        c.m_phase != ClientConnection::kPhaseHeaders)
      continue;
    unsigned long deadline =
        c.m_createdAtMs + (unsigned long)m_config.headerTimeoutMs;
    long remain = (long)deadline - (long)nowMs;
    if (remain < 0) remain = 0;
    if (best < 0 || remain < best) best = remain;
  }
  return (int)best;
}

void Server::SweepTimeouts() {
  if (m_config.headerTimeoutMs <= 0) return;
  unsigned long nowMs = nowMillis();
  for (std::map<int, ClientConnection>::iterator it = m_clients.begin();
       it != m_clients.end(); ++it) {
    ClientConnection &c = it->second;
    if (c.m_phase != ClientConnection::kPhaseAccepted &&
        c.m_phase != ClientConnection::kPhaseHeaders)
      continue;
    if (nowMs - c.m_createdAtMs <= (unsigned long)m_config.headerTimeoutMs)
      continue;
    Logger::Line(m_log, "timeout") << c.m_remoteAddr << " fd=" << it->first
                                   << " sending 408";
    Respond(c, transportError(408));
  }
}

void Server::ProcessEvents() {
  SweepTimeouts();
  for (size_t i = 0; i < m_pfds.size(); ++i) {
    struct pollfd &p = m_pfds[i];
    if (!p.revents) continue;
    if (p.fd == m_listenSocket.Get()) {
      if (p.revents & POLLIN) AcceptNew(p.fd);
      continue;
    }
    std::map<int, ClientConnection>::iterator it = m_clients.find(p.fd);
    if (it == m_clients.end()) continue;
    if (p.revents & POLLIN) HandleReadable(it->second);
    if ((p.revents & POLLOUT) && it->second.m_wantWrite)
      HandleWritable(it->second);
    if (p.revents & (POLLHUP | POLLERR | POLLNVAL)) CloseConnection(p.fd);
  }
  // Handlers only mark connections; erase them once their response is out.
  std::map<int, ClientConnection>::iterator it = m_clients.begin();
  while (it != m_clients.end()) {
    if (it->second.m_phase == ClientConnection::kPhaseClosing &&
        it->second.m_writeBuf.empty())
      m_clients.erase(it++);
    else
      ++it;
  }
}

void Server::AcceptNew(int listenFd) {
  for (;;) {
    sockaddr_in peer;
    socklen_t len = sizeof(peer);
    int cfd = ::accept(listenFd, (struct sockaddr *)&peer, &len);
    if (cfd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
        Logger::Line(m_log, "accept") << "error: " << std::strerror(errno);
      break;
    }
    FD owned(cfd);
    if (!setNonBlocking(cfd)) continue;
    std::map<int, ClientConnection>::iterator it =
        m_clients
            .insert(std::make_pair(
                cfd, ClientConnection(m_config.clientMaxBodySize)))
            .first;
    ClientConnection &conn = it->second;
    conn.m_fd.Reset(owned.Release());
    conn.m_remoteAddr = peerName(peer);
    conn.m_createdAtMs = nowMillis();
    conn.m_lastActivityMs = conn.m_createdAtMs;
    Logger::Line(m_log, "accept") << conn.m_remoteAddr << " fd=" << cfd
                                  << " total_clients=" << m_clients.size();
  }
}

void Server::HandleReadable(ClientConnection &conn) {
  if (conn.m_phase == ClientConnection::kPhaseRespond ||
      conn.m_phase == ClientConnection::kPhaseClosing)
    return;
  char buf[4096];
  for (;;) {
    ssize_t n = ::recv(conn.m_fd.Get(), buf, sizeof(buf), 0);
    if (n == 0) {
      // peer went away before sending a full request
      conn.m_writeBuf.clear();
      conn.m_phase = ClientConnection::kPhaseClosing;
      return;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        conn.m_writeBuf.clear();
        conn.m_phase = ClientConnection::kPhaseClosing;
      }
      return;
    }
    conn.m_readBuf.append(buf, (size_t)n);
    conn.m_lastActivityMs = nowMillis();
    if (conn.m_phase == ClientConnection::kPhaseAccepted)
      conn.m_phase = ClientConnection::kPhaseHeaders;

    bool complete = conn.m_parser.Parse(conn.m_readBuf, conn.m_request);
    if (conn.m_parser.Error()) {
      int status = conn.m_parser.ErrorStatus();
      char tag[8];
      std::sprintf(tag, "%d", status);
      Logger::Line(m_log, tag) << conn.m_remoteAddr
                               << " malformed request bytes="
                               << conn.m_readBuf.size();
      Respond(conn, transportError(status));
      return;
    }
    if (complete) {
      Respond(conn, m_pipeline.Handle(conn.m_request, conn.m_remoteAddr));
      return;
    }
  }
}

void Server::Respond(ClientConnection &conn, const HttpResponse &resp) {
  conn.m_writeBuf = resp.Serialize();
  conn.m_readBuf.clear();
  conn.m_wantWrite = true;
  conn.m_phase = ClientConnection::kPhaseRespond;
  HandleWritable(conn);
}

void Server::HandleWritable(ClientConnection &conn) {
  while (!conn.m_writeBuf.empty()) {
    ssize_t n = ::send(conn.m_fd.Get(), conn.m_writeBuf.data(),
                       conn.m_writeBuf.size(), MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return;
      Logger::Line(m_log, "write") << conn.m_remoteAddr << " "
                                   << std::strerror(errno);
      conn.m_writeBuf.clear();
      break;
    }
    conn.m_writeBuf.erase(0, (size_t)n);
  }
  // Keep-alive is off: the connection ends with its first response.
  conn.m_wantWrite = false;
  conn.m_phase = ClientConnection::kPhaseClosing;
}

void Server::CloseConnection(int fd) {
  std::map<int, ClientConnection>::iterator it = m_clients.find(fd);
  if (it != m_clients.end()) {
    m_clients.erase(it);
  }
}

void Server::BuildPollFds(std::vector<struct pollfd> &pfds) {
  pfds.clear();
  if (m_listenSocket.Valid()) {
    struct pollfd p;
    p.fd = m_listenSocket.Get();
    p.events = POLLIN;
    p.revents = 0;
    pfds.push_back(p);
  }
  std::map<int, ClientConnection>::iterator it = m_clients.begin();
  for (; it != m_clients.end(); ++it) {
    struct pollfd p;
    p.fd = it->first;
    p.events = it->second.m_wantWrite ? POLLOUT : POLLIN;
    p.revents = 0;
    pfds.push_back(p);
  }
}

void Server::Shutdown() {
  m_clients.clear();
  m_listenSocket.Reset(-1);
}

}  // namespace markdownd
