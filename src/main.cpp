// Entry point: parse flags, prepare the document root and log sink, then run
// the poll loop until SIGINT/SIGTERM.

#include <csignal>
#include <iostream>
#include <string>

#include "config/Config.hpp"
#include "config/ConfigParser.hpp"
#include "core/MarkdownRenderer.hpp"
#include "core/RequestPipeline.hpp"
#include "log/Logger.hpp"
#include "markdownd.h"
#include "server/Server.hpp"

static volatile std::sig_atomic_t g_running = 1;

static void handle_signal(int) { g_running = 0; }

static const int kExitUsage = 111;

static const char kUsage[] =
    "\n"
    "USAGE\n"
    "\n"
    "markdownd [flags] [directory]\n"
    "\n"
    "EXAMPLES\n"
    "\n"
    "Serve current directory on port 8080, log to stderr\n"
    "\tmarkdownd -log /dev/stderr -http 127.0.0.1:8080 .\n"
    "\n"
    "Serve 'docs' directory on port 8081, log to 'md.log'\n"
    "\tmarkdownd -log md.log -http :8081 docs\n"
    "\n"
    "FLAGS\n"
    "  -http ADDR     listen address (default \":8080\")\n"
    "  -log FILE      log file (default stderr)\n"
    "  -index NAME    file served for \"/\" (default \"index.md\")\n"
    "  -conf FILE     read directives from FILE; flags override it\n";

int main(int argc, char **argv) {
  using namespace markdownd;

  std::cerr << "[markdownd v" << MARKDOWND_VERSION << "]\n";

  ServerConfig config;
  ConfigParser parser;
  if (!parser.ParseArgs(argc, argv, config)) {
    if (!parser.HelpRequested()) std::cerr << parser.Error() << "\n";
    std::cerr << kUsage << "\n";
    return kExitUsage;
  }

  Result<std::string, std::string> root =
      ConfigParser::PrepareRoot(config.rootPath);
  if (root.IsErr()) {
    std::cerr << root.UnwrapErr() << "\n";
    return kExitUsage;
  }
  config.rootPath = root.Unwrap();
  std::cerr << "serving filesystem: " << config.rootPath << "\n";

  Logger log;
  if (!config.logFile.empty()) {
    std::string err;
    if (!log.OpenFile(config.logFile, &err)) {
      std::cerr << "cant open log file: " << err << "\n";
      return kExitUsage;
    }
  }
  std::cerr << "log output: "
            << (config.logFile.empty() ? "/dev/stderr" : config.logFile) << "\n";

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  std::signal(SIGPIPE, SIG_IGN);

  Md4cRenderer renderer;
  RequestPipeline pipeline(config, renderer, log);
  Server server(config, pipeline, log);
  if (!server.Init()) {
    std::cerr << "Server initialization failed.\n";
    return 1;
  }
  std::cerr << "listening: " << config.listenAddr << "\n";

  while (g_running) {
    if (!server.PollOnce(1000)) {  // 1s timeout to allow signal check
      break;                       // poll error
    }
    server.ProcessEvents();
  }

  server.Shutdown();
  return 0;
}
