#pragma once

#include <fstream>
#include <ostream>
#include <sstream>
#include <string>

namespace markdownd {

// Line-oriented log sink. Every line is "YYYY/MM/DD HH:MM:SS [tag] message".
// Writes to stderr until OpenFile() succeeds, or to a caller-owned stream.
class Logger {
 public:
  Logger();
  explicit Logger(std::ostream &sink);

  // Appends to path (created with mode 0660). On failure the sink is left
  // unchanged and the reason is stored in *err.
  bool OpenFile(const std::string &path, std::string *err);

  void Write(const std::string &tag, const std::string &message);

  // Client-supplied text made safe for one log line: control bytes, DEL and
  // backslash become "\xNN" / "\\".
  static std::string Escape(const std::string &text);

  // Stream-style line builder: Line(log, "404") << "file=" << path;
  class Line {
   public:
    Line(Logger &logger, const char *tag) : m_logger(logger), m_tag(tag) {}
    ~Line() { m_logger.Write(m_tag, m_buf.str()); }

    template <typename T>
    Line &operator<<(const T &value) {
      m_buf << value;
      return *this;
    }

   private:
    Line(const Line &);
    Line &operator=(const Line &);

    Logger &m_logger;
    const char *m_tag;
    std::ostringstream m_buf;
  };

 private:
  Logger(const Logger &);
  Logger &operator=(const Logger &);

  std::ostream *m_out;
  std::ofstream m_file;
};

}  // namespace markdownd
