#include <criterion/criterion.h>

#include <sys/stat.h>

#include <fstream>
#include <sstream>
#include <string>

#include "TempTree.hpp"
#include "log/Logger.hpp"

using markdownd::Logger;
using markdownd::testing::TempTree;

Test(Logger, line_format) {
  std::ostringstream out;
  Logger log(out);
  Logger::Line(log, "404") << "id-1 " << 42;
  std::string line = out.str();
  // "YYYY/MM/DD HH:MM:SS [404] id-1 42\n"
  cr_assert_eq(line.size(), (size_t)19 + 15);
  cr_assert_eq(line[4], '/');
  cr_assert_eq(line[7], '/');
  cr_assert_eq(line[13], ':');
  cr_assert_str_eq(line.substr(19).c_str(), " [404] id-1 42\n");
}

Test(Logger, file_sink_appends) {
  TempTree tree;
  cr_assert(tree.Ok());
  cr_assert(tree.WriteFile("md.log", "earlier\n"));
  {
    Logger log;
    std::string err;
    cr_assert(log.OpenFile(tree.Path("md.log"), &err), "%s", err.c_str());
    log.Write("req", "hello");
  }
  std::ifstream in(tree.Path("md.log").c_str());
  std::string first;
  std::string second;
  std::getline(in, first);
  std::getline(in, second);
  cr_assert_str_eq(first.c_str(), "earlier");
  cr_assert(second.find("[req] hello") != std::string::npos);
}

Test(Logger, file_created_group_writable) {
  TempTree tree;
  cr_assert(tree.Ok());
  mode_t old = ::umask(0);
  Logger log;
  std::string err;
  bool ok = log.OpenFile(tree.Path("new.log"), &err);
  ::umask(old);
  cr_assert(ok, "%s", err.c_str());
  struct stat st;
  cr_assert_eq(::stat(tree.Path("new.log").c_str(), &st), 0);
  cr_assert_eq(st.st_mode & 0777, (mode_t)0660);
}

Test(Logger, unopenable_file_keeps_sink) {
  TempTree tree;
  cr_assert(tree.Ok());
  Logger log;
  std::string err;
  cr_assert_not(log.OpenFile(tree.Path("missing-dir/md.log"), &err));
  cr_assert_not(err.empty());
}

Test(Logger, escape_control_bytes) {
  cr_assert_str_eq(Logger::Escape("plain/path.md").c_str(), "plain/path.md");
  cr_assert_str_eq(Logger::Escape("a\nb\\c\x7f").c_str(),
                   "a\\x0ab\\\\c\\x7f");
  cr_assert_str_eq(Logger::Escape(std::string("\0\t", 2)).c_str(),
                   "\\x00\\x09");
}
