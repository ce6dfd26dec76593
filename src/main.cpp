#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "viewer.hpp"
#include "logger.hpp"
#include "config.hpp"
#include <cstdio>
#include <exception>
#include <filesystem>

int main(int argc, char** argv) {
  std::filesystem::path root = argc >= 2 ? std::filesystem::path(argv[1]) : std::filesystem::path(SV_DEFAULT_ROOT);
  std::string msg;
  if (!Logger::get().open(SV_LOG_FILE, msg)) std::fprintf(stderr, "splitview: %s\n", msg.c_str());
  SV_LOG_INFO("starting application, root %s", root.string().c_str());

  int status = 0;
  std::string failure;
  try {
    Terminal term;
    NcursesTerminal nt;
    Viewer viewer(nt, root);
    if (auto rc = Viewer::default_rc_path()) viewer.load_rc(*rc);
    status = viewer.run();
  } catch (const std::exception& e) {
    failure = e.what();
    status = 1;
  }
  // the terminal is restored by now; safe to talk to stderr
  if (!failure.empty()) {
    SV_LOG_ERROR("fatal: %s", failure.c_str());
    std::fprintf(stderr, "splitview: %s\n", failure.c_str());
  }
  SV_LOG_INFO("exit status %d", status);
  return status;
}
