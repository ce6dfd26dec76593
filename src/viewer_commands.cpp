#include "viewer.hpp"
#include <charconv>
#include <string>
#include "logger.hpp"

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

static bool parse_on_off(const std::string& s, bool& out) {
  if (s == "on") { out = true; return true; }
  if (s == "off") { out = false; return true; }
  return false;
}

void Viewer::register_commands() {
  registry_.register_command("set color", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) enable_color_ = !enable_color_;
    else if (!parse_on_off(args[0], enable_color_)) { msg = "set color: use :set color on|off"; return false; }
    msg = enable_color_ ? "color on" : "color off";
    return true;
  });
  registry_.register_command("set tabwidth", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set tabwidth: use :set tabwidth <width>"; return false; }
    int w = 0;
    if (!parse_int(args[0], w)) { msg = "set tabwidth: width must be a number"; return false; }
    if (w < 1) { msg = "set tabwidth: width must be >= 1"; return false; }
    content_.set_tab_width(w);
    msg = "tabwidth " + std::to_string(w);
    return true;
  });
  registry_.register_command("set sidebar", [this](const std::vector<std::string>& args, std::string& msg){
    const std::string usage = "set sidebar: use :set sidebar on|off|<percent>";
    if (args.empty()) { msg = usage; return false; }
    bool visible = false;
    if (parse_on_off(args[0], visible)) {
      sidebar_visible_ = visible;
      focus_ = visible ? Focus::Tree : Focus::Content;
      msg = visible ? "sidebar on" : "sidebar off";
      return true;
    }
    int pct = 0;
    if (!parse_int(args[0], pct)) { msg = usage; return false; }
    if (pct < SV_SIDEBAR_MIN_PERCENT || pct > SV_SIDEBAR_MAX_PERCENT) {
      msg = "set sidebar: percent must be within " + std::to_string(SV_SIDEBAR_MIN_PERCENT) +
            ".." + std::to_string(SV_SIDEBAR_MAX_PERCENT);
      return false;
    }
    sidebar_percent_ = pct;
    msg = "sidebar " + std::to_string(pct) + "%";
    return true;
  });
  registry_.register_command("set loglevel", [](const std::vector<std::string>& args, std::string& msg){
    LogLevel lvl = LogLevel::Debug;
    if (args.empty() || !parse_log_level(args[0], lvl)) {
      msg = "set loglevel: use :set loglevel debug|info|warn|error|off";
      return false;
    }
    Logger::get().set_level(lvl);
    msg = std::string("loglevel ") + log_level_name(lvl);
    return true;
  });
  registry_.register_command("set title", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set title: use :set title <text>"; return false; }
    std::string t;
    for (const auto& a : args) { if (!t.empty()) t += ' '; t += a; }
    title_ = t;
    msg = "title " + t;
    return true;
  });
}
