#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc commands ("set color on", ...).
 * Design: map name -> handler; a handler reports its outcome through msg and
 *         returns false when the arguments were rejected.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>& args, std::string& msg)>;
  enum class Result { Ok, Rejected, Unknown };

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }

  Result execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return Result::Unknown; }
    return it->second(args, msg) ? Result::Ok : Result::Rejected;
  }
private:
  std::map<std::string, Handler> map_;
};
