#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sshprom {

// One CLI subcommand bound to everything it needs to run.
struct IHandler {
  virtual ~IHandler() = default;
  virtual std::string command() const = 0;
  // Runs the subcommand; the return value is the process exit code.
  virtual int start() = 0;
};

struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // nullptr for an unknown subcommand.
  virtual std::shared_ptr<IHandler> create(const std::string &subcmd) = 0;
  virtual std::vector<std::string> names() const = 0;
};

// Subcommands looked up by name, in registration order.
class HandlerRegistry : public IHandlerFactory {
public:
  using CreatorFunc = std::function<std::shared_ptr<IHandler>()>;

  HandlerRegistry &add(std::string name, CreatorFunc creator) {
    entries_.emplace_back(std::move(name), std::move(creator));
    return *this;
  }

  std::shared_ptr<IHandler> create(const std::string &subcmd) override {
    for (const auto &[name, creator] : entries_) {
      if (name == subcmd) {
        return creator();
      }
    }
    return nullptr;
  }

  std::vector<std::string> names() const override {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &entry : entries_) {
      out.push_back(entry.first);
    }
    return out;
  }

private:
  std::vector<std::pair<std::string, CreatorFunc>> entries_;
};

} // namespace sshprom
