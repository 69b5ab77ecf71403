#pragma once

#include <optional>
#include <string>

namespace Console {

/**
 * @brief Line-oriented terminal interaction
 *
 * Read functions return nullopt when the user aborts (EOF / Ctrl-D / Ctrl-C).
 */
class Prompter {
public:
  virtual ~Prompter() = default;

  virtual void Print(const std::string &line) = 0;
  virtual std::optional<std::string> ReadLine(const std::string &prompt) = 0;
  virtual std::optional<std::string> ReadHidden(const std::string &prompt) = 0;
};

// stdin/stdout prompter; hidden reads disable terminal echo. SIGINT during a
// read ends that read instead of the process.
class TerminalPrompter : public Prompter {
public:
  void Print(const std::string &line) override;
  std::optional<std::string> ReadLine(const std::string &prompt) override;
  std::optional<std::string> ReadHidden(const std::string &prompt) override;
};

} // namespace Console
