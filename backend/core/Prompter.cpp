#include "Prompter.h"

#include <csignal>
#include <cstdio>
#include <iostream>
#include <utility>
#include <signal.h>
#include <termios.h>
#include <unistd.h>

namespace Console {

static volatile std::sig_atomic_t g_interrupted = 0;

static void OnInterrupt(int) { g_interrupted = 1; }

// Routes SIGINT to a flag while a prompt is open. The handler is installed
// without SA_RESTART, so the blocked read fails with EINTR.
class InterruptGuard {
public:
  InterruptGuard() {
    g_interrupted = 0;
    struct sigaction action {};
    action.sa_handler = OnInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    m_installed = (sigaction(SIGINT, &action, &m_previous) == 0);
  }

  ~InterruptGuard() {
    if (m_installed) {
      sigaction(SIGINT, &m_previous, nullptr);
    }
  }

  InterruptGuard(const InterruptGuard &) = delete;
  InterruptGuard &operator=(const InterruptGuard &) = delete;

  bool interrupted() const { return g_interrupted != 0; }

private:
  struct sigaction m_previous {};
  bool m_installed = false;
};

static std::string TrimTrailingNewlines(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
    value.pop_back();
  }
  return value;
}

// Reads one line; nullopt on EOF or interrupt. An interrupted stream is reset
// so later prompts can still read.
static std::optional<std::string> ReadStdinLine(const InterruptGuard &guard) {
  std::string line;
  if (std::getline(std::cin, line) && !guard.interrupted()) {
    return TrimTrailingNewlines(std::move(line));
  }

  if (guard.interrupted()) {
    std::cin.clear();
    std::clearerr(stdin);
  }
  return std::nullopt;
}

void TerminalPrompter::Print(const std::string &line) { std::cout << line << std::endl; }

std::optional<std::string> TerminalPrompter::ReadLine(const std::string &prompt) {
  std::cout << prompt << ": " << std::flush;

  InterruptGuard guard;
  auto line = ReadStdinLine(guard);
  if (!line) {
    std::cout << std::endl;
  }
  return line;
}

std::optional<std::string> TerminalPrompter::ReadHidden(const std::string &prompt) {
  std::cout << prompt << ": " << std::flush;

  InterruptGuard guard;
  termios original{};
  bool haveTermios = false;
  if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original) == 0) {
    haveTermios = true;
    termios updated = original;
    updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
  }

  auto line = ReadStdinLine(guard);

  if (haveTermios) {
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
  }
  std::cout << std::endl;
  return line;
}

} // namespace Console
