#include "error_presenter.hpp"

#include <spdlog/fmt/fmt.h>

#include <unistd.h>

namespace {

constexpr int kRed = 31;
constexpr int kRedBg = 41;
constexpr int kBlueBg = 44;
constexpr int kLightBlue = 94;
constexpr int kWhite = 97;

class Painter {
public:
  explicit Painter(bool enabled) : enabled_(enabled) {}

  std::string operator()(int color, const std::string& text) const {
    if(!enabled_) return text;
    return fmt::format("\x1b[{}m{}\x1b[0m", color, text);
  }

private:
  bool enabled_;
};

} // namespace

std::string ErrorPresenter::format(const std::string& message, bool is_terminal) const {
  const Painter paint(is_terminal);
  std::string out;
  out += fmt::format("Oops, an {} occurred!\n\n", paint(kRedBg, "error"));
  out += fmt::format("  {}\n\n", paint(kRed, message));
  out += fmt::format("To correct the {} please review:\n\n", paint(kRedBg, "error"));
  out += fmt::format("  - Debug output by using the flag {}\n", paint(kLightBlue, "\"-l debug\""));
  out += fmt::format("  - The volctl manual at {}\n", paint(kBlueBg, "\"man volctl\""));
  out += fmt::format("  - The {} below\n", paint(kWhite, "online help"));
  return out;
}

void ErrorPresenter::render(const std::string& message, bool is_terminal, std::ostream& err) const {
  err << format(message, is_terminal);
  err.flush();
}

bool stream_is_terminal(int fd) {
  return isatty(fd) == 1;
}

bool stderr_is_terminal() {
  return stream_is_terminal(STDERR_FILENO);
}

std::string strip_ansi(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for(std::size_t i = 0; i < text.size(); ++i) {
    if(text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      std::size_t end = i + 2;
      while(end < text.size() && text[end] != 'm') ++end;
      i = end;
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}
