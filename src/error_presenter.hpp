#pragma once

#include <ostream>
#include <string>

// Renders the user-facing error report. The layout is fixed; colour is the
// only thing the terminal flag changes.
class ErrorPresenter {
public:
  void render(const std::string& message, bool is_terminal, std::ostream& err) const;
  std::string format(const std::string& message, bool is_terminal) const;
};

bool stream_is_terminal(int fd);
bool stderr_is_terminal();

std::string strip_ansi(const std::string& text);
