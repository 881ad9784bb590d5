#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Errors reported by background work after the call that started it has
// returned. The producer closes the stream when it stops; drain() waits for
// that, so the process never exits with reports still in flight.
class ErrorStream {
public:
  void push(std::string error);
  void close();
  bool closed() const;

  std::vector<std::string> drain();

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<std::string> errors_;
  bool closed_ = false;
};
