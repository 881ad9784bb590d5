#include "error_stream.hpp"

void ErrorStream::push(std::string error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(closed_) return;
    errors_.push_back(std::move(error));
  }
  cv_.notify_all();
}

void ErrorStream::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ErrorStream::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::vector<std::string> ErrorStream::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]{ return closed_; });
  std::vector<std::string> out(errors_.begin(), errors_.end());
  errors_.clear();
  return out;
}
