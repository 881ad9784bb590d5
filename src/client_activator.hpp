#pragma once

#include <string>

struct InvocationState;

// Produces the storage client (and the error stream for asynchronous
// failures) a command talks to. Success leaves state.client connected and
// state.errors set.
class ClientActivator {
public:
  virtual ~ClientActivator() = default;
  virtual bool activate(InvocationState& state, std::string& error) = 0;
};

// Connects to storage.host. When no host is configured it starts an embedded
// LocalStorageService on an ephemeral loopback port and connects to that.
class LocalClientActivator : public ClientActivator {
public:
  bool activate(InvocationState& state, std::string& error) override;
};
