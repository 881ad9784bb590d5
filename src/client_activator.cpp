#include "client_activator.hpp"

#include <memory>

#include "invocation_state.hpp"
#include "storage_client.hpp"
#include "storage_service.hpp"

bool LocalClientActivator::activate(InvocationState& state, std::string& error) {
  auto host = state.config.get_string("storage.host");
  const auto service_name = state.config.get_string("storage.service");
  const auto timeout = state.config.get_duration("storage.client.timeout");

  // Handed to the state before anything can fail so the Runner's cleanup
  // stops the service and drains the stream on every path.
  state.errors = std::make_shared<ErrorStream>();
  state.client_activated = true;

  if(host.empty()) {
    LocalStorageService::Options options;
    options.service_name = service_name;
    options.listen_address = "127.0.0.1:0";
    state.service = std::make_unique<LocalStorageService>(options, state.errors, state.logger);
    if(!state.service->start(error)) {
      error = "unable to start the embedded storage service: " + error;
      return false;
    }
    state.service->start_background();
    host = state.service->address();
    if(!state.config.set("storage.host", host, ConfigTier::Override, error)) {
      return false;
    }
    state.logger->debug("started embedded storage service at {}", host);
  } else {
    // Nothing local will report asynchronously.
    state.errors->close();
  }

  state.client = std::make_unique<StorageClient>(host, timeout, state.logger);
  if(!state.client->connect(service_name, error)) {
    return false;
  }

  state.context.set("storage.host", host);
  state.context.set("storage.service", state.client->service());
  return true;
}
