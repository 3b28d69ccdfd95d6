#pragma once

#include <cstdint>
#include <memory>

#include "internal/outcome/classification.hpp"
#include "internal/proxy/proxy_endpoint.hpp"

namespace fleetq::processing {

/*
  Boundary to the page-processing side.

  A session is bound to one proxy endpoint for its whole life; the lane
  keeps it across attempts until the outcome policy asks for rotation.
  Process() may throw; the lane records that as a transient failure and
  drops the session.
*/
class ProcessingSession {
 public:
  virtual ~ProcessingSession() = default;

  virtual outcome::ProcessingOutcome Process(int64_t item_id) = 0;
};

class SessionFactory {
 public:
  virtual ~SessionFactory() = default;

  virtual std::unique_ptr<ProcessingSession> Open(const proxy::ProxyEndpoint& endpoint) = 0;
};

} // namespace fleetq::processing
