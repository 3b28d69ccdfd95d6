#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/processing/session.hpp"

namespace fleetq::processing {

/*
  Runs an external command once per attempt:

    <command...> --item-id <id> --proxy-server <url>
                 --proxy-username <user> --proxy-password <pass>

  and reads one ProcessingReply JSON object from its stdout. A non-zero
  exit, a timeout (the child is killed) or unparsable output all map to
  kUnexpected. Failure to start the command throws.
*/
class ExecSessionFactory final : public SessionFactory {
 public:
  ExecSessionFactory(std::vector<std::string> command, std::chrono::milliseconds timeout);

  std::unique_ptr<ProcessingSession> Open(const proxy::ProxyEndpoint& endpoint) override;

 private:
  std::vector<std::string>  command_;
  std::chrono::milliseconds timeout_;
};

} // namespace fleetq::processing
