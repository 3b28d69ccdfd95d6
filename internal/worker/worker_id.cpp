#include "worker_id.hpp"

#include <unistd.h>

#include <climits>

#include "internal/util/run_token.hpp"

namespace fleetq::worker {

namespace {

std::string Hostname() {
  char buf[HOST_NAME_MAX + 1] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "unknown";
  }
  return buf;
}

} // namespace

ProcessIdentity CurrentProcessIdentity(const std::string& program_id) {
  ProcessIdentity identity;
  identity.program_id = program_id;
  identity.host       = Hostname();
  identity.pid        = static_cast<int64_t>(getpid());
  identity.run        = util::NewRunToken();
  return identity;
}

std::string MakeWorkerId(const ProcessIdentity& identity, uint32_t lane) {
  return identity.program_id + ":" + identity.host + ":" + std::to_string(identity.pid) + ":" + identity.run + ":" +
         std::to_string(lane);
}

} // namespace fleetq::worker
