#pragma once

#include <cstdint>
#include <string>

namespace fleetq::worker {

/*
  Worker identity: program:host:pid:run:lane

  run is a short random token minted once per process so a restarted
  process that reuses a pid does not collide with its dead predecessor's
  rows.
*/
struct ProcessIdentity {
  std::string program_id;
  std::string host;
  int64_t     pid = 0;
  std::string run;
};

ProcessIdentity CurrentProcessIdentity(const std::string& program_id);

std::string MakeWorkerId(const ProcessIdentity& identity, uint32_t lane);

} // namespace fleetq::worker
