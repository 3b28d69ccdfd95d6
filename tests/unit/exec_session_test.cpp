#include "internal/processing/exec_session.hpp"

#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "internal/proxy/proxy_endpoint.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using fleetq::outcome::Classification;
using fleetq::processing::ExecSessionFactory;

// Appended arguments land in $1.. of the script:
//   $2 item id, $4 proxy server, $6 proxy username, $8 proxy password
std::vector<std::string> Shell(const std::string& script) {
  return {"/bin/sh", "-c", script, "sh"};
}

fleetq::proxy::ProxyEndpoint Endpoint() {
  return fleetq::proxy::ParseProxyEndpoint("10.0.0.1:8080:u1:p1");
}

void TestReplyFromStdout() {
  ExecSessionFactory factory(
      Shell(R"(echo "{\"classification\":\"content_found\",\"record\":{\"title\":\"item $2 via $4 as $6:$8\",)"
            R"(\"price\":99.5,\"characteristics\":{\"color\":\"red\"}}}")"),
      5s);
  auto session = factory.Open(Endpoint());

  auto out = session->Process(42);
  assert(out.classification == Classification::kContentFound);
  assert(out.record);
  assert(out.record->title == "item 42 via http://10.0.0.1:8080 as u1:p1");
  assert(out.record->price && *out.record->price == 99.5);
  assert(out.record->characteristics.at("color") == "red");

  // one process per attempt, same session
  out = session->Process(43);
  assert(out.record->title == "item 43 via http://10.0.0.1:8080 as u1:p1");
}

void TestFailedProcessIsUnexpected() {
  ExecSessionFactory factory(Shell("echo partial; exit 3"), 5s);
  auto               out = factory.Open(Endpoint())->Process(1);
  assert(out.classification == Classification::kUnexpected);
  assert(out.failure_reason.find("code 3") != std::string::npos);
}

void TestGarbageOutputIsUnexpected() {
  ExecSessionFactory factory(Shell("echo not-json"), 5s);
  auto               out = factory.Open(Endpoint())->Process(1);
  assert(out.classification == Classification::kUnexpected);
  assert(!out.failure_reason.empty());
}

void TestTimeoutKillsProcess() {
  ExecSessionFactory factory(Shell("sleep 5"), 200ms);

  const auto started = std::chrono::steady_clock::now();
  auto       out     = factory.Open(Endpoint())->Process(1);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(out.classification == Classification::kUnexpected);
  assert(out.failure_reason.find("timed out") != std::string::npos);
  assert(elapsed < 4s);
}

void TestBadCommand() {
  bool threw = false;
  try {
    ExecSessionFactory factory({}, 1s);
  } catch (const fleetq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ExecSessionFactory factory({"fleetq-no-such-processor"}, 1s);
    factory.Open(Endpoint())->Process(1);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReplyFromStdout();
  TestFailedProcessIsUnexpected();
  TestGarbageOutputIsUnexpected();
  TestTimeoutKillsProcess();
  TestBadCommand();

  std::cout << "exec_session_test: pass" << std::endl;
  return 0;
}
