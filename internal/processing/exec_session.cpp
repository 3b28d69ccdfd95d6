#include "exec_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <future>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/processing/reply.hpp"
#include "internal/util/errors.hpp"

namespace fleetq::processing {

namespace bp = boost::process;

namespace {

class ExecSession final : public ProcessingSession {
 public:
  ExecSession(std::vector<std::string> command, std::chrono::milliseconds timeout,
              proxy::ProxyEndpoint endpoint)
      : command_(std::move(command)), timeout_(timeout), endpoint_(std::move(endpoint)) {
  }

  outcome::ProcessingOutcome Process(int64_t item_id) override {
    const auto exe = ResolveExecutable(command_.front());

    std::vector<std::string> args(command_.begin() + 1, command_.end());
    args.insert(args.end(), {"--item-id", std::to_string(item_id), "--proxy-server", endpoint_.server,
                             "--proxy-username", endpoint_.username, "--proxy-password", endpoint_.password});

    boost::asio::io_context  io;
    std::future<std::string> out;
    bp::child                child(exe, bp::args(args), bp::std_out > out, bp::std_err > bp::null, bp::std_in < bp::null,
                                   io);

    io.run_for(timeout_);
    if (child.running()) {
      std::error_code ec;
      child.terminate(ec);
      child.wait(ec);
      FLEETQ_LOG_WARN("processor timed out", {observability::IntField("item_id", item_id),
                                               observability::IntField("timeout_ms", timeout_.count())});
      return Unexpected("processor timed out after " + std::to_string(timeout_.count()) + "ms");
    }
    child.wait();

    if (child.exit_code() != 0) {
      return Unexpected("processor exited with code " + std::to_string(child.exit_code()));
    }
    return ParseReply(out.get());
  }

 private:
  static boost::filesystem::path ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) return name;
    auto found = bp::search_path(name);
    if (found.empty()) throw std::runtime_error("processor command '" + name + "' not found in PATH");
    return found;
  }

  static outcome::ProcessingOutcome Unexpected(std::string reason) {
    outcome::ProcessingOutcome out;
    out.classification = outcome::Classification::kUnexpected;
    out.failure_reason = std::move(reason);
    return out;
  }

  std::vector<std::string>        command_;
  std::chrono::milliseconds       timeout_;
  proxy::ProxyEndpoint            endpoint_;
};

} // namespace

ExecSessionFactory::ExecSessionFactory(std::vector<std::string> command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {
  if (command_.empty()) throw util::InvalidArgument("processor.command must name an executable");
}

std::unique_ptr<ProcessingSession> ExecSessionFactory::Open(const proxy::ProxyEndpoint& endpoint) {
  return std::make_unique<ExecSession>(command_, timeout_, endpoint);
}

} // namespace fleetq::processing
