#include "loader.hpp"

#include <charconv>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/proxy/proxy_endpoint.hpp"
#include "internal/proxy/proxy_pool.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/util/errors.hpp"

namespace fleetq::loader {

namespace {

std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

void LogRejected(const char* kind, uint64_t line_no, std::string_view reason) {
  FLEETQ_LOG_WARN("skipping malformed line",
                  {observability::StringField("kind", kind), observability::IntField("line", static_cast<int64_t>(line_no)),
                   observability::StringField("reason", reason)});
}

void LogSummary(const char* kind, LoadMode mode, const LoadStats& stats) {
  FLEETQ_LOG_INFO("load finished", {observability::StringField("kind", kind),
                                     observability::StringField("mode", mode == LoadMode::kAppend ? "append" : "overwrite"),
                                     observability::IntField("removed", static_cast<int64_t>(stats.removed)),
                                     observability::IntField("inserted", static_cast<int64_t>(stats.inserted)),
                                     observability::IntField("duplicates", static_cast<int64_t>(stats.duplicates)),
                                     observability::IntField("invalid", static_cast<int64_t>(stats.invalid))});
}

// Calls `fn(text, line_no)` for every non-blank line.
template <typename Fn>
void ForEachLine(std::istream& in, Fn&& fn) {
  std::string line;
  uint64_t    line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto text = Trim(line);
    if (!text.empty()) fn(text, line_no);
  }
}

template <typename Value, typename Replace>
void Overwrite(const char* kind, const std::vector<Value>& values, LoadStats& stats, Replace&& replace) {
  if (values.empty()) {
    FLEETQ_LOG_WARN("nothing valid to load, overwrite skipped", {observability::StringField("kind", kind)});
    return;
  }

  const auto replaced = replace(values);
  stats.removed       = replaced.removed;
  stats.inserted      = replaced.inserted;
  stats.duplicates    = replaced.duplicates;
}

} // namespace

LoadStats LoadTasks(std::istream& in, queue::TaskQueue& queue, uint32_t max_attempts, LoadMode mode) {
  LoadStats            stats;
  std::vector<int64_t> item_ids;

  ForEachLine(in, [&](std::string_view text, uint64_t line_no) {
    int64_t    item_id = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), item_id);
    if (ec != std::errc() || end != text.data() + text.size()) {
      ++stats.invalid;
      LogRejected("task", line_no, "not an integer item id");
      return;
    }

    if (mode == LoadMode::kOverwrite) {
      item_ids.push_back(item_id);
    } else if (queue.Enqueue(item_id, max_attempts)) {
      ++stats.inserted;
    } else {
      ++stats.duplicates;
    }
  });

  if (mode == LoadMode::kOverwrite) {
    Overwrite("tasks", item_ids, stats, [&](const auto& ids) { return queue.ReplaceAll(ids, max_attempts); });
  }

  LogSummary("tasks", mode, stats);
  return stats;
}

LoadStats LoadProxies(std::istream& in, proxy::ProxyPool& pool, LoadMode mode) {
  LoadStats                stats;
  std::vector<std::string> connections;

  ForEachLine(in, [&](std::string_view text, uint64_t line_no) {
    try {
      if (mode == LoadMode::kOverwrite) {
        proxy::ParseProxyEndpoint(std::string(text));
        connections.emplace_back(text);
      } else if (pool.Add(std::string(text))) {
        ++stats.inserted;
      } else {
        ++stats.duplicates;
      }
    } catch (const util::InvalidArgument& e) {
      ++stats.invalid;
      LogRejected("proxy", line_no, e.what());
    }
  });

  if (mode == LoadMode::kOverwrite) {
    Overwrite("proxies", connections, stats, [&](const auto& list) { return pool.ReplaceAll(list); });
  }

  LogSummary("proxies", mode, stats);
  return stats;
}

} // namespace fleetq::loader
