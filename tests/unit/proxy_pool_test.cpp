#include "internal/proxy/proxy_pool.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <utility>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/proxy/proxy_lease.hpp"
#include "internal/util/errors.hpp"
#include "support/backends.hpp"
#include "support/fake_clock.hpp"

namespace {

using namespace std::chrono_literals;
using fleetq::model::ProxyStatus;
using fleetq::proxy::ProxyLease;
using fleetq::proxy::ProxyPool;
using fleetq::testing::Backend;
using fleetq::testing::FakeClock;

constexpr const char* kP1 = "10.0.0.1:8080:u1:p1";
constexpr const char* kP2 = "10.0.0.2:8080:u2:p2";

void TestAddValidatesAndDeduplicates(const Backend& backend) {
  FakeClock clock;
  ProxyPool pool(backend.make(), clock.Fn());

  assert(pool.Add(kP1));
  assert(!pool.Add(kP1));

  bool threw = false;
  try {
    pool.Add("10.0.0.3:8080");
  } catch (const fleetq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto p = pool.Get(1);
  assert(p);
  assert(p->proxy == kP1);
  assert(p->status == ProxyStatus::kAvailable);
  assert(p->uses_count == 0 && p->blocks_count == 0);
  assert(!pool.Get(2));
}

void TestLeastUsedFirst(const Backend& backend) {
  FakeClock clock;
  ProxyPool pool(backend.make(), clock.Fn());
  assert(pool.Add(kP1));
  assert(pool.Add(kP2));

  auto first = pool.Claim("w1");
  assert(first && first->id == 1);
  assert(first->status == ProxyStatus::kLocked);
  assert(first->locked_by == "w1");
  assert(first->locked_at_ms == clock.NowMs());
  assert(first->last_used_at_ms == clock.NowMs());
  assert(first->uses_count == 1);

  // P1 locked, so P2 even though the ids tie-break would favour P1
  auto second = pool.Claim("w2");
  assert(second && second->id == 2);
  assert(!pool.Claim("w3"));

  clock.Advance(1s);
  assert(!pool.Release(1, "w2"));
  assert(pool.Release(1, "w1"));
  assert(pool.Release(2, "w2"));
  assert(!pool.Release(2, "w2"));

  auto released = pool.Get(1);
  assert(released->status == ProxyStatus::kAvailable);
  assert(released->locked_by.empty());
  assert(released->locked_at_ms == 0);
  assert(released->last_used_at_ms == clock.NowMs());

  // both used once: lowest id wins the tie
  assert(pool.Claim("w1")->id == 1);
  // P2 now has fewer uses
  assert(pool.Claim("w2")->id == 2);
}

void TestBlockThreshold(const Backend& backend) {
  FakeClock clock;
  ProxyPool pool(backend.make(), clock.Fn(), 3);
  assert(pool.Add(kP1));
  assert(pool.Add(kP2));

  for (uint32_t round = 1; round <= 2; ++round) {
    auto p = pool.Claim("w1");
    assert(p && p->id == 1);
    auto blocked = pool.MarkBlocked(p->id, "w1");
    assert(blocked);
    assert(blocked->blocks_count == round);
    assert(blocked->status == ProxyStatus::kAvailable);
    assert(blocked->locked_by.empty());
    // keep P2 busy so the next claim lands on P1 again
    if (round == 1) assert(pool.Claim("holder")->id == 2);
  }

  // not held by the caller and not available: refused
  assert(!pool.MarkBlocked(2, "w1"));

  // counting a block against an available proxy is allowed
  auto third = pool.MarkBlocked(1, "w9");
  assert(third);
  assert(third->blocks_count == 3);
  assert(third->status == ProxyStatus::kBlocked);

  // blocked is terminal
  assert(!pool.MarkBlocked(1, "w9"));
  assert(!pool.ClaimPreferred(1, "w1"));
  assert(pool.Release(2, "holder"));
  for (int i = 0; i < 4; ++i) {
    auto p = pool.Claim("w1");
    assert(p && p->id == 2);
    assert(pool.Release(p->id, "w1"));
  }
  assert(pool.Get(1)->status == ProxyStatus::kBlocked);
}

void TestClaimPreferred(const Backend& backend) {
  FakeClock clock;
  ProxyPool pool(backend.make(), clock.Fn());
  assert(pool.Add(kP1));
  assert(pool.Add(kP2));

  auto p2 = pool.ClaimPreferred(2, "w1");
  assert(p2 && p2->id == 2 && p2->locked_by == "w1");
  assert(!pool.ClaimPreferred(2, "w2"));
  assert(!pool.ClaimPreferred(99, "w2"));
}

void TestLeaseReleasesOnScopeExit(const Backend& backend) {
  FakeClock clock;
  ProxyPool pool(backend.make(), clock.Fn());
  assert(pool.Add(kP1));

  {
    auto lease = ProxyLease::Acquire(pool, "w1");
    assert(lease && lease->Active());
    assert(lease->Endpoint().server == "http://10.0.0.1:8080");
    assert(lease->Endpoint().username == "u1");
    assert(pool.Get(1)->status == ProxyStatus::kLocked);
    assert(!ProxyLease::Acquire(pool, "w2"));
  }
  assert(pool.Get(1)->status == ProxyStatus::kAvailable);

  // moved-from lease owns nothing; the target releases once
  {
    auto a = ProxyLease::Acquire(pool, "w1");
    assert(a);
    ProxyLease b = std::move(*a);
    assert(!a->Active());
    assert(b.Active());
    assert(!a->Release());
    assert(b.Release());
    assert(!b.Active());
    assert(!b.Release());
  }
  assert(pool.Get(1)->status == ProxyStatus::kAvailable);

  {
    auto lease = ProxyLease::Acquire(pool, "w1");
    auto after = lease->Block();
    assert(after && after->blocks_count == 1);
    assert(!lease->Active());
  }
  auto p = pool.Get(1);
  assert(p->status == ProxyStatus::kAvailable);
  assert(p->blocks_count == 1);
  assert(p->uses_count == 3);
}

void TestLeasePrefersSessionProxy(const Backend& backend) {
  FakeClock clock;
  ProxyPool pool(backend.make(), clock.Fn());
  assert(pool.Add(kP1));
  assert(pool.Add(kP2));

  auto lease = ProxyLease::Acquire(pool, "w1", 2);
  assert(lease && lease->Id() == 2);
  lease->Release();

  // preferred proxy taken: falls back to the least used one
  assert(pool.Claim("other")->id == 1);
  auto fallback = ProxyLease::Acquire(pool, "w1", 1);
  assert(fallback && fallback->Id() == 2);
}

void TestMalformedRowIsCountedTowardBlocked(const Backend& backend) {
  FakeClock clock;
  auto      repo = backend.make();
  ProxyPool pool(repo, clock.Fn());

  fleetq::db::model::ProxyRecord bad;
  bad.proxy         = "not-a-proxy";
  bad.created_at_ms = clock.NowMs();
  auto inserted     = fleetq::db::RunInTransaction(*repo, 1, [&](fleetq::db::Transaction& tx) {
    return repo->InsertProxy(tx, bad);
  });
  assert(inserted);

  bool threw = false;
  try {
    ProxyLease::Acquire(pool, "w1");
  } catch (const fleetq::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto row = pool.Get(bad.id);
  assert(row->blocks_count == 1);
  assert(row->status == ProxyStatus::kAvailable);
}

} // namespace

int main() {
  for (const auto& backend : fleetq::testing::LocalBackends("proxy_pool")) {
    TestAddValidatesAndDeduplicates(backend);
    TestLeastUsedFirst(backend);
    TestBlockThreshold(backend);
    TestClaimPreferred(backend);
    TestLeaseReleasesOnScopeExit(backend);
    TestLeasePrefersSessionProxy(backend);
    TestMalformedRowIsCountedTowardBlocked(backend);
    std::cout << "  " << backend.name << " ok" << std::endl;
  }

  std::cout << "proxy_pool_test: pass" << std::endl;
  return 0;
}
