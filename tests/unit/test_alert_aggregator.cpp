#include "authgate/AlertAggregator.h"
#include "../support/Fixtures.h"
#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using namespace authgate;
using namespace authgate::testing;

void test_alert_aggregator() {
  const TimeMs now = fixed_now_ms();
  InMemoryAlertStore store;
  AlertAggregator agg(store);

  auto r0 = agg.count_recent("s1", 15, now);
  assert(r0.ok && r0.count.high == 0 && r0.count.medium == 0);
  assert(r0.count.session_id == "s1");

  store.append(AlertRecord{"s1", now - 60000, StrideCategory::DenialOfService, Severity::High, "siem"});
  store.append(AlertRecord{"s1", now - 14 * 60000, StrideCategory::Spoofing, Severity::Medium, "siem"});
  store.append(AlertRecord{"s1", now - 16 * 60000, StrideCategory::Spoofing, Severity::High, "siem"});
  store.append(AlertRecord{"s1", now - 1000, StrideCategory::Tampering, Severity::Low, "siem"});
  store.append(AlertRecord{"s2", now - 1000, StrideCategory::Tampering, Severity::High, "siem"});
  store.append(AlertRecord{"s1", now + 5000, StrideCategory::Tampering, Severity::High, "siem"});

  auto r = agg.count_recent("s1", 15, now);
  assert(r.ok);
  assert(r.count.high == 1);
  assert(r.count.medium == 1);

  // Window boundary is inclusive.
  auto edge = agg.count_recent("s1", 16, now);
  assert(edge.count.high == 2);

  // Counting is read-only.
  assert(store.size() == 6);
  assert(agg.count_recent("s1", 15, now).count.high == 1);

  FailingAlertStore down;
  AlertAggregator broken(down);
  auto f = broken.count_recent("s1", 15, now);
  assert(!f.ok);
  assert(!f.error.empty());

  // Concurrent writers never disturb a reader's snapshot.
  InMemoryAlertStore busy;
  std::thread writer([&busy, now] {
    for (int i = 0; i < 500; ++i) {
      busy.append(AlertRecord{"hot", now - 1000, StrideCategory::DenialOfService, Severity::High, "siem"});
    }
  });
  AlertAggregator reader(busy);
  uint32_t last = 0;
  for (int i = 0; i < 200; ++i) {
    auto c = reader.count_recent("hot", 15, now);
    assert(c.ok && c.count.high >= last);
    last = c.count.high;
  }
  writer.join();
  assert(reader.count_recent("hot", 15, now).count.high == 500);

  // A large history: appends and reads only touch their own session.
  InMemoryAlertStore big;
  auto started = std::chrono::steady_clock::now();
  for (int i = 0; i < 40000; ++i) {
    big.append(AlertRecord{"s-" + std::to_string(i % 1000), now - 1000, StrideCategory::Spoofing,
                           i % 2 ? Severity::High : Severity::Medium, "siem"});
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  assert(elapsed.count() < 5000);
  assert(big.size() == 40000);
  assert(big.session_count() == 1000);
  AlertAggregator big_reader(big);
  auto one = big_reader.count_recent("s-7", 15, now);
  assert(one.ok && one.count.high == 40 && one.count.medium == 0);
  auto two = big_reader.count_recent("s-8", 15, now);
  assert(two.ok && two.count.high == 0 && two.count.medium == 40);
  assert(big_reader.count_recent("s-unknown", 15, now).count.high == 0);
}
