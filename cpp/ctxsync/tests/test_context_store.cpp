#include <ctxsync/context_store.hpp>
#include <ctxsync/error.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using ctxsync::test::payloadOfSize;

TEST_CASE("Update stores an entry and reports totals") {
  ctxsync::ContextStore store(1000);
  auto result = store.update("a", payloadOfSize(40), "agent-1", 3);
  REQUIRE(result.has_value());
  REQUIRE(result->accepted);
  REQUIRE(result->key == "a");
  REQUIRE(result->token_count == 40);
  REQUIRE(result->total_tokens == 40);
  REQUIRE(result->entry_count == 1);
  REQUIRE(result->evicted == 0);
  REQUIRE(result->version == 1);

  auto entry = store.find("a");
  REQUIRE(entry.has_value());
  REQUIRE(entry->source == "agent-1");
  REQUIRE(entry->priority == 3);
  REQUIRE(entry->payload == payloadOfSize(40));
}

TEST_CASE("Priority defaults to 1 and is clamped") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("default", payloadOfSize(10), "s").has_value());
  REQUIRE(store.update("low", payloadOfSize(10), "s", -4).has_value());
  REQUIRE(store.update("high", payloadOfSize(10), "s", 99).has_value());
  REQUIRE(store.find("default")->priority == 1);
  REQUIRE(store.find("low")->priority == 1);
  REQUIRE(store.find("high")->priority == 10);
}

TEST_CASE("Writing the same key twice replaces the entry") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("a", payloadOfSize(30), "first").has_value());
  auto first = store.find("a");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto result = store.update("a", payloadOfSize(50), "second");
  REQUIRE(result.has_value());
  REQUIRE(result->entry_count == 1);
  REQUIRE(result->total_tokens == 50);

  auto snapshot = store.get();
  REQUIRE(snapshot.entryCount() == 1);
  const auto& entry = snapshot.entries.at("a");
  REQUIRE(entry.payload == payloadOfSize(50));
  REQUIRE(entry.source == "second");
  REQUIRE(entry.timestamp >= first->timestamp);
  REQUIRE(entry.sequence > first->sequence);
}

TEST_CASE("Higher priority entries survive eviction") {
  ctxsync::ContextStore store(100);
  REQUIRE(store.update("a", payloadOfSize(60), "s", 5).has_value());
  auto result = store.update("b", payloadOfSize(60), "s", 1);
  REQUIRE(result.has_value());
  REQUIRE(result->accepted);
  REQUIRE(result->evicted == 1);

  auto snapshot = store.get();
  REQUIRE(snapshot.entryCount() == 1);
  REQUIRE(snapshot.entries.count("a") == 1);
  REQUIRE(snapshot.total_tokens == 60);
  REQUIRE(snapshot.evicted_total == 1);
}

TEST_CASE("Eviction drops lower priority first, then older entries") {
  ctxsync::ContextStore store(100);
  REQUIRE(store.update("A", payloadOfSize(40), "s", 5).has_value());
  REQUIRE(store.update("B", payloadOfSize(40), "s", 5).has_value());
  auto result = store.update("C", payloadOfSize(40), "s", 3);
  REQUIRE(result.has_value());
  REQUIRE(result->evicted == 1);
  REQUIRE(store.find("C") == std::nullopt);
  REQUIRE(store.find("A").has_value());
  REQUIRE(store.find("B").has_value());

  // Among equal priorities the most recent write wins, so A goes next.
  auto shrink = store.update("B", payloadOfSize(70), "s", 5);
  REQUIRE(shrink.has_value());
  REQUIRE(shrink->evicted == 1);
  REQUIRE(store.find("A") == std::nullopt);
  REQUIRE(store.find("B").has_value());
  REQUIRE(store.totalTokens() == 70);
}

TEST_CASE("A single oversized write is kept alone") {
  ctxsync::ContextStore store(100);
  REQUIRE(store.update("small", payloadOfSize(20), "s", 1).has_value());
  auto result = store.update("huge", payloadOfSize(250), "s", 10);
  REQUIRE(result.has_value());
  REQUIRE(result->accepted);
  REQUIRE(result->entry_count == 1);
  REQUIRE(result->total_tokens == 250);
  REQUIRE(store.find("huge").has_value());
  REQUIRE(store.find("small") == std::nullopt);
}

TEST_CASE("Token budget holds after every update") {
  ctxsync::ContextStore store(200);
  for (int i = 0; i < 50; ++i) {
    auto size = static_cast<size_t>(10 + (i * 37) % 120);
    auto result = store.update("key" + std::to_string(i % 13), payloadOfSize(size), "s", i % 10);
    REQUIRE(result.has_value());
    auto snapshot = store.get();
    uint64_t sum = 0;
    for (const auto& [key, entry] : snapshot.entries) {
      sum += entry.token_count;
    }
    REQUIRE(sum == snapshot.total_tokens);
    bool within_budget = snapshot.total_tokens <= snapshot.max_tokens;
    bool single_oversized = snapshot.entryCount() == 1;
    REQUIRE((within_budget || single_oversized));
  }
}

TEST_CASE("Clear with no keys is idempotent") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("a", payloadOfSize(10), "s").has_value());
  REQUIRE(store.update("b", payloadOfSize(10), "s").has_value());

  auto first = store.clear();
  REQUIRE(first.removed == 2);
  REQUIRE(first.total_tokens == 0);
  REQUIRE(first.entry_count == 0);

  auto second = store.clear();
  REQUIRE(second.removed == 0);
  REQUIRE(second.total_tokens == 0);
  REQUIRE(store.get().entries.empty());
  REQUIRE(second.version > first.version);
}

TEST_CASE("Clear removes only the named keys") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("a", payloadOfSize(10), "s").has_value());
  REQUIRE(store.update("b", payloadOfSize(20), "s").has_value());
  auto result = store.clear(std::vector<std::string>{"a", "missing"});
  REQUIRE(result.removed == 1);
  REQUIRE(result.total_tokens == 20);
  REQUIRE(result.entry_count == 1);
  REQUIRE(store.find("b").has_value());
}

TEST_CASE("clearIf removes nothing when any targeted entry is rejected") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("mine", payloadOfSize(10), "bob").has_value());
  REQUIRE(store.update("theirs", payloadOfSize(10), "alice").has_value());
  auto before = store.version();
  auto bobOnly = [](const ctxsync::Entry& entry) {
    return entry.source == "bob";
  };

  auto denied = store.clearIf(std::vector<std::string>{"mine", "theirs"}, bobOnly);
  REQUIRE(!denied.has_value());
  REQUIRE(denied.error() == ctxsync::CtxError::PermissionDenied);
  REQUIRE(store.size() == 2);
  REQUIRE(store.version() == before);

  auto everything = store.clearIf(std::nullopt, bobOnly);
  REQUIRE(!everything.has_value());
  REQUIRE(store.size() == 2);

  auto allowed = store.clearIf(std::vector<std::string>{"mine", "missing"}, bobOnly);
  REQUIRE(allowed.has_value());
  REQUIRE(allowed->removed == 1);
  REQUIRE(store.find("theirs").has_value());
  REQUIRE(store.version() == before + 1);
}

TEST_CASE("clearIf judges the entry that is current when it runs") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("k", payloadOfSize(10), "bob").has_value());
  // The key changes hands before the clear is applied.
  REQUIRE(store.update("k", payloadOfSize(10), "alice").has_value());

  std::vector<std::string> seen;
  auto result = store.clearIf(std::vector<std::string>{"k"}, [&seen](const ctxsync::Entry& entry) {
    seen.push_back(entry.source);
    return entry.source == "bob";
  });
  REQUIRE(!result.has_value());
  REQUIRE(seen == std::vector<std::string>{"alice"});
  REQUIRE(store.find("k")->source == "alice");
}

TEST_CASE("clearSource removes exactly one producer's entries") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("a1", payloadOfSize(10), "alice").has_value());
  REQUIRE(store.update("a2", payloadOfSize(10), "alice").has_value());
  REQUIRE(store.update("b1", payloadOfSize(10), "bob").has_value());

  auto result = store.clearSource("alice");
  REQUIRE(result.removed == 2);
  REQUIRE(result.entry_count == 1);
  REQUIRE(result.total_tokens == 10);
  REQUIRE(store.find("b1").has_value());
}

TEST_CASE("Later commits carry later timestamps") {
  ctxsync::ContextStore store(1000000);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, t] {
      for (int i = 0; i < 50; ++i) {
        (void)store.update(
          "w" + std::to_string(t) + "-" + std::to_string(i), payloadOfSize(10), "s"
        );
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  auto snapshot = store.get();
  std::vector<ctxsync::Entry> entries;
  for (const auto& [key, entry] : snapshot.entries) {
    entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
    return a.sequence < b.sequence;
  });
  for (size_t i = 1; i < entries.size(); ++i) {
    REQUIRE(entries[i - 1].timestamp <= entries[i].timestamp);
  }
}

TEST_CASE("Query filters are conjunctive") {
  ctxsync::ContextStore store(1000);
  REQUIRE(store.update("a1", payloadOfSize(10), "alice", 2).has_value());
  REQUIRE(store.update("a2", payloadOfSize(10), "alice", 7).has_value());
  REQUIRE(store.update("b1", payloadOfSize(10), "bob", 9).has_value());

  ctxsync::QueryFilter everything;
  REQUIRE(store.query(everything).size() == 3);

  ctxsync::QueryFilter by_source;
  by_source.source = "alice";
  auto alice = store.query(by_source);
  REQUIRE(alice.size() == 2);
  REQUIRE(alice[0].key == "a1");
  REQUIRE(alice[1].key == "a2");

  ctxsync::QueryFilter both;
  both.source = "alice";
  both.min_priority = 5;
  auto matches = store.query(both);
  REQUIRE(matches.size() == 1);
  REQUIRE(matches[0].key == "a2");
}

TEST_CASE("setPriority re-ranks entries for eviction") {
  ctxsync::ContextStore store(100);
  REQUIRE(store.update("old", payloadOfSize(50), "s", 1).has_value());
  REQUIRE(store.update("new", payloadOfSize(50), "s", 1).has_value());

  auto raised = store.setPriority("old", 8);
  REQUIRE(raised.has_value());
  REQUIRE(raised->priority == 8);
  REQUIRE(raised->evicted == 0);

  // Growing "new" now evicts it rather than "old".
  REQUIRE(store.update("new", payloadOfSize(60), "s", 1).has_value());
  REQUIRE(store.find("old").has_value());
  REQUIRE(store.find("new") == std::nullopt);
}

TEST_CASE("setPriority on a missing key fails") {
  ctxsync::ContextStore store(100);
  auto result = store.setPriority("nope", 3);
  REQUIRE(!result.has_value());
  REQUIRE(result.error() == ctxsync::CtxError::NotFound);
  REQUIRE(store.version() == 0);
}

TEST_CASE("Unserializable payloads are rejected") {
  ctxsync::ContextStore store(100);
  auto result = store.update("bad", ctxsync::Payload{{"text", "\xff\xfe"}}, "s");
  REQUIRE(!result.has_value());
  REQUIRE(result.error() == ctxsync::CtxError::ValidationError);
  REQUIRE(store.size() == 0);
  REQUIRE(store.version() == 0);
}

TEST_CASE("Concurrent writers never break the budget") {
  ctxsync::ContextStore store(500);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, t] {
      for (int i = 0; i < 100; ++i) {
        auto key = "w" + std::to_string(t) + "-" + std::to_string(i % 7);
        (void)store.update(key, payloadOfSize(20 + static_cast<size_t>(i % 50)), "s", i % 10);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  auto snapshot = store.get();
  REQUIRE(snapshot.total_tokens <= snapshot.max_tokens);
  REQUIRE(snapshot.version == 400);
}
