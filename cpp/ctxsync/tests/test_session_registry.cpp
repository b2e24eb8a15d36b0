#include <ctxsync/session_registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <set>

using namespace std::chrono_literals;

namespace {

ctxsync::Session makeSession(
  ctxsync::SessionRegistry& registry, const std::string& user, ctxsync::TimePoint now
) {
  ctxsync::Session session;
  session.client_id = registry.nextClientId("10.0.0.1:4000");
  session.principal.user_id = user;
  session.principal.role = "user";
  session.authenticated_at = now;
  session.last_activity = now;
  session.transport = std::make_shared<ctxsync::test::FakeTransport>();
  return session;
}

}  // namespace

TEST_CASE("Client ids are 8 hex characters and unique") {
  ctxsync::SessionRegistry registry;
  std::set<std::string> ids;
  for (int i = 0; i < 500; ++i) {
    auto id = registry.nextClientId("127.0.0.1:1234");
    REQUIRE(id.size() == 8);
    REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    ids.insert(id);
  }
  REQUIRE(ids.size() == 500);
}

TEST_CASE("Sessions can be added, found and removed") {
  ctxsync::SessionRegistry registry;
  auto now = ctxsync::Clock::now();
  auto session = makeSession(registry, "alice", now);
  auto id = session.client_id;
  REQUIRE(registry.add(session) == ctxsync::CtxError::Ok);
  REQUIRE(registry.add(session) == ctxsync::CtxError::ValidationError);
  REQUIRE(registry.size() == 1);

  auto found = registry.find(id);
  REQUIRE(found.has_value());
  REQUIRE(found->principal.user_id == "alice");
  REQUIRE(registry.handles().size() == 1);

  auto removed = registry.remove(id);
  REQUIRE(removed.has_value());
  REQUIRE(registry.size() == 0);
  REQUIRE(!registry.remove(id).has_value());
  REQUIRE(!registry.find(id).has_value());
}

TEST_CASE("Touch updates last activity") {
  ctxsync::SessionRegistry registry;
  auto start = ctxsync::Clock::now();
  auto session = makeSession(registry, "alice", start);
  auto id = session.client_id;
  REQUIRE(registry.add(std::move(session)) == ctxsync::CtxError::Ok);

  REQUIRE(registry.touch(id, start + 5min));
  REQUIRE(registry.find(id)->last_activity == start + 5min);
  REQUIRE(!registry.touch("ffffffff", start));
}

TEST_CASE("Idle sessions are swept") {
  ctxsync::SessionRegistry registry(std::chrono::hours(24));
  auto start = ctxsync::Clock::now();
  auto idle = makeSession(registry, "idle", start);
  auto active = makeSession(registry, "active", start);
  auto idle_id = idle.client_id;
  auto active_id = active.client_id;
  REQUIRE(registry.add(std::move(idle)) == ctxsync::CtxError::Ok);
  REQUIRE(registry.add(std::move(active)) == ctxsync::CtxError::Ok);

  REQUIRE(registry.touch(active_id, start + 20h));
  REQUIRE(registry.sweepIdle(start + 23h).empty());

  auto swept = registry.sweepIdle(start + 25h);
  REQUIRE(swept.size() == 1);
  REQUIRE(swept[0].client_id == idle_id);
  REQUIRE(registry.size() == 1);
  REQUIRE(registry.find(active_id).has_value());
}

TEST_CASE("An idle timeout beyond the clock range never expires sessions") {
  ctxsync::SessionRegistry registry(std::chrono::seconds(10'000'000'000));
  auto start = ctxsync::Clock::now();
  auto session = makeSession(registry, "alice", start);
  auto id = session.client_id;
  REQUIRE(registry.add(std::move(session)) == ctxsync::CtxError::Ok);

  REQUIRE(registry.sweepIdle(start + 1s).empty());
  REQUIRE(registry.sweepIdle(start + 24h * 365 * 10).empty());
  REQUIRE(registry.find(id).has_value());
  REQUIRE(registry.idleTimeout() > 24h);
}

TEST_CASE("Refreshed credentials update the recorded expiry") {
  ctxsync::SessionRegistry registry;
  auto now = ctxsync::Clock::now();
  auto session = makeSession(registry, "alice", now);
  auto id = session.client_id;
  REQUIRE(registry.add(std::move(session)) == ctxsync::CtxError::Ok);

  REQUIRE(registry.setCredentialExpiry(id, now + 2h));
  REQUIRE(registry.find(id)->credential_expires_at == now + 2h);
  REQUIRE(!registry.setCredentialExpiry("00000000", now));
}
