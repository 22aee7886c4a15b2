#include "../src/session/SessionRegistry.hpp"
#include "../src/session/IdleSessionReaper.hpp"
#include "../src/trainers/SentenceGenerator.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

constexpr std::time_t kNow = 1700000000;
constexpr std::time_t kDay = 24 * 60 * 60;

// Parks inside generateSentence until the test opens the gate.
class GatedGenerator : public SentenceGenerator {
public:
  explicit GatedGenerator(std::shared_future<void> gate) : gate_(std::move(gate)) {}

  std::optional<std::string> generateSentence(const std::string& term, const std::string&) override {
    entered_.set_value();
    gate_.wait();
    return "They say " + term + " twice.";
  }

  std::future<void> entered() { return entered_.get_future(); }

private:
  std::shared_future<void> gate_;
  std::promise<void> entered_;
};

std::vector<Item> due_items(int count) {
  std::vector<Item> items;
  for (int i = 0; i < count; ++i) {
    items.emplace_back("front " + std::to_string(i), "back " + std::to_string(i));
  }
  return items;
}

std::vector<Item> nothing_due() {
  Item later("later", "not yet");
  later.review_count = 2;
  later.next_review = kNow + 5 * kDay;
  return {later};
}

void test_begin_get_end(TestSuite& suite) {
  SessionRegistry registry(TrainerOptions{});
  std::vector<Item> items = due_items(3);

  BeginResult first = registry.begin("alice", items, TrainingMode::STANDARD, kNow);
  suite.require(first.status == BeginStatus::STARTED, "first begin starts a session");
  suite.require(first.session != nullptr && first.items_due == 3, "started session reports items due");
  suite.require(registry.activeCount() == 1, "one active session");

  BeginResult second = registry.begin("alice", items, TrainingMode::MULTIPLE_CHOICE, kNow);
  suite.require(second.status == BeginStatus::ALREADY_ACTIVE, "second begin is refused");
  suite.require(second.session == first.session, "refusal hands back the active session");
  suite.require(second.session->mode() == TrainingMode::STANDARD, "active session keeps its mode");

  suite.require(registry.get("alice") == first.session, "get returns the active session");
  suite.require(registry.get("nobody") == nullptr, "get for an unknown user is null");

  auto summary = registry.end("alice");
  suite.require(summary.has_value() && summary->user_id == "alice", "end returns the summary");
  suite.require(registry.get("alice") == nullptr, "ended session is gone");
  suite.require(first.session->state() == SessionState::ENDED, "removed session is ended");
  suite.require(!registry.end("alice").has_value(), "ending twice yields nothing");
  suite.require(!registry.end("nobody").has_value(), "ending an unknown user yields nothing");

  BeginResult again = registry.begin("alice", items, TrainingMode::STANDARD, kNow);
  suite.require(again.status == BeginStatus::STARTED && again.session != first.session,
                "a fresh session can start after end");
}

void test_begin_refusals(TestSuite& suite) {
  SessionRegistry registry(TrainerOptions{});

  BeginResult empty = registry.begin("bob", nothing_due(), TrainingMode::STANDARD, kNow);
  suite.require(empty.status == BeginStatus::NOTHING_DUE, "nothing due is reported");
  suite.require(empty.session == nullptr && registry.get("bob") == nullptr, "no session is stored");

  BeginResult cloze = registry.begin("bob", due_items(2), TrainingMode::FILL_IN_BLANK, kNow);
  suite.require(cloze.status == BeginStatus::MODE_UNAVAILABLE, "cloze without generator is unavailable");
  suite.require(registry.activeCount() == 0, "unavailable mode stores nothing");

  SessionRegistry capped(TrainerOptions{}, 4);
  BeginResult truncated = capped.begin("bob", due_items(9), TrainingMode::STANDARD, kNow);
  suite.require(truncated.items_due == 4, "registry passes the queue cap to sessions");
}

void test_concurrent_users(TestSuite& suite) {
  SessionRegistry registry(TrainerOptions{});
  const std::vector<Item> items = due_items(2);

  std::vector<std::thread> workers;
  std::atomic<int> started{0};
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&, i] {
      BeginResult r = registry.begin("user" + std::to_string(i), items, TrainingMode::STANDARD, kNow);
      if (r.status == BeginStatus::STARTED) ++started;
    });
  }
  for (auto& t : workers) t.join();

  suite.require(started == 8, "every user gets a session");
  suite.require(registry.activeCount() == 8, "eight sessions are active");
  suite.require(registry.snapshot().size() == 8, "snapshot lists every session");
}

void test_concurrent_same_user(TestSuite& suite) {
  SessionRegistry registry(TrainerOptions{});
  const std::vector<Item> items = due_items(2);

  std::vector<std::thread> workers;
  std::atomic<int> started{0};
  std::atomic<int> refused{0};
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&] {
      BeginResult r = registry.begin("carol", items, TrainingMode::STANDARD, kNow);
      if (r.status == BeginStatus::STARTED) ++started;
      else if (r.status == BeginStatus::ALREADY_ACTIVE) ++refused;
    });
  }
  for (auto& t : workers) t.join();

  suite.require(started == 1, "exactly one concurrent begin wins");
  suite.require(refused == 7, "the others see the active session");
  suite.require(registry.activeCount() == 1, "one session for the user");
}

void test_slow_render_does_not_block_others(TestSuite& suite) {
  std::promise<void> gate;
  auto generator = std::make_shared<GatedGenerator>(gate.get_future().share());
  std::future<void> entered = generator->entered();

  TrainerOptions options;
  options.generator = generator;
  SessionRegistry registry(options);

  BeginResult a = registry.begin("dana", due_items(1), TrainingMode::FILL_IN_BLANK, kNow);
  suite.require(a.status == BeginStatus::STARTED, "cloze session starts with a generator");
  if (a.status != BeginStatus::STARTED) {
    gate.set_value();
    return;
  }

  std::shared_ptr<ReviewSession> session = a.session;
  auto pending = std::async(std::launch::async, [session] { return session->advance(); });
  suite.require(entered.wait_for(std::chrono::seconds(5)) == std::future_status::ready,
                "generator is reached");

  BeginResult b = registry.begin("eve", due_items(2), TrainingMode::STANDARD, kNow);
  suite.require(b.status == BeginStatus::STARTED, "another user starts while a render is pending");
  auto next = b.session->advance();
  suite.require(std::holds_alternative<Presentation>(next), "another user advances meanwhile");
  (void)b.session->grade("5", kNow);
  suite.require(registry.end("eve").has_value(), "another user ends meanwhile");
  suite.require(pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready,
                "the slow render is still pending");

  gate.set_value();
  auto rendered = pending.get();
  const Presentation* p = std::get_if<Presentation>(&rendered);
  suite.require(p != nullptr && p->blanked_sentence.value_or("") == "They say ____________ twice.",
                "slow render completes once released");
}

void test_idle_reaper(TestSuite& suite) {
  SessionRegistry registry(TrainerOptions{});
  IdleSessionReaper reaper(registry, std::chrono::minutes(30));

  registry.begin("frank", due_items(1), TrainingMode::STANDARD, kNow);
  registry.begin("gwen", due_items(1), TrainingMode::STANDARD, kNow);

  const std::time_t now = std::time(nullptr);
  suite.require(reaper.reap(now).empty(), "fresh sessions are not evicted");
  suite.require(registry.activeCount() == 2, "both sessions survive");

  auto evicted = reaper.reap(now + 31 * 60);
  suite.require(evicted.size() == 2, "idle sessions are evicted after the limit");
  suite.require(registry.activeCount() == 0, "evicted sessions leave the registry");
  suite.require(evicted.size() == 2 && evicted[0].second.items_reviewed == 0,
                "evicted sessions report their summary");
}

void test_reaper_spares_replaced_session(TestSuite& suite) {
  SessionRegistry registry(TrainerOptions{});
  IdleSessionReaper reaper(registry, std::chrono::minutes(30));

  BeginResult stale = registry.begin("hugo", due_items(1), TrainingMode::STANDARD, kNow);
  auto idle = reaper.idleSessions(std::time(nullptr) + 31 * 60);
  suite.require(idle.size() == 1 && idle[0].second == stale.session, "idle session is a candidate");

  // the user restarts between the idle check and the eviction
  suite.require(registry.end("hugo").has_value(), "user ends the idle session");
  BeginResult fresh = registry.begin("hugo", due_items(1), TrainingMode::STANDARD, kNow);
  suite.require(fresh.status == BeginStatus::STARTED, "user starts a new session");

  suite.require(reaper.evict(idle).empty(), "replaced session is not evicted");
  suite.require(registry.get("hugo") == fresh.session, "new session stays registered");
  suite.require(fresh.session->state() == SessionState::READY, "new session is still live");

  suite.require(!registry.endIf("hugo", stale.session).has_value(), "guarded end ignores a stale session");
  suite.require(registry.endIf("hugo", fresh.session).has_value(), "guarded end removes the current session");
  suite.require(registry.get("hugo") == nullptr, "guarded end unregisters it");
}

} // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  TestSuite suite;

  test_begin_get_end(suite);
  test_begin_refusals(suite);
  test_concurrent_users(suite);
  test_concurrent_same_user(suite);
  test_slow_render_does_not_block_others(suite);
  test_idle_reaper(suite);
  test_reaper_spares_replaced_session(suite);

  if (!suite.ok) {
    std::cerr << "Session registry tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Session registry tests passed" << std::endl;
  return 0;
}
