#include "../src/session/ReviewSession.hpp"
#include "../src/trainers/ClozeTrainer.hpp"
#include "../src/trainers/SentenceGenerator.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
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

class EchoGenerator : public SentenceGenerator {
public:
  std::optional<std::string> generateSentence(const std::string& term, const std::string&) override {
    return term + " is the capital of France.";
  }
};

std::vector<Item> new_items(int count) {
  std::vector<Item> items;
  for (int i = 0; i < count; ++i) {
    items.emplace_back("front " + std::to_string(i), "back " + std::to_string(i));
  }
  return items;
}

TrainerOptions no_generator() {
  return TrainerOptions{};
}

const Presentation* as_presentation(const ReviewSession::Next& next) {
  return std::get_if<Presentation>(&next);
}

void test_load_queue_order(TestSuite& suite) {
  Item a("A", "a");

  Item b("B", "b");
  b.review_count = 1;
  b.next_review = kNow - 2 * kDay;

  Item c("C", "c");
  c.review_count = 1;
  c.next_review = kNow + 3 * kDay;

  ReviewSession session("alice", TrainingMode::STANDARD, no_generator());
  suite.require(session.state() == SessionState::EMPTY, "new session starts empty");

  const std::size_t loaded = session.loadQueue({c, b, a}, kNow);
  suite.require(loaded == 2, "only due items are queued");
  suite.require(session.state() == SessionState::READY, "loaded queue makes the session ready");

  auto first = session.advance();
  const Presentation* p1 = as_presentation(first);
  suite.require(p1 != nullptr && p1->front == "A", "never-reviewed item comes first");
  (void)session.grade("5", kNow);

  auto second = session.advance();
  const Presentation* p2 = as_presentation(second);
  suite.require(p2 != nullptr && p2->front == "B", "overdue item follows");
  (void)session.grade("5", kNow);

  auto done = session.advance();
  suite.require(std::holds_alternative<QueueExhausted>(done), "C is never presented");
  suite.require(session.state() == SessionState::EMPTY, "drained queue returns to empty");
}

void test_queue_truncation(TestSuite& suite) {
  ReviewSession defaults("bob", TrainingMode::STANDARD, no_generator());
  suite.require(defaults.loadQueue(new_items(25), kNow) == 20, "queue is capped at 20 by default");

  ReviewSession small("bob", TrainingMode::STANDARD, no_generator(), 5);
  suite.require(small.loadQueue(new_items(25), kNow) == 5, "queue cap is configurable");
}

void test_progress_and_grading(TestSuite& suite) {
  std::vector<Item> items = new_items(3);
  ReviewSession session("carol", TrainingMode::STANDARD, no_generator());
  session.loadQueue(items, kNow);

  auto next = session.advance();
  const Presentation* p = as_presentation(next);
  suite.require(p != nullptr, "advance presents the first item");
  if (p) {
    suite.require(p->progress.current == 1 && p->progress.total == 3, "progress starts at 1/3");
  }
  suite.require(session.state() == SessionState::PRESENTING, "advance moves to presenting");
  suite.require(session.currentItem().has_value(), "current item is bound");

  GradeResult r = session.grade("4", kNow);
  suite.require(r.is_correct && r.rating == RecallRating::CORRECT_HESITATION, "self-rating flows through");
  suite.require(r.item.review_count == 1, "returned item carries the new review count");
  suite.require(std::fabs(r.item.interval - 1.0) < 1e-9, "returned item is scheduled");
  suite.require(r.item.next_review.has_value() && *r.item.next_review == kNow + kDay,
                "returned item is due tomorrow");
  suite.require(r.status.remaining == 2 && r.status.reviewed == 1 && r.status.correct == 1,
                "grade reports session status");
  suite.require(items[0].review_count == 0, "caller's items are untouched until persisted");
  suite.require(session.state() == SessionState::READY, "grade returns to ready");

  auto second = session.advance();
  const Presentation* p2 = as_presentation(second);
  suite.require(p2 != nullptr && p2->progress.current == 2 && p2->progress.total == 3,
                "progress advances to 2/3");
  suite.require(p2 != nullptr && p2->progress.correct == 1, "progress carries running counts");

  const auto history = session.history();
  suite.require(history.size() == 1 && history[0].rating == RecallRating::CORRECT_HESITATION,
                "graded items are recorded with their rating");
}

void test_accuracy(TestSuite& suite) {
  ReviewSession session("dave", TrainingMode::STANDARD, no_generator());
  session.loadQueue(new_items(10), kNow);

  for (int i = 0; i < 10; ++i) {
    auto next = session.advance();
    suite.require(as_presentation(next) != nullptr, "each queued item is presented");
    (void)session.grade(i < 7 ? "5" : "1", kNow);
  }
  suite.require(std::holds_alternative<QueueExhausted>(session.advance()), "queue drained after 10");

  SessionSummary summary = session.end();
  suite.require(summary.items_reviewed == 10, "ten items reviewed");
  suite.require(summary.correct == 7 && summary.incorrect == 3, "7 correct, 3 incorrect");
  suite.require(summary.accuracy == 0.7, "accuracy is exactly 0.7");
  suite.require(summary.duration_seconds >= 0.0, "duration is non-negative");

  SessionSummary again = session.end();
  suite.require(again.items_reviewed == summary.items_reviewed && again.correct == summary.correct &&
                    again.incorrect == summary.incorrect && again.accuracy == summary.accuracy &&
                    again.duration_seconds == summary.duration_seconds,
                "second end() returns the same summary");
  suite.require(session.state() == SessionState::ENDED, "end() is terminal");
}

void test_empty_summary(TestSuite& suite) {
  ReviewSession session("erin", TrainingMode::MULTIPLE_CHOICE, no_generator());
  SessionSummary summary = session.end();
  suite.require(summary.items_reviewed == 0 && summary.accuracy == 0.0, "no reviews means accuracy 0");
}

void test_contract_violations(TestSuite& suite) {
  ReviewSession session("frank", TrainingMode::STANDARD, no_generator());
  session.loadQueue(new_items(2), kNow);

  bool grade_threw = false;
  try {
    (void)session.grade("5", kNow);
  } catch (const std::logic_error&) {
    grade_threw = true;
  }
  suite.require(grade_threw, "grade without a current item fails fast");

  (void)session.advance();
  bool advance_threw = false;
  try {
    (void)session.advance();
  } catch (const std::logic_error&) {
    advance_threw = true;
  }
  suite.require(advance_threw, "advance before grading the current item fails fast");

  (void)session.end();
  bool after_end_threw = false;
  try {
    (void)session.advance();
  } catch (const std::logic_error&) {
    after_end_threw = true;
  }
  suite.require(after_end_threw, "advance after end fails fast");
}

void test_end_mid_queue(TestSuite& suite) {
  std::vector<Item> items = new_items(4);
  ReviewSession session("gina", TrainingMode::STANDARD, no_generator());
  session.loadQueue(items, kNow);

  (void)session.advance();
  GradeResult graded = session.grade("5", kNow);
  (void)session.advance();

  SessionSummary summary = session.end();
  suite.require(summary.items_reviewed == 1, "only graded items are counted");
  suite.require(session.remaining() == 0, "remaining queue is discarded");
  suite.require(!session.currentItem().has_value(), "presented but ungraded item is dropped");
  suite.require(session.history().size() == 1 && session.history()[0].item.id == graded.item.id,
                "history holds only the graded item");
}

void test_cloze_failure_and_mode_switch(TestSuite& suite) {
  std::vector<Item> items = new_items(2);
  ReviewSession session("hank", TrainingMode::FILL_IN_BLANK, no_generator());
  session.loadQueue(items, kNow);

  auto failed = session.advance();
  const RenderFailure* failure = std::get_if<RenderFailure>(&failed);
  suite.require(failure != nullptr, "cloze without generator yields a typed failure");
  if (failure) {
    suite.require(failure->mode == TrainingMode::FILL_IN_BLANK, "failure names the mode");
    suite.require(failure->item_id == items[0].id, "failure names the item");
    suite.require(!failure->message.empty(), "failure carries a message");
  }
  suite.require(session.state() == SessionState::READY, "failed render leaves the session ready");
  suite.require(session.remaining() == 2, "failed item goes back to the queue");

  session.switchMode(TrainingMode::STANDARD);
  auto retry = session.advance();
  const Presentation* p = as_presentation(retry);
  suite.require(p != nullptr && p->item_id == items[0].id && p->mode == TrainingMode::STANDARD,
                "retry in another mode presents the same item");
  suite.require(p != nullptr && p->progress.current == 1 && p->progress.total == 2,
                "failed render does not consume progress");

  bool switch_threw = false;
  try {
    session.switchMode(TrainingMode::MULTIPLE_CHOICE);
  } catch (const std::logic_error&) {
    switch_threw = true;
  }
  suite.require(switch_threw, "mode cannot change while presenting");
}

void test_cloze_session(TestSuite& suite) {
  TrainerOptions options;
  options.generator = std::make_shared<EchoGenerator>();
  ReviewSession session("iris", TrainingMode::FILL_IN_BLANK, options);
  session.loadQueue({Item("Paris", "Capital of France")}, kNow);

  auto next = session.advance();
  const Presentation* p = as_presentation(next);
  suite.require(p != nullptr && p->blanked_sentence.value_or("") == "____________ is the capital of France.",
                "cloze sentence is blanked");

  GradeResult r = session.grade("Paris", kNow);
  suite.require(r.is_correct && r.similarity.value_or(0.0) > 0.8, "exact cloze answer is correct");
  suite.require(r.rating == RecallRating::PERFECT_RECALL, "exact cloze answer rates 5");
}

void test_multiple_choice_session(TestSuite& suite) {
  ReviewSession session("jack", TrainingMode::MULTIPLE_CHOICE, no_generator());
  session.loadQueue({Item("gato", "cat")}, kNow);

  auto next = session.advance();
  const Presentation* p = as_presentation(next);
  suite.require(p != nullptr && p->options.size() == 4, "multiple choice presents four options");

  GradeResult r = session.grade("not a number", kNow);
  suite.require(!r.is_correct && r.rating == RecallRating::COMPLETE_BLACKOUT, "garbage choice rates 0");
  suite.require(r.correct_index.has_value() && p != nullptr &&
                    p->options[static_cast<std::size_t>(*r.correct_index)] == "cat",
                "grade reveals the correct option");
  suite.require(std::fabs(r.item.interval - 0.2) < 1e-9, "failed first review schedules 0.2 days");
}

void test_trainer_construction_failure_keeps_item(TestSuite& suite) {
  std::vector<Item> items = new_items(2);
  ReviewSession session("kate", TrainingMode::STANDARD, no_generator());
  session.loadQueue(items, kNow);

  session.switchMode(static_cast<TrainingMode>(42));
  bool threw = false;
  try {
    (void)session.advance();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "unbuildable trainer surfaces as an exception");
  suite.require(session.remaining() == 2, "item stays queued when no trainer could take it");
  suite.require(!session.currentItem().has_value(), "no half-bound current item");
  suite.require(session.state() == SessionState::READY, "session stays ready");

  session.switchMode(TrainingMode::STANDARD);
  auto next = session.advance();
  const Presentation* p = as_presentation(next);
  suite.require(p != nullptr && p->item_id == items[0].id, "the same item is presented after recovery");
}

} // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  TestSuite suite;

  test_load_queue_order(suite);
  test_queue_truncation(suite);
  test_progress_and_grading(suite);
  test_accuracy(suite);
  test_empty_summary(suite);
  test_contract_violations(suite);
  test_end_mid_queue(suite);
  test_cloze_failure_and_mode_switch(suite);
  test_cloze_session(suite);
  test_multiple_choice_session(suite);
  test_trainer_construction_failure_keeps_item(suite);

  if (!suite.ok) {
    std::cerr << "Review session tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Review session tests passed" << std::endl;
  return 0;
}
