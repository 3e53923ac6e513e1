#include "change_detector.hpp"
#include "event_channel.hpp"
#include "progress_processor.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"
#include "watch_engine.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using tickwatch::test::TestCase;
using tickwatch::test::TestContext;
using tickwatch::test::TempWorkspace;
using tickwatch::test::WriteBlocker;
using tickwatch::test::bump_mtime;
using tickwatch::test::expect;
using tickwatch::test::read_file;
using tickwatch::test::wait_for_condition;
using tickwatch::test::write_file;

namespace {

const std::string kScenario =
  "- [X] Task 1\n"
  "  - [X] Sub 1\n"
  "- [ ] Task 2\n";

const std::string kScenarioCanonical =
  "- [X] Task 1\n"
  "  - [X] Sub 1\n"
  "\n"
  "- [ ] Task 2\n"
  "\n";

bool near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

// Records every value handed to the display.
class DisplayRecorder {
public:
  ProgressProcessor::Display callback() {
    return [this](double value){
      std::lock_guard<std::mutex> lock(mutex_);
      values_.push_back(value);
    };
  }

  std::vector<double> values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
  }

  std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
  }

  bool saw(double value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for(double v : values_) {
      if(near(v, value)) return true;
    }
    return false;
  }

private:
  mutable std::mutex mutex_;
  std::vector<double> values_;
};

std::shared_ptr<Logger> capture_logger(TestContext& ctx, const std::string& name) {
  auto logger = std::make_shared<Logger>(name);
  ctx.logs.attach(logger);
  return logger;
}

bool test_channel_rendezvous(TestContext&) {
  EventChannel<int> channel;
  std::atomic<bool> send_returned{false};
  std::atomic<bool> send_result{false};
  std::thread sender([&]{
    send_result = channel.send(7);
    send_returned = true;
  });

  std::this_thread::sleep_for(50ms);
  bool ok = expect(!send_returned, "send blocks until the item is received");
  auto value = channel.receive();
  ok &= expect(value && *value == 7, "receiver gets the item");
  sender.join();
  ok &= expect(send_returned && send_result, "send completes after the hand-off");
  return ok;
}

bool test_channel_close(TestContext&) {
  EventChannel<int> channel;
  std::atomic<bool> send_result{true};
  std::thread sender([&]{ send_result = channel.send(1); });
  std::this_thread::sleep_for(20ms);
  channel.close();
  sender.join();
  bool ok = expect(!send_result, "close releases a blocked sender");
  ok &= expect(!channel.receive(), "closed channel yields nothing");
  ok &= expect(!channel.send(2), "send on a closed channel fails");
  ok &= expect(!channel.receive_for(10ms), "receive_for on a closed channel yields nothing");

  EventChannel<int> idle;
  auto start = std::chrono::steady_clock::now();
  ok &= expect(!idle.receive_for(30ms), "receive_for times out when nobody sends");
  ok &= expect(std::chrono::steady_clock::now() - start >= 25ms, "receive_for waited");
  return ok;
}

bool test_detector_first_stat_is_change(TestContext& ctx) {
  TempWorkspace workspace("detector_first");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  auto changes = std::make_shared<ChangeChannel>();
  auto failures = std::make_shared<FailureChannel>();
  ChangeDetector detector({path, 20ms}, changes, failures, capture_logger(ctx, "detector"));
  detector.start();

  auto first = changes->receive_for(2s);
  bool ok = expect(first.has_value(), "first successful stat is reported");
  ok &= expect(first && first->sequence == 1, "first event carries sequence 1");
  ok &= expect(first && first->modified == std::filesystem::last_write_time(path), "event carries the observed time");
  ok &= expect(!changes->receive_for(150ms), "unchanged file produces no further events");
  ok &= expect(detector.checks() >= 3, "detector keeps polling");
  detector.stop();
  return ok;
}

bool test_detector_reports_modification(TestContext& ctx) {
  TempWorkspace workspace("detector_modified");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  auto changes = std::make_shared<ChangeChannel>();
  auto failures = std::make_shared<FailureChannel>();
  ChangeDetector detector({path, 20ms}, changes, failures, capture_logger(ctx, "detector"));
  detector.start();

  bool ok = expect(changes->receive_for(2s).has_value(), "initial event");
  bump_mtime(path);
  auto second = changes->receive_for(2s);
  ok &= expect(second.has_value(), "modification is reported");
  ok &= expect(second && second->sequence == 2, "second event carries sequence 2");
  ok &= expect(second && second->modified == std::filesystem::last_write_time(path), "new time is remembered");
  ok &= expect(!changes->receive_for(100ms), "one event per modification");
  detector.stop();
  return ok;
}

bool test_detector_keeps_latest_while_blocked(TestContext& ctx) {
  TempWorkspace workspace("detector_blocked");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  auto changes = std::make_shared<ChangeChannel>();
  auto failures = std::make_shared<FailureChannel>();
  ChangeDetector detector({path, 10ms}, changes, failures, capture_logger(ctx, "detector"));
  detector.start();

  bool ok = expect(changes->receive_for(2s).has_value(), "initial event");
  bump_mtime(path);
  std::this_thread::sleep_for(60ms); // detector is now blocked publishing
  bump_mtime(path);
  auto final_time = std::filesystem::last_write_time(path);

  auto pending = changes->receive_for(2s);
  ok &= expect(pending.has_value(), "blocked event is delivered");
  if(pending && pending->modified != final_time) {
    auto latest = changes->receive_for(2s);
    ok &= expect(latest && latest->modified == final_time, "latest time follows on the next tick");
  }
  ok &= expect(!changes->receive_for(100ms), "nothing queued beyond the latest time");
  detector.stop();
  return ok;
}

bool test_detector_stat_failure(TestContext& ctx) {
  TempWorkspace workspace("detector_missing");
  auto path = workspace.file("missing.md");

  auto changes = std::make_shared<ChangeChannel>();
  auto failures = std::make_shared<FailureChannel>();
  ChangeDetector detector({path, 20ms}, changes, failures, capture_logger(ctx, "detector"));
  detector.start();

  auto failure = failures->receive_for(2s);
  bool ok = expect(failure.has_value(), "stat failure is published");
  ok &= expect(failure && failure->kind == WatchFailure::Kind::StatFailure, "kind is StatFailure");
  ok &= expect(failure && failure->message.find("missing.md") != std::string::npos, "message names the file");
  ok &= expect(failures->receive_for(2s).has_value(), "next tick reports again");

  write_file(path, kScenario);
  ok &= expect(changes->receive_for(2s).has_value(), "file appearing later is a change");
  detector.stop();
  return ok;
}

bool test_processor_rewrites_on_change(TestContext& ctx) {
  TempWorkspace workspace("processor_rewrite");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, display.callback(), capture_logger(ctx, "processor"));
  auto outcome = processor.process();

  bool ok = expect(outcome.count.done == 2 && outcome.count.total == 3, "counts two of three");
  ok &= expect(near(outcome.percentage, 200.0 / 3.0), "two thirds complete");
  ok &= expect(outcome.rewritten, "first cycle rewrites");
  ok &= expect(outcome.digest.size() == 64, "content digest is a sha256 hex string");
  ok &= expect(read_file(path) == kScenarioCanonical, "file is in canonical form");
  ok &= expect(display.values().size() == 1 && display.saw(200.0 / 3.0), "value displayed once");
  ok &= expect(processor.last_percentage() && near(*processor.last_percentage(), 200.0 / 3.0),
               "last percentage remembered");
  return ok;
}

bool test_processor_skips_unchanged_percentage(TestContext& ctx) {
  TempWorkspace workspace("processor_noop");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, display.callback(), capture_logger(ctx, "processor"));
  bool ok = expect(processor.process().rewritten, "first cycle rewrites");

  // Same percentage, different layout: the file must be left untouched.
  write_file(path, "- [ ] Task 2\n- [X] Task 1\n  - [ ] Sub 1\n");
  bump_mtime(path, std::chrono::seconds(-30));
  auto before_time = std::filesystem::last_write_time(path);
  auto before_text = read_file(path);

  auto outcome = processor.process();
  ok &= expect(!outcome.rewritten, "second cycle with the same percentage does not rewrite");
  ok &= expect(std::filesystem::last_write_time(path) == before_time, "modification time unchanged");
  ok &= expect(read_file(path) == before_text, "content unchanged");
  ok &= expect(display.count() == 2, "value still displayed each cycle");
  ok &= expect(processor.cycles() == 2, "two cycles counted");
  return ok;
}

bool test_processor_leaves_canonical_file(TestContext& ctx) {
  TempWorkspace workspace("processor_canonical");
  auto path = workspace.file("todo.md");
  write_file(path, kScenarioCanonical);
  bump_mtime(path, std::chrono::seconds(-30));
  auto before = std::filesystem::last_write_time(path);

  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, display.callback(), capture_logger(ctx, "processor"));
  auto outcome = processor.process();
  bool ok = expect(!outcome.rewritten, "canonical content is not written again");
  ok &= expect(outcome.digest == sha256_hex(kScenarioCanonical), "digest is taken over the content read");
  ok &= expect(std::filesystem::last_write_time(path) == before, "modification time unchanged");
  ok &= expect(display.saw(200.0 / 3.0), "value still displayed");
  ok &= expect(processor.last_percentage() && near(*processor.last_percentage(), 200.0 / 3.0),
               "percentage remembered");

  const std::string finished = "- [X] Task 1\n  - [X] Sub 1\n\n- [X] Task 2\n\n";
  write_file(path, finished);
  bump_mtime(path, std::chrono::seconds(-30));
  before = std::filesystem::last_write_time(path);
  outcome = processor.process();
  ok &= expect(near(outcome.percentage, 100.0) && !outcome.rewritten, "moved percentage on canonical content");
  ok &= expect(std::filesystem::last_write_time(path) == before && read_file(path) == finished,
               "file left as written");
  return ok;
}

bool test_processor_persists_propagation(TestContext& ctx) {
  TempWorkspace workspace("processor_propagation");
  auto path = workspace.file("todo.md");
  write_file(path, "- [X] parent\n  - [ ] child\n- [ ] other\n");

  ProgressProcessor processor({path, SubEntryPolicy::Replace}, nullptr, capture_logger(ctx, "processor"));
  auto outcome = processor.process();
  bool ok = expect(outcome.count.done == 2 && outcome.count.total == 3, "child counted through its parent");
  ok &= expect(read_file(path) == "- [X] parent\n  - [X] child\n\n- [ ] other\n\n", "child marked done on disk");
  return ok;
}

bool test_processor_parse_failure(TestContext& ctx) {
  TempWorkspace workspace("processor_parse");
  auto path = workspace.file("todo.md");
  const std::string broken = "- [ ] ok\n- [x] lower\n";
  write_file(path, broken);

  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, display.callback(), capture_logger(ctx, "processor"));
  bool thrown = false;
  try {
    processor.process();
  } catch(const ChecklistError& e) {
    thrown = e.kind() == ChecklistErrorKind::MalformedLine && e.line() == 2;
  }
  bool ok = expect(thrown, "malformed line surfaces as ChecklistError on line 2");
  ok &= expect(read_file(path) == broken, "file untouched");
  ok &= expect(display.count() == 0, "nothing displayed");
  ok &= expect(!processor.last_percentage(), "no percentage remembered");
  return ok;
}

bool test_processor_read_failure(TestContext& ctx) {
  TempWorkspace workspace("processor_read");
  ProgressProcessor processor({workspace.file("absent.md"), SubEntryPolicy::Replace}, nullptr,
                              capture_logger(ctx, "processor"));
  bool thrown = false;
  try {
    processor.process();
  } catch(const ProcessingError& e) {
    thrown = e.kind() == WatchFailure::Kind::ReadFailure;
  }
  return expect(thrown, "missing file surfaces as ReadFailure");
}

bool test_processor_write_failure(TestContext& ctx) {
  TempWorkspace workspace("processor_write");
  auto path = workspace.file("todo.md");
  const std::string original = "- [ ] a\n- [X] b\n";
  write_file(path, original);

  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, display.callback(), capture_logger(ctx, "processor"));
  bool thrown = false;
  std::string message;
  {
    WriteBlocker blocker(path);
    try {
      processor.process();
    } catch(const ProcessingError& e) {
      thrown = e.kind() == WatchFailure::Kind::WriteFailure;
      message = e.what();
    }
  }
  bool ok = expect(thrown, "failed canonical rewrite surfaces as WriteFailure");
  ok &= expect(message.find("todo.md") != std::string::npos, "message names the file");
  ok &= expect(display.saw(50.0), "value displayed before the rewrite");
  return ok;
}

bool test_processor_consume_loop_write_failure(TestContext& ctx) {
  TempWorkspace workspace("processor_loop_write");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  auto changes = std::make_shared<ChangeChannel>();
  auto failures = std::make_shared<FailureChannel>();
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, nullptr, capture_logger(ctx, "processor"));
  processor.start(changes, failures);

  bool ok = true;
  {
    WriteBlocker blocker(path);
    ok &= expect(changes->send(ChangeEvent{path, std::filesystem::last_write_time(path), 1}), "event handed over");
    auto failure = failures->receive_for(2s);
    ok &= expect(failure && failure->kind == WatchFailure::Kind::WriteFailure, "write failure published");
  }
  ok &= expect(processor.cycles() == 1, "one cycle ran before the failure");
  processor.stop();
  return ok;
}

bool test_processor_empty_checklist(TestContext& ctx) {
  TempWorkspace workspace("processor_empty");
  auto path = workspace.file("todo.md");
  write_file(path, "\n\n");

  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Replace}, display.callback(), capture_logger(ctx, "processor"));
  auto outcome = processor.process();
  bool ok = expect(outcome.count.total == 0, "no entries");
  ok &= expect(outcome.percentage == 0.0, "empty checklist reports 0");
  ok &= expect(display.saw(0.0), "0 displayed");
  ok &= expect(outcome.rewritten && read_file(path).empty(), "blank lines dropped by the rewrite");
  ok &= expect(!processor.process().rewritten, "second cycle is a no-op");
  return ok;
}

bool test_processors_are_independent(TestContext& ctx) {
  TempWorkspace workspace("processor_independent");
  auto first_path = workspace.file("a.md");
  auto second_path = workspace.file("b.md");
  write_file(first_path, "- [X] a\n");
  write_file(second_path, "- [X] b\n");

  auto logger = capture_logger(ctx, "processor");
  ProgressProcessor first({first_path, SubEntryPolicy::Replace}, nullptr, logger);
  ProgressProcessor second({second_path, SubEntryPolicy::Replace}, nullptr, logger);
  bool ok = expect(first.process().rewritten, "first watcher rewrites its file");
  ok &= expect(second.process().rewritten, "second watcher is not affected by the first");
  ok &= expect(!second.process().rewritten, "second watcher remembers its own value");
  return ok;
}

bool test_processor_consume_loop(TestContext& ctx) {
  TempWorkspace workspace("processor_loop");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);

  auto changes = std::make_shared<ChangeChannel>();
  auto failures = std::make_shared<FailureChannel>();
  DisplayRecorder display;
  ProgressProcessor processor({path, SubEntryPolicy::Reject}, display.callback(), capture_logger(ctx, "processor"));
  processor.start(changes, failures);

  bool ok = expect(changes->send(ChangeEvent{path, std::filesystem::last_write_time(path), 1}), "event handed over");
  ok &= expect(wait_for_condition([&]{ return processor.cycles() == 1; }, 2s), "one cycle ran");

  write_file(path, "- [ ] A\n  - [ ] B\n  - [X] C\n");
  ok &= expect(changes->send(ChangeEvent{path, std::filesystem::last_write_time(path), 2}), "second event handed over");
  auto failure = failures->receive_for(2s);
  ok &= expect(failure && failure->kind == WatchFailure::Kind::ParseFailure, "parse failure published");
  ok &= expect(failure && failure->message.find("[LINE 3]") != std::string::npos, "failure cites the line");
  processor.stop();
  return ok;
}

std::shared_ptr<SettingsManager> engine_settings(const std::filesystem::path& checklist) {
  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  if(!settings->set_from_json("checklist", checklist.string(), error) ||
     !settings->set_from_json("poll_interval_ms", 20, error)) {
    throw std::runtime_error("Failed to configure engine: " + error);
  }
  return settings;
}

bool test_engine_end_to_end(TestContext& ctx) {
  TempWorkspace workspace("engine");
  auto path = workspace.file("todo.md");
  write_file(path, kScenario);
  bump_mtime(path, std::chrono::seconds(-30));

  DisplayRecorder display;
  WatchEngine::Options options;
  options.display = display.callback();
  WatchEngine engine(engine_settings(path), options);
  ctx.logs.attach(engine.logger());
  engine.start();
  auto result = std::async(std::launch::async, [&]{ return engine.run(); });

  bool ok = expect(wait_for_condition([&]{ return display.saw(200.0 / 3.0); }, 3s), "initial progress displayed");
  ok &= expect(wait_for_condition([&]{ return read_file(path) == kScenarioCanonical; }, 3s), "file rewritten");
  // The rewrite is observed once more and settles without another write.
  ok &= expect(wait_for_condition([&]{ return display.count() >= 2; }, 3s), "own rewrite reprocessed");
  auto settled = std::filesystem::last_write_time(path);
  std::this_thread::sleep_for(150ms);
  ok &= expect(display.count() == 2, "no further cycles once settled");
  ok &= expect(std::filesystem::last_write_time(path) == settled, "no self-triggered rewrite loop");

  write_file(path, "- [X] a\n- [X] b\n");
  bump_mtime(path);
  ok &= expect(wait_for_condition([&]{ return display.saw(100.0); }, 3s), "edit picked up");
  ok &= expect(wait_for_condition([&]{ return read_file(path) == "- [X] a\n\n- [X] b\n\n"; }, 3s),
               "edit rewritten canonically");
  ok &= expect(engine.last_percentage() && near(*engine.last_percentage(), 100.0), "engine reports 100");

  std::filesystem::remove(path);
  bool finished = result.wait_for(3s) == std::future_status::ready;
  ok &= expect(finished, "removing the file stops the engine");
  if(!finished) engine.stop();
  auto failure = result.get();
  ok &= expect(failure && failure->kind == WatchFailure::Kind::StatFailure, "stat failure returned");
  engine.stop();
  return ok;
}

bool test_engine_parse_failure(TestContext& ctx) {
  TempWorkspace workspace("engine_parse");
  auto path = workspace.file("todo.md");
  write_file(path, "  - [X] orphan\n");

  WatchEngine::Options options;
  options.display = [](double){};
  WatchEngine engine(engine_settings(path), options);
  ctx.logs.attach(engine.logger());
  engine.start();
  auto result = std::async(std::launch::async, [&]{ return engine.run(); });

  bool finished = result.wait_for(3s) == std::future_status::ready;
  bool ok = expect(finished, "parse failure stops the engine");
  if(!finished) engine.stop();
  auto failure = result.get();
  ok &= expect(failure && failure->kind == WatchFailure::Kind::ParseFailure, "parse failure returned");
  ok &= expect(failure && failure->message.find("[LINE 1]") != std::string::npos, "failure cites line 1");
  ok &= expect(read_file(path) == "  - [X] orphan\n", "file untouched");
  engine.stop();
  return ok;
}

bool test_engine_stop_releases_run(TestContext& ctx) {
  TempWorkspace workspace("engine_stop");
  auto path = workspace.file("todo.md");
  write_file(path, "- [ ] a\n");

  WatchEngine::Options options;
  options.display = [](double){};
  WatchEngine engine(engine_settings(path), options);
  ctx.logs.attach(engine.logger());
  engine.start();
  auto result = std::async(std::launch::async, [&]{ return engine.run(); });
  std::this_thread::sleep_for(50ms);
  engine.stop();

  bool finished = result.wait_for(2s) == std::future_status::ready;
  bool ok = expect(finished, "stop releases run()");
  ok &= expect(finished && !result.get(), "no failure reported after stop");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"channel_rendezvous", test_channel_rendezvous},
    {"channel_close", test_channel_close},
    {"detector_first_stat_is_change", test_detector_first_stat_is_change},
    {"detector_reports_modification", test_detector_reports_modification},
    {"detector_keeps_latest_while_blocked", test_detector_keeps_latest_while_blocked},
    {"detector_stat_failure", test_detector_stat_failure},
    {"processor_rewrites_on_change", test_processor_rewrites_on_change},
    {"processor_skips_unchanged_percentage", test_processor_skips_unchanged_percentage},
    {"processor_leaves_canonical_file", test_processor_leaves_canonical_file},
    {"processor_persists_propagation", test_processor_persists_propagation},
    {"processor_parse_failure", test_processor_parse_failure},
    {"processor_read_failure", test_processor_read_failure},
    {"processor_write_failure", test_processor_write_failure},
    {"processor_empty_checklist", test_processor_empty_checklist},
    {"processors_are_independent", test_processors_are_independent},
    {"processor_consume_loop", test_processor_consume_loop},
    {"processor_consume_loop_write_failure", test_processor_consume_loop_write_failure},
    {"engine_end_to_end", test_engine_end_to_end},
    {"engine_parse_failure", test_engine_parse_failure},
    {"engine_stop_releases_run", test_engine_stop_releases_run},
  };
  return tickwatch::test::run_test_cases("watch", tests, argc, argv);
}
