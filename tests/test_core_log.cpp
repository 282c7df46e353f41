#include "sdrelog/core/log.hpp"
#include "sdrelog/log.hpp"

#include "test_main.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>

#include <string>
#include <thread>
#include <vector>

namespace {

using sdrelog::core::Config;
using sdrelog::core::Level;
using sdrelog::core::StreamPolicy;
using sdrelog::tests::CapturedStream;
using sdrelog::tests::contains;
using sdrelog::tests::count_lines;

const std::vector<Level> kLevels = {
  Level::trace, Level::debug, Level::info, Level::warn, Level::error};

void emit_at(Level level, const char* message) {
  switch (level) {
    case Level::trace:
      SDRELOG_TRACE("{}", message);
      break;
    case Level::debug:
      SDRELOG_DEBUG("{}", message);
      break;
    case Level::info:
      SDRELOG_INFO("{}", message);
      break;
    case Level::warn:
      SDRELOG_WARN("{}", message);
      break;
    case Level::error:
      SDRELOG_ERROR("{}", message);
      break;
    case Level::off:
      break;
  }
}

Config plain_config(Level threshold) {
  Config config{};
  config.threshold = threshold;
  config.color = sdrelog::core::ColorMode::never;
  return config;
}

void test_level_roundtrip() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), out.get());

  for (Level level : {Level::trace, Level::debug, Level::info, Level::warn, Level::error, Level::off}) {
    sdrelog::core::set_level(level);
    TEST_EXPECT_EQ(sdrelog::core::current_level(), level);
  }
}

void test_threshold_gates_every_level() {
  for (Level threshold : kLevels) {
    CapturedStream out;
    sdrelog::core::enable_logging(plain_config(threshold), out.get(), out.get());
    TEST_EXPECT_EQ(sdrelog::core::current_level(), threshold);

    for (Level level : kLevels) {
      emit_at(level, "gate check");
      const auto text = out.take();
      const bool expected = level >= threshold;
      TEST_EXPECT_EQ(sdrelog::core::is_enabled(level), expected);
      TEST_EXPECT_EQ(!text.empty(), expected);
      if (expected) {
        TEST_EXPECT_EQ(count_lines(text), 1U);
        TEST_EXPECT(contains(text, sdrelog::core::level_name(level)));
      }
    }
  }
}

void test_disable_writes_nothing() {
  CapturedStream out;
  CapturedStream err;
  sdrelog::core::enable_logging(plain_config(Level::trace), out.get(), err.get());
  sdrelog::core::disable_logging();

  TEST_EXPECT_EQ(sdrelog::core::current_level(), Level::off);
  for (Level level : kLevels) {
    TEST_EXPECT(!sdrelog::core::is_enabled(level));
    emit_at(level, "silenced");
  }
  spdlog::info("silenced");
  spdlog::error("silenced");

  TEST_EXPECT(out.take().empty());
  TEST_EXPECT(err.take().empty());
  TEST_EXPECT(!sdrelog::core::is_enabled(Level::off));
}

void test_info_threshold_scenario() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), out.get());

  SDRELOG_DEBUG("Hello World!");
  TEST_EXPECT(out.take().empty());

  const int line = __LINE__ + 1;
  SDRELOG_INFO("Hello World!");
  const auto text = out.take();
  TEST_EXPECT_EQ(count_lines(text), 1U);
  TEST_EXPECT(contains(text, "Hello World!"));
  TEST_EXPECT(contains(text, "[INFO ]"));
  TEST_EXPECT(contains(text, "test_core_log.cpp:" + std::to_string(line)));
}

void test_trace_threshold_emits_five_tagged_lines() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::trace), out.get(), out.get());

  SDRELOG_TRACE("one");
  SDRELOG_DEBUG("two");
  SDRELOG_INFO("three");
  SDRELOG_WARN("four");
  SDRELOG_ERROR("five");

  const auto text = out.take();
  TEST_EXPECT_EQ(count_lines(text), 5U);

  const std::vector<std::string> expected = {
    "[TRACE]", "[DEBUG]", "[INFO ]", "[WARN ]", "[ERROR]"};
  std::size_t pos = 0;
  for (const auto& tag : expected) {
    const auto eol = text.find('\n', pos);
    TEST_EXPECT(eol != std::string::npos);
    if (eol == std::string::npos) {
      return;
    }
    TEST_EXPECT_EQ(text.substr(pos, tag.size()), tag);
    pos = eol + 1;
  }
}

void test_split_streams() {
  CapturedStream out;
  CapturedStream err;
  sdrelog::core::enable_logging(plain_config(Level::trace), out.get(), err.get());

  SDRELOG_TRACE("to out");
  SDRELOG_DEBUG("to out");
  SDRELOG_INFO("to out");
  SDRELOG_WARN("to err");
  SDRELOG_ERROR("to err");

  const auto out_text = out.take();
  const auto err_text = err.take();
  TEST_EXPECT_EQ(count_lines(out_text), 3U);
  TEST_EXPECT_EQ(count_lines(err_text), 2U);
  TEST_EXPECT(!contains(out_text, "to err"));
  TEST_EXPECT(!contains(err_text, "to out"));
}

void test_single_stream_policies() {
  for (StreamPolicy policy : {StreamPolicy::stdout_only, StreamPolicy::stderr_only}) {
    CapturedStream out;
    CapturedStream err;
    auto config = plain_config(Level::trace);
    config.streams = policy;
    sdrelog::core::enable_logging(config, out.get(), err.get());

    SDRELOG_INFO("a");
    SDRELOG_ERROR("b");

    const auto out_text = out.take();
    const auto err_text = err.take();
    if (policy == StreamPolicy::stdout_only) {
      TEST_EXPECT_EQ(count_lines(out_text), 2U);
      TEST_EXPECT(err_text.empty());
    } else {
      TEST_EXPECT_EQ(count_lines(err_text), 2U);
      TEST_EXPECT(out_text.empty());
    }
  }
}

void test_disabled_macro_does_not_evaluate_arguments() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::warn), out.get(), out.get());

  int evaluations = 0;
  auto expensive = [&evaluations]() {
    ++evaluations;
    return 1;
  };
  SDRELOG_DEBUG("value {}", expensive());
  SDRELOG_INFO("value {}", expensive());
  TEST_EXPECT_EQ(evaluations, 0);

  SDRELOG_WARN("value {}", expensive());
  TEST_EXPECT_EQ(evaluations, 1);
  TEST_EXPECT(contains(out.take(), "value 1"));
}

void test_interpolation_and_verbatim_message() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), out.get());

  SDRELOG_INFO("{} frames decoded from {}", 42, "acars");
  SDRELOG_INFO("literal %s and {{braces}}");
  const auto text = out.take();
  TEST_EXPECT(contains(text, "] 42 frames decoded from acars\n"));
  TEST_EXPECT(contains(text, "] literal %s and {braces}\n"));
}

void test_malformed_runtime_format_is_swallowed() {
  CapturedStream out;
  CapturedStream err;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), err.get());

  SDRELOG_INFO(fmt::runtime("{} and {} but only one argument"), 1);
  SDRELOG_ERROR(fmt::runtime("{0} {1}"), 3.5);

  // 出错的消息被丢弃，后续日志照常工作
  SDRELOG_INFO("still alive");
  TEST_EXPECT(contains(out.take(), "still alive"));
  TEST_EXPECT(err.take().empty());
}

void test_existing_spdlog_call_sites_use_same_format() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::debug), out.get(), out.get());

  spdlog::info("from spdlog {}", 7);
  const int line = __LINE__ + 1;
  SPDLOG_WARN("from SPDLOG_WARN");
  const auto text = out.take();
  TEST_EXPECT(contains(text, "[INFO ]"));
  TEST_EXPECT(contains(text, "[<unknown>] from spdlog 7\n"));
  TEST_EXPECT(contains(text, "[WARN ]"));
  TEST_EXPECT(contains(text, "from SPDLOG_WARN"));
  // SPDLOG_ACTIVE_LEVEL 默认为 info，SPDLOG_WARN 会携带源码位置
  TEST_EXPECT(contains(text, "test_core_log.cpp:" + std::to_string(line)));
}

void test_explicit_location_overload() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), out.get());

  sdrelog::core::log(Level::info, spdlog::source_loc{"gen/decoder.cpp", 99, "decode"},
                     "decoded {} messages", 3);
  sdrelog::core::log(Level::debug, spdlog::source_loc{"gen/decoder.cpp", 100, "decode"},
                     "hidden");
  const auto text = out.take();
  TEST_EXPECT_EQ(count_lines(text), 1U);
  TEST_EXPECT(contains(text, "[decoder.cpp:99] decoded 3 messages\n"));
}

void test_automatic_color_is_off_for_files() {
  CapturedStream out;
  auto config = plain_config(Level::info);
  config.color = sdrelog::core::ColorMode::automatic;
  sdrelog::core::enable_logging(config, out.get(), out.get());

  SDRELOG_INFO("redirected");
  SDRELOG_ERROR("redirected");
  const auto text = out.take();
  TEST_EXPECT_EQ(count_lines(text), 2U);
  TEST_EXPECT(text.find('\033') == std::string::npos);
}

void test_forced_color() {
  CapturedStream out;
  auto config = plain_config(Level::info);
  config.color = sdrelog::core::ColorMode::always;
  sdrelog::core::enable_logging(config, out.get(), out.get());

  SDRELOG_INFO("colored");
  const auto text = out.take();
  TEST_EXPECT(contains(text, "[\033[1;32mINFO \033[0m]"));
  TEST_EXPECT(contains(text, "] colored\n"));
}

void test_reenable_replaces_previous_logger() {
  CapturedStream first;
  CapturedStream second;
  sdrelog::core::enable_logging(plain_config(Level::info), first.get(), first.get());
  sdrelog::core::enable_logging(plain_config(Level::error), second.get(), second.get());

  SDRELOG_INFO("dropped");
  SDRELOG_ERROR("kept");
  TEST_EXPECT(first.take().empty());
  const auto text = second.take();
  TEST_EXPECT_EQ(count_lines(text), 1U);
  TEST_EXPECT(contains(text, "kept"));
}

void test_argumentless_call_is_a_format_string() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), out.get());

  SDRELOG_INFO("macro {{x}}");
  SDRELOG_INFO("macro {{x}} {}", 1);
  sdrelog::core::log(Level::info, spdlog::source_loc{"a.cpp", 1, "f"}, "direct {{x}}");

  const auto text = out.take();
  TEST_EXPECT_EQ(count_lines(text), 3U);
  TEST_EXPECT(contains(text, "] macro {x}\n"));
  TEST_EXPECT(contains(text, "] macro {x} 1\n"));
  TEST_EXPECT(contains(text, "[a.cpp:1] direct {x}\n"));
  TEST_EXPECT(!contains(text, "{{"));
}

void test_logger_accessor() {
  CapturedStream out;
  auto config = plain_config(Level::warn);
  config.logger_name = "accessor-test";
  sdrelog::core::enable_logging(config, out.get(), out.get());

  auto* logger = sdrelog::core::logger();
  TEST_EXPECT(logger != nullptr);
  TEST_EXPECT(logger == spdlog::default_logger_raw());
  if (logger == nullptr) {
    return;
  }
  TEST_EXPECT_EQ(logger->name(), "accessor-test");
  TEST_EXPECT(logger->level() == spdlog::level::warn);

  sdrelog::core::set_level(Level::debug);
  TEST_EXPECT(logger->level() == spdlog::level::debug);
}

void test_concurrent_lines_do_not_interleave() {
  CapturedStream out;
  sdrelog::core::enable_logging(plain_config(Level::info), out.get(), out.get());

  constexpr int kThreads = 8;
  constexpr int kLinesPerThread = 200;
  const std::string padding(64, '.');

  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([t, &padding]() {
      for (int i = 0; i < kLinesPerThread; ++i) {
        SDRELOG_INFO("worker {} line {} {} end", t, i, padding);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto text = out.take();
  TEST_EXPECT_EQ(count_lines(text), static_cast<std::size_t>(kThreads * kLinesPerThread));

  std::vector<int> per_thread(kThreads, 0);
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto eol = text.find('\n', pos);
    if (eol == std::string::npos) {
      TEST_FAIL("trailing partial line");
      break;
    }
    const std::string line = text.substr(pos, eol - pos);
    pos = eol + 1;

    TEST_EXPECT(line.rfind("[INFO ][", 0) == 0);
    const auto msg = line.find("] worker ");
    TEST_EXPECT(msg != std::string::npos);
    if (msg == std::string::npos) {
      continue;
    }
    int t = -1;
    int i = -1;
    if (std::sscanf(line.c_str() + msg, "] worker %d line %d", &t, &i) != 2 || t < 0 ||
        t >= kThreads) {
      TEST_FAIL("malformed line: " + line);
      continue;
    }
    const std::string expected_tail =
        "worker " + std::to_string(t) + " line " + std::to_string(i) + " " + padding + " end";
    TEST_EXPECT_EQ(line.substr(msg + 2), expected_tail);
    // 同一线程内的行按顺序出现
    TEST_EXPECT_EQ(i, per_thread[t]);
    per_thread[t] = i + 1;
  }
  for (int count : per_thread) {
    TEST_EXPECT_EQ(count, kLinesPerThread);
  }
}

}  // namespace

int main() {
  test_level_roundtrip();
  test_threshold_gates_every_level();
  test_disable_writes_nothing();
  test_info_threshold_scenario();
  test_trace_threshold_emits_five_tagged_lines();
  test_split_streams();
  test_single_stream_policies();
  test_disabled_macro_does_not_evaluate_arguments();
  test_interpolation_and_verbatim_message();
  test_malformed_runtime_format_is_swallowed();
  test_existing_spdlog_call_sites_use_same_format();
  test_explicit_location_overload();
  test_automatic_color_is_off_for_files();
  test_forced_color();
  test_reenable_replaces_previous_logger();
  test_argumentless_call_is_a_format_string();
  test_logger_accessor();
  test_concurrent_lines_do_not_interleave();

  // 恢复 spdlog 默认 logger，避免悬挂的 tmpfile 指针
  spdlog::set_default_logger(nullptr);
  return ::sdrelog::tests::run_and_report();
}
