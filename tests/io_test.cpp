#include "io/Console.hpp"
#include "io/FileLogger.hpp"
#include "io/ProcessRunner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace std::chrono_literals;
using keel::io::Console;
using keel::io::FileLogger;
using keel::io::ProcessRunner;
namespace fs = std::filesystem;

TEST(process_runner, captures_stdout_and_stderr) {
  ProcessRunner runner;

  auto r = runner.run({ "/bin/sh", "-c", "echo built; echo warning >&2" }, 5s);

  EXPECT_TRUE(r.ok());
  EXPECT_NE(r.output.find("built"), std::string::npos);
  EXPECT_NE(r.output.find("warning"), std::string::npos);
}

TEST(process_runner, reports_exit_code) {
  ProcessRunner runner;

  auto r = runner.run({ "/bin/sh", "-c", "exit 3" }, 5s);

  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.exitCode, 3);
  EXPECT_FALSE(r.timedOut);
}

TEST(process_runner, kills_child_on_deadline) {
  ProcessRunner runner;
  auto begin = std::chrono::steady_clock::now();

  auto r = runner.run({ "/bin/sh", "-c", "sleep 10" }, 200ms);

  EXPECT_TRUE(r.timedOut);
  EXPECT_FALSE(r.ok());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}

TEST(process_runner, missing_binary_is_127) {
  ProcessRunner runner;

  auto r = runner.run({ "keel-no-such-binary" }, 5s);

  EXPECT_EQ(r.exitCode, 127);
}

TEST(process_runner, runs_in_work_dir) {
  ProcessRunner runner;

  auto r = runner.run({ "/bin/sh", "-c", "pwd" }, 5s, "/");

  EXPECT_EQ(r.output, "/\n");
}

TEST(process_runner, empty_argv_throws) {
  ProcessRunner runner;

  EXPECT_THROW(runner.run({}, 1s), std::invalid_argument);
}

TEST(file_logger, appends_and_flushes) {
  auto path = fs::temp_directory_path() / ("keel-filelogger-" + std::to_string(::getpid()) + ".log");
  fs::remove(path);

  {
    FileLogger log;
    ASSERT_TRUE(log.open(path.string()));
    log.write("first\n");
    EXPECT_TRUE(log.flush());
  }
  {
    FileLogger log;
    ASSERT_TRUE(log.open(path.string()));
    log.write("second\n");
  } // dtor flushes

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_EQ(ss.str(), "first\nsecond\n");
  fs::remove(path);
}

TEST(file_logger, unwritable_path_fails_open) {
  FileLogger log;

  EXPECT_FALSE(log.open("/nonexistent/keel/deploy.log"));
  EXPECT_FALSE(log.isOpen());
  EXPECT_FALSE(log.flush());
}

TEST(console, confirm_reads_one_answer) {
  std::istringstream in(" Y \nno\n");
  std::ostringstream out;
  Console console(in, out);

  EXPECT_TRUE(console.confirm("Deploy?"));
  EXPECT_FALSE(console.confirm("Deploy?"));
  EXPECT_FALSE(console.confirm("Deploy?")); // EOF
  EXPECT_EQ(out.str().find("Deploy? [y/N] "), 0u);
}
