#pragma once
/** @file  FakeComposeClient.hpp
 *  @brief ComposeClient that records every call and returns scripted results.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <string>
#include <vector>

#include "io/ComposeClient.hpp"

namespace keel {
  namespace test {

    /**
 * @class FakeComposeClient
 * @brief `calls` holds "down", "build", "up", "ps", "logs", "rm:<name>" in
 *        call order for ordering assertions.
 */
    class FakeComposeClient : public keel::io::ComposeClient {
    public:
      std::vector<std::string> calls;

      io::ComposeResult downResult{ true, false, 0, "" };
      io::ComposeResult buildResult{ true, false, 0, "Successfully built" };
      io::ComposeResult upResult{ true, false, 0, "Started" };
      io::ComposeResult rmResult{ true, false, 0, "" };
      std::string logText{ "api-1  | INFO: Application startup complete." };

      /// Consumed front to back; the last entry repeats forever.
      std::deque<std::optional<protocols::Response>> psScript{ runningStack() };

      static protocols::Response runningStack() {
        protocols::Response r;
        r.services.push_back({ "api", "lendingwise-api-1", "running", 0 });
        return r;
      }

      static protocols::Response stackInState(const std::string& state) {
        protocols::Response r;
        r.services.push_back({ "api", "lendingwise-api-1", state, state == "exited" ? 1 : 0 });
        return r;
      }

      io::ComposeResult down(const std::string&) override {
        calls.push_back("down");
        return downResult;
      }

      io::ComposeResult build(const std::string&) override {
        calls.push_back("build");
        return buildResult;
      }

      io::ComposeResult up(const std::string&, bool detached) override {
        calls.push_back(detached ? "up" : "up-attached");
        return upResult;
      }

      std::optional<protocols::Response> ps(const std::string&) override {
        calls.push_back("ps");
        if (psScript.empty())
          return std::nullopt;
        auto next = psScript.front();
        if (psScript.size() > 1)
          psScript.pop_front();
        return next;
      }

      std::string logs(const std::string&, std::size_t) override {
        calls.push_back("logs");
        return logText;
      }

      io::ComposeResult removeContainer(const std::string& name) override {
        calls.push_back("rm:" + name);
        return rmResult;
      }

      std::size_t count(const std::string& call) const {
        std::size_t n = 0;
        for (const auto& c : calls)
          if (c == call)
            ++n;
        return n;
      }

      /// Mutating calls only (ps/logs/rm filtered out).
      std::vector<std::string> lifecycleCalls() const {
        std::vector<std::string> out;
        for (const auto& c : calls)
          if (c == "down" || c == "build" || c == "up" || c == "up-attached")
            out.push_back(c);
        return out;
      }
    };

  } // namespace test
} // namespace keel
