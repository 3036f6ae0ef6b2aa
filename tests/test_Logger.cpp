#include "voroglass/Logger.hpp"

#include <catch2/catch.hpp>
#include <thread>
#include <vector>

using namespace voroglass;

TEST_CASE("Log levels are toggled as a bitmask", "[Logger]")
{
  Logger log("test_logger.log.tmp");
  REQUIRE_FALSE(log.isEnabled(LogLevel::Debug));
  REQUIRE(log.isEnabled(LogLevel::Info));
  REQUIRE(log.isEnabled(LogLevel::Warning | LogLevel::Debug));

  log.setLogLevel(LogLevel::Debug);
  REQUIRE(log.isEnabled(LogLevel::Debug));

  log.setLogLevel(LogLevel::Info | LogLevel::Warning, false);
  REQUIRE_FALSE(log.isEnabled(LogLevel::Info));
  REQUIRE_FALSE(log.isEnabled(LogLevel::Warning));
  REQUIRE(log.isEnabled(LogLevel::Error));
}

TEST_CASE("Levels can change while other threads log", "[Logger]")
{
  Logger log("test_logger.log.tmp");
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w)
  {
    workers.emplace_back([&log, w]()
      {
        for (int i = 0; i < 200; ++i)
        {
          if (w == 0)
            log.setLogLevel(LogLevel::Debug, i % 2 == 0);
          else
            log.log(LogLevel::Debug, "worker %d message %d", w, i);
        }
      });
  }
  for (auto& worker : workers)
  {
    worker.join();
  }

  log.setLogLevel(LogLevel::Debug, false);
  REQUIRE_FALSE(log.isEnabled(LogLevel::Debug));
  REQUIRE(log.isEnabled(LogLevel::Error));
}
