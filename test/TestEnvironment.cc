// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <memory>
#include <gtest/gtest.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

#include "Interrupt.hh"

namespace
{
  // Console output is limited to warnings so that the expected failures
  // of negative tests stay readable; the file keeps everything.
  class InstallerTestEnvironment : public ::testing::Environment
  {
  public:
    void SetUp() override
    {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("trustinstall-tests.log", true);
      file_sink->set_level(spdlog::level::trace);
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::warn);

      auto logger = std::make_shared<spdlog::logger>("trustinstall", spdlog::sinks_init_list{file_sink, console_sink});
      logger->set_level(spdlog::level::trace);
      logger->flush_on(spdlog::level::warn);
      spdlog::set_default_logger(logger);

      spdlog::set_pattern("[%H:%M:%S.%e] [%n] [%^%-5l%$] %v");
      spdlog::set_level(spdlog::level::trace);

#if SPDLOG_VERSION >= 10801
      spdlog::cfg::load_env_levels();
#endif
      trustinstall::reset_interrupted();
    }

    void TearDown() override
    {
      trustinstall::reset_interrupted();
      spdlog::shutdown();
    }
  };

  // The interrupt flag is process-wide; a test that raises it must not
  // make every later download fail with Interrupted.
  class InterruptResetListener : public ::testing::EmptyTestEventListener
  {
  public:
    void OnTestStart(const ::testing::TestInfo &) override
    {
      trustinstall::reset_interrupted();
    }

    void OnTestEnd(const ::testing::TestInfo &info) override
    {
      if (trustinstall::interrupted())
        {
          spdlog::debug("{}.{} left the interrupt flag raised", info.test_suite_name(), info.name());
          trustinstall::reset_interrupted();
        }
    }
  };

  bool register_environment()
  {
    ::testing::AddGlobalTestEnvironment(new InstallerTestEnvironment);
    ::testing::UnitTest::GetInstance()->listeners().Append(new InterruptResetListener);
    return true;
  }

  const bool environment_registered = register_environment();
} // namespace
