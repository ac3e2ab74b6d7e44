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

#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <cxxopts.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

#include "trustinstall/Config.hh"
#include "trustinstall/Errors.hh"
#include "trustinstall/Installer.hh"
#include "Interrupt.hh"

using namespace trustinstall;

namespace
{
  constexpr int EXIT_INTERRUPTED = 130;

  void init_logging()
  {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("trustinstall", console_sink);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

#if SPDLOG_VERSION >= 10801
    spdlog::cfg::load_env_levels();
#endif
  }

  int report_failure(const char *stage, const std::error_code &ec)
  {
    fmt::print(stderr, "error: {}: {}\n", stage, ec.message());
    auto hint = remediation(ec);
    if (!hint.empty())
      {
        fmt::print(stderr, "hint: {}\n", hint);
      }
    return ec == InstallerError::Interrupted ? EXIT_INTERRUPTED : 1;
  }

  void print_completion(const InstallReport &report)
  {
    fmt::print("\nInstalled to: {}\n", report.installed_path.string());
    switch (report.path)
      {
      case PathOutcome::NotOnPath:
      case PathOutcome::UpdateFailed:
        fmt::print("Add this directory to PATH if needed: {}\n", report.installed_path.parent_path().string());
        break;
      case PathOutcome::Added:
        fmt::print("Added {} to your PATH; open a new terminal to pick it up.\n", report.installed_path.parent_path().string());
        break;
      case PathOutcome::Skipped:
      case PathOutcome::AlreadyPresent:
        break;
      }
    fmt::print("Run: {} --help\n", report.binary_name);
  }
} // namespace

int main(int argc, char **argv)
{
  bool verbose = false;
  CommandLineOverrides overrides;

  init_logging();

  auto environment = InstallerConfig::from_environment(InstallerConfig::process_environment());

  InstallerConfig config = environment ? environment.value() : InstallerConfig{};

  cxxopts::Options options("trustinstall", "Downloads, verifies and installs fps-tracker release binaries");
  options.positional_help("[release]");
  options.add_options()
    ("r,release", "Release tag to install, e.g. v0.2.5 (default: latest release)", cxxopts::value<std::string>())
    ("install-dir", "Directory the binary is installed into", cxxopts::value<std::string>())
    ("base-url", "Download release assets from this mirror instead of GitHub", cxxopts::value<std::string>())
    ("repo", "GitHub repository publishing the releases", cxxopts::value<std::string>(config.repo))
    ("cosign-pubkey", "Verify signatures with this PEM public key", cxxopts::value<std::string>())
    ("cosign-version", "cosign release to bootstrap when cosign is not on PATH", cxxopts::value<std::string>(config.tool_version))
    ("verifier", "Signature verifier: cosign or builtin", cxxopts::value<std::string>())
    ("skip-signature-verify", "Do not verify the detached signature")
    ("require-signature-verify", "Fail when signature assets are missing")
    ("allow-insecure-http", "Allow plain HTTP downloads from non-loopback hosts")
    ("skip-path-update", "Leave PATH untouched")
    ("skip-cosign-checksum-verify", "Accept a bootstrapped cosign without pinned checksum")
    ("v,verbose", "Enable debug logging")
    ("h,help", "Print usage");

  try
    {
      options.parse_positional({"release"});
      auto result = options.parse(argc, argv);
      if (result.count("help") != 0)
        {
          fmt::print("{}\n", options.help());
          return 0;
        }

      auto text = [&result](const char *name) -> std::optional<std::string> {
        if (result.count(name) == 0)
          {
            return std::nullopt;
          }
        return result[name].as<std::string>();
      };
      overrides.release = text("release");
      overrides.install_dir = text("install-dir");
      overrides.base_url = text("base-url");
      overrides.cosign_pubkey = text("cosign-pubkey");
      overrides.verifier = text("verifier");

      verbose = result.count("verbose") != 0;
      config.policy.skip_signature_verify |= result.count("skip-signature-verify") != 0;
      config.policy.require_signature_verify |= result.count("require-signature-verify") != 0;
      config.policy.allow_insecure_http |= result.count("allow-insecure-http") != 0;
      config.skip_path_update |= result.count("skip-path-update") != 0;
      config.skip_tool_checksum_verify |= result.count("skip-cosign-checksum-verify") != 0;
    }
  catch (const cxxopts::OptionException &e)
    {
      fmt::print(stderr, "error: {}\n", e.what());
      fmt::print(stderr, "Run with --help for usage.\n");
      return 2;
    }

  if (verbose)
    {
      spdlog::set_level(spdlog::level::debug);
#if SPDLOG_VERSION >= 10801
      spdlog::cfg::load_env_levels();
#endif
    }

  if (!environment)
    {
      return report_failure("configuration", environment.error());
    }

  if (auto applied = config.apply(overrides); !applied)
    {
      return report_failure("configuration", applied.error());
    }
  config.report_conflicts();

  install_interrupt_handlers();

  try
    {
      Installer installer(config);
      auto report = installer.run();
      if (!report)
        {
          return report_failure(stage_name(installer.failed_stage()), report.error());
        }
      print_completion(report.value());
    }
  catch (const std::exception &e)
    {
      spdlog::critical("Unexpected failure: {}", e.what());
      fmt::print(stderr, "error: {}\n", e.what());
      return 1;
    }

  return 0;
}
