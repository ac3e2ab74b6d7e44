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

#include "trustinstall/Config.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

#include "Logging.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    std::string to_lower(std::string value)
    {
      std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return value;
    }

    std::optional<std::string> non_empty(const InstallerConfig::EnvironmentLookup &lookup, const std::string &name)
    {
      auto value = lookup(name);
      if (!value || value->empty())
        {
          return std::nullopt;
        }
      return value;
    }

    outcome::std_result<void> read_flag(const InstallerConfig::EnvironmentLookup &lookup, const std::string &name, bool &flag)
    {
      auto value = lookup(name);
      if (!value)
        {
          return outcome::success();
        }

      auto parsed = parse_bool(*value);
      if (!parsed)
        {
          auto logger = Logging::create("trustinstall:config");
          logger->error("{} has an unsupported value '{}'", name, *value);
          return parsed.error();
        }
      flag = parsed.value();
      return outcome::success();
    }
  } // namespace

  outcome::std_result<bool> parse_bool(const std::string &value)
  {
    auto lower = to_lower(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
      {
        return true;
      }
    if (lower.empty() || lower == "0" || lower == "false" || lower == "no" || lower == "off")
      {
        return false;
      }
    return InstallerError::InvalidConfiguration;
  }

  outcome::std_result<VerifierKind> parse_verifier_kind(const std::string &value)
  {
    auto lower = to_lower(value);
    if (lower == "cosign")
      {
        return VerifierKind::Cosign;
      }
    if (lower == "builtin")
      {
        return VerifierKind::Builtin;
      }
    return InstallerError::InvalidConfiguration;
  }

  InstallerConfig::EnvironmentLookup InstallerConfig::process_environment()
  {
    return [](const std::string &name) -> std::optional<std::string> {
      const char *value = std::getenv(name.c_str());
      if (value == nullptr)
        {
          return std::nullopt;
        }
      return std::string(value);
    };
  }

  std::filesystem::path InstallerConfig::default_install_dir(const EnvironmentLookup &lookup)
  {
#ifdef _WIN32
    if (auto local_app_data = non_empty(lookup, "LOCALAPPDATA"))
      {
        return std::filesystem::path(*local_app_data) / default_binary_stem / "bin";
      }
    if (auto profile = non_empty(lookup, "USERPROFILE"))
      {
        return std::filesystem::path(*profile) / "AppData" / "Local" / default_binary_stem / "bin";
      }
#else
    if (auto home = non_empty(lookup, "HOME"))
      {
        return std::filesystem::path(*home) / ".local" / "bin";
      }
#endif
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return cwd / "bin";
  }

  outcome::std_result<InstallerConfig> InstallerConfig::from_environment(const EnvironmentLookup &lookup)
  {
    auto logger = Logging::create("trustinstall:config");
    InstallerConfig config;

    if (auto repo = non_empty(lookup, "FPS_TRACKER_REPO"))
      {
        config.repo = *repo;
      }
    config.version = non_empty(lookup, "FPS_TRACKER_VERSION");
    config.base_url_override = non_empty(lookup, "FPS_TRACKER_BASE_URL");

    if (auto install_dir = non_empty(lookup, "FPS_TRACKER_INSTALL_DIR"))
      {
        config.install_dir = *install_dir;
      }
    else
      {
        config.install_dir = default_install_dir(lookup);
      }

    if (auto tool_version = non_empty(lookup, "FPS_TRACKER_COSIGN_VERSION"))
      {
        config.tool_version = *tool_version;
      }
    if (auto pubkey = non_empty(lookup, "FPS_TRACKER_COSIGN_PUBKEY"))
      {
        config.policy.cosign_pubkey_override = std::filesystem::path(*pubkey);
      }
    if (auto verifier = non_empty(lookup, "FPS_TRACKER_SIGNATURE_VERIFIER"))
      {
        auto kind = parse_verifier_kind(*verifier);
        if (!kind)
          {
            logger->error("FPS_TRACKER_SIGNATURE_VERIFIER must be 'cosign' or 'builtin', got '{}'", *verifier);
            return kind.error();
          }
        config.verifier = kind.value();
      }

    const std::pair<const char *, bool *> flags[] = {
      {"FPS_TRACKER_SKIP_SIGNATURE_VERIFY", &config.policy.skip_signature_verify},
      {"FPS_TRACKER_REQUIRE_SIGNATURE_VERIFY", &config.policy.require_signature_verify},
      {"FPS_TRACKER_ALLOW_INSECURE_HTTP", &config.policy.allow_insecure_http},
      {"FPS_TRACKER_SKIP_COSIGN_CHECKSUM_VERIFY", &config.skip_tool_checksum_verify},
      {"FPS_TRACKER_SKIP_PATH_UPDATE", &config.skip_path_update},
    };
    for (const auto &[name, flag]: flags)
      {
        auto result = read_flag(lookup, name, *flag);
        if (!result)
          {
            return result.error();
          }
      }

    return config;
  }

  outcome::std_result<void> InstallerConfig::apply(const CommandLineOverrides &overrides)
  {
    auto given = [](const std::optional<std::string> &value) { return value && !value->empty(); };

    if (given(overrides.verifier))
      {
        auto kind = parse_verifier_kind(*overrides.verifier);
        if (!kind)
          {
            auto logger = Logging::create("trustinstall:config");
            logger->error("--verifier must be 'cosign' or 'builtin', got '{}'", *overrides.verifier);
            return kind.error();
          }
        verifier = kind.value();
      }
    if (given(overrides.release))
      {
        version = overrides.release;
      }
    if (given(overrides.install_dir))
      {
        install_dir = *overrides.install_dir;
      }
    if (given(overrides.base_url))
      {
        base_url_override = overrides.base_url;
      }
    if (given(overrides.cosign_pubkey))
      {
        policy.cosign_pubkey_override = std::filesystem::path(*overrides.cosign_pubkey);
      }
    return outcome::success();
  }

  bool InstallerConfig::report_conflicts() const
  {
    if (policy.skip_signature_verify && policy.require_signature_verify)
      {
        auto logger = Logging::create("trustinstall:config");
        logger->warn("Both FPS_TRACKER_SKIP_SIGNATURE_VERIFY and FPS_TRACKER_REQUIRE_SIGNATURE_VERIFY are set; "
                     "signature verification will be skipped");
        return true;
      }
    return false;
  }

} // namespace trustinstall
