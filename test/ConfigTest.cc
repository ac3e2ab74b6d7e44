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

#include <map>
#include <gtest/gtest.h>

#include "TestUtils.hh"
#include "trustinstall/Errors.hh"

namespace trustinstall::test
{
  class ConfigTest : public ::testing::Test
  {
  protected:
    InstallerConfig::EnvironmentLookup lookup()
    {
      return [this](const std::string &name) -> std::optional<std::string> {
        auto it = env_.find(name);
        if (it == env_.end())
          {
            return std::nullopt;
          }
        return it->second;
      };
    }

    std::map<std::string, std::string> env_{{"HOME", "/home/tester"}, {"LOCALAPPDATA", "C:\\Users\\tester\\AppData\\Local"}};
  };

  TEST_F(ConfigTest, DefaultsWithoutEnvironment)
  {
    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config) << config.error().message();

    EXPECT_EQ(config.value().repo, "forgemypcgit/FPStracker");
    EXPECT_EQ(config.value().binary_stem, "fps-tracker");
    EXPECT_EQ(config.value().tool_version, "v2.4.1");
    EXPECT_FALSE(config.value().version);
    EXPECT_FALSE(config.value().base_url_override);
    EXPECT_FALSE(config.value().policy.skip_signature_verify);
    EXPECT_FALSE(config.value().policy.require_signature_verify);
    EXPECT_FALSE(config.value().policy.allow_insecure_http);
    EXPECT_FALSE(config.value().policy.cosign_pubkey_override);
    EXPECT_FALSE(config.value().skip_path_update);
    EXPECT_EQ(config.value().verifier, VerifierKind::Cosign);
    EXPECT_EQ(config.value().download_attempts, 3);
    EXPECT_EQ(config.value().request_timeout, std::chrono::seconds(30));
#ifdef _WIN32
    EXPECT_EQ(config.value().install_dir.string(), (std::filesystem::path("C:\\Users\\tester\\AppData\\Local") / "fps-tracker" / "bin").string());
#else
    EXPECT_EQ(config.value().install_dir.string(), "/home/tester/.local/bin");
#endif
  }

  TEST_F(ConfigTest, ReadsEveryVariable)
  {
    env_["FPS_TRACKER_REPO"] = "someone/fork";
    env_["FPS_TRACKER_VERSION"] = "v1.2.3";
    env_["FPS_TRACKER_BASE_URL"] = "https://mirror.example.com/fps/";
    env_["FPS_TRACKER_INSTALL_DIR"] = "/opt/fps/bin";
    env_["FPS_TRACKER_COSIGN_VERSION"] = "v2.5.0";
    env_["FPS_TRACKER_COSIGN_PUBKEY"] = "/etc/fps/cosign.pub";
    env_["FPS_TRACKER_SIGNATURE_VERIFIER"] = "Builtin";
    env_["FPS_TRACKER_SKIP_SIGNATURE_VERIFY"] = "0";
    env_["FPS_TRACKER_REQUIRE_SIGNATURE_VERIFY"] = "yes";
    env_["FPS_TRACKER_ALLOW_INSECURE_HTTP"] = "TRUE";
    env_["FPS_TRACKER_SKIP_COSIGN_CHECKSUM_VERIFY"] = "on";
    env_["FPS_TRACKER_SKIP_PATH_UPDATE"] = "1";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config) << config.error().message();

    EXPECT_EQ(config.value().repo, "someone/fork");
    EXPECT_EQ(config.value().version, std::optional<std::string>("v1.2.3"));
    EXPECT_EQ(config.value().base_url_override, std::optional<std::string>("https://mirror.example.com/fps/"));
    EXPECT_EQ(config.value().install_dir.string(), "/opt/fps/bin");
    EXPECT_EQ(config.value().tool_version, "v2.5.0");
    ASSERT_TRUE(config.value().policy.cosign_pubkey_override.has_value());
    EXPECT_EQ(config.value().policy.cosign_pubkey_override->string(), "/etc/fps/cosign.pub");
    EXPECT_EQ(config.value().verifier, VerifierKind::Builtin);
    EXPECT_FALSE(config.value().policy.skip_signature_verify);
    EXPECT_TRUE(config.value().policy.require_signature_verify);
    EXPECT_TRUE(config.value().policy.allow_insecure_http);
    EXPECT_TRUE(config.value().skip_tool_checksum_verify);
    EXPECT_TRUE(config.value().skip_path_update);
  }

  TEST_F(ConfigTest, EmptyValuesAreUnset)
  {
    env_["FPS_TRACKER_VERSION"] = "";
    env_["FPS_TRACKER_BASE_URL"] = "";
    env_["FPS_TRACKER_SKIP_SIGNATURE_VERIFY"] = "";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config);
    EXPECT_FALSE(config.value().version);
    EXPECT_FALSE(config.value().base_url_override);
    EXPECT_FALSE(config.value().policy.skip_signature_verify);
  }

  TEST_F(ConfigTest, RejectsUnparsableFlag)
  {
    env_["FPS_TRACKER_ALLOW_INSECURE_HTTP"] = "maybe";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error(), InstallerError::InvalidConfiguration);
  }

  TEST_F(ConfigTest, RejectsUnknownVerifier)
  {
    env_["FPS_TRACKER_SIGNATURE_VERIFIER"] = "gpg";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error(), InstallerError::InvalidConfiguration);
  }

  TEST_F(ConfigTest, WarnsWhenSkipAndRequireAreBothSet)
  {
    env_["FPS_TRACKER_SKIP_SIGNATURE_VERIFY"] = "1";
    env_["FPS_TRACKER_REQUIRE_SIGNATURE_VERIFY"] = "1";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config);

    LogCapture capture("trustinstall:config");
    EXPECT_TRUE(config.value().report_conflicts());
    EXPECT_TRUE(capture.contains("FPS_TRACKER_SKIP_SIGNATURE_VERIFY"));
    EXPECT_TRUE(capture.contains("FPS_TRACKER_REQUIRE_SIGNATURE_VERIFY"));
  }

  TEST_F(ConfigTest, NoConflictByDefault)
  {
    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config);
    EXPECT_FALSE(config.value().report_conflicts());
  }

  TEST_F(ConfigTest, CommandLineReleaseWinsOverEnvironment)
  {
    env_["FPS_TRACKER_VERSION"] = "v0.1.0";
    env_["FPS_TRACKER_INSTALL_DIR"] = "/opt/env/bin";
    env_["FPS_TRACKER_SIGNATURE_VERIFIER"] = "cosign";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config);

    CommandLineOverrides overrides;
    overrides.release = "v0.2.5";
    overrides.install_dir = "/opt/cli/bin";
    overrides.base_url = "https://mirror.example.com/fps";
    overrides.cosign_pubkey = "/etc/fps/cli.pub";
    overrides.verifier = "builtin";
    ASSERT_TRUE(config.value().apply(overrides));

    EXPECT_EQ(config.value().version.value_or(""), "v0.2.5");
    EXPECT_EQ(config.value().install_dir.string(), "/opt/cli/bin");
    EXPECT_EQ(config.value().base_url_override.value_or(""), "https://mirror.example.com/fps");
    ASSERT_TRUE(config.value().policy.cosign_pubkey_override);
    EXPECT_EQ(config.value().policy.cosign_pubkey_override->string(), "/etc/fps/cli.pub");
    EXPECT_EQ(config.value().verifier, VerifierKind::Builtin);
  }

  TEST_F(ConfigTest, EnvironmentKeptWithoutCommandLineValues)
  {
    env_["FPS_TRACKER_VERSION"] = "v0.1.0";

    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config);

    CommandLineOverrides overrides;
    overrides.release = "";
    ASSERT_TRUE(config.value().apply(overrides));
    EXPECT_EQ(config.value().version.value_or(""), "v0.1.0");
  }

  TEST_F(ConfigTest, CommandLineRejectsUnknownVerifier)
  {
    auto config = InstallerConfig::from_environment(lookup());
    ASSERT_TRUE(config);

    CommandLineOverrides overrides;
    overrides.verifier = "gpg";
    auto applied = config.value().apply(overrides);
    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error(), InstallerError::InvalidConfiguration);
  }

  TEST(ParseBoolTest, AcceptsCommonSpellings)
  {
    for (const auto *value: {"1", "true", "TRUE", "yes", "On"})
      {
        auto parsed = parse_bool(value);
        ASSERT_TRUE(parsed) << value;
        EXPECT_TRUE(parsed.value()) << value;
      }
    for (const auto *value: {"", "0", "false", "No", "OFF"})
      {
        auto parsed = parse_bool(value);
        ASSERT_TRUE(parsed) << value;
        EXPECT_FALSE(parsed.value()) << value;
      }
    EXPECT_FALSE(parse_bool("2"));
  }
} // namespace trustinstall::test
