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

#ifndef TRUSTINSTALL_CONFIG_HH
#define TRUSTINSTALL_CONFIG_HH

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /**
   * @brief Flags that decide how strictly an archive must be trusted
   *
   * Checksum verification is not part of the policy: it always runs.
   *
   * When both skip_signature_verify and require_signature_verify are set,
   * skip wins. InstallerConfig::report_conflicts() logs a warning for that
   * combination.
   */
  struct TrustPolicy
  {
    bool skip_signature_verify{false};
    bool require_signature_verify{false};
    std::optional<std::filesystem::path> cosign_pubkey_override;
    bool allow_insecure_http{false};
  };

  enum class VerifierKind
  {
    Cosign,  ///< Run the cosign binary, bootstrapping it when absent
    Builtin, ///< Verify in-process with OpenSSL
  };

  /// Values given on the command line; each one that is set replaces the environment value.
  struct CommandLineOverrides
  {
    std::optional<std::string> release;
    std::optional<std::string> install_dir;
    std::optional<std::string> base_url;
    std::optional<std::string> cosign_pubkey;
    std::optional<std::string> verifier;
  };

  /**
   * @brief Complete configuration of a single installer run
   *
   * Built from defaults, then the FPS_TRACKER_* environment, then command
   * line flags. Passed by value into the pipeline; nothing reads the process
   * environment after the config has been constructed.
   */
  struct InstallerConfig
  {
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &name)>;

    static constexpr const char *default_repo = "forgemypcgit/FPStracker";
    static constexpr const char *default_binary_stem = "fps-tracker";
    static constexpr const char *default_tool_version = "v2.4.1";

    std::string repo{default_repo};
    std::string binary_stem{default_binary_stem};
    std::optional<std::string> version;
    std::optional<std::string> base_url_override;
    std::filesystem::path install_dir;
    std::string tool_version{default_tool_version};
    bool skip_tool_checksum_verify{false};
    bool skip_path_update{false};
    VerifierKind verifier{VerifierKind::Cosign};
    TrustPolicy policy;

    int download_attempts{3};
    std::chrono::milliseconds retry_delay{std::chrono::seconds(1)};
    std::chrono::seconds request_timeout{30};

    /**
     * @brief Builds a configuration from FPS_TRACKER_* variables
     *
     * @param lookup Returns the value of an environment variable, or
     *               std::nullopt when it is not set
     *
     * @return outcome::std_result<InstallerConfig> The configuration, or
     *         InstallerError::InvalidConfiguration for unparsable values
     *
     * @par Example
     * @code
     * auto config = InstallerConfig::from_environment(InstallerConfig::process_environment());
     * @endcode
     */
    static outcome::std_result<InstallerConfig> from_environment(const EnvironmentLookup &lookup);

    /**
     * @brief Applies command line values on top of the environment
     *
     * The command line wins: a release tag given as argument replaces
     * FPS_TRACKER_VERSION. Empty values are ignored.
     *
     * @return InstallerError::InvalidConfiguration for an unknown verifier
     */
    outcome::std_result<void> apply(const CommandLineOverrides &overrides);

    /// Warns about contradicting settings; true when any were found.
    bool report_conflicts() const;

    static EnvironmentLookup process_environment();
    static std::filesystem::path default_install_dir(const EnvironmentLookup &lookup);
  };

  outcome::std_result<bool> parse_bool(const std::string &value);
  outcome::std_result<VerifierKind> parse_verifier_kind(const std::string &value);

} // namespace trustinstall

#endif // TRUSTINSTALL_CONFIG_HH
