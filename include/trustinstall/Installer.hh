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

#ifndef TRUSTINSTALL_INSTALLER_HH
#define TRUSTINSTALL_INSTALLER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>

#include "trustinstall/Config.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  enum class Stage
  {
    Start,
    ResolveTarget,
    ResolveVersion,
    Download,
    SignatureBranch,
    VerifyChecksum,
    Extract,
    Install,
    PathUpdate,
    Done,
  };

  const char *stage_name(Stage stage);

  enum class SignatureOutcome
  {
    Verified,
    SkippedByPolicy,
    AssetsUnavailable,
  };

  enum class PathOutcome
  {
    Skipped,
    AlreadyPresent,
    Added,
    NotOnPath,
    UpdateFailed,
  };

  struct InstallReport
  {
    std::string target;
    std::string version;
    std::filesystem::path installed_path;
    std::string binary_name;
    SignatureOutcome signature{SignatureOutcome::SkippedByPolicy};
    PathOutcome path{PathOutcome::Skipped};
  };

  /**
   * @brief Installs a release binary after establishing trust in it
   *
   * Runs the complete pipeline: resolve the platform target and release
   * version, download the archive and its checksum, verify the detached
   * signature as the trust policy demands, verify the SHA-256 checksum,
   * extract, install and optionally update the user PATH.
   *
   * The first failing stage ends the run. Nothing is written to the install
   * directory unless every verification succeeded, and the temporary
   * workspace is removed on every exit path.
   *
   * @par Thread Safety
   * This class is not thread-safe. Each thread should use its own instance.
   *
   * @par Example Usage
   * @code
   * auto config = trustinstall::InstallerConfig::from_environment(trustinstall::InstallerConfig::process_environment());
   * trustinstall::Installer installer(config.value());
   *
   * auto report = installer.run();
   * if (!report) {
   *     std::cerr << trustinstall::stage_name(installer.failed_stage()) << ": " << report.error().message() << "\n";
   * }
   * @endcode
   */
  class Installer
  {
  public:
    explicit Installer(InstallerConfig config);
    ~Installer();

    Installer(const Installer &) = delete;
    Installer &operator=(const Installer &) = delete;
    Installer(Installer &&) noexcept;
    Installer &operator=(Installer &&) noexcept;

    /**
     * @brief Runs the installation pipeline once
     *
     * @return outcome::std_result<InstallReport> What was installed where,
     *         or the InstallerError of the failing stage
     */
    outcome::std_result<InstallReport> run();

    /// Stage that produced the last error; Stage::Done after success.
    Stage failed_stage() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
  };

} // namespace trustinstall

#endif // TRUSTINSTALL_INSTALLER_HH
