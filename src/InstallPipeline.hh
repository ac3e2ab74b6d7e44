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

#ifndef INSTALL_PIPELINE_HH
#define INSTALL_PIPELINE_HH

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "trustinstall/Config.hh"
#include "trustinstall/Installer.hh"
#include "trustinstall/SignatureVerifier.hh"
#include "ArchiveExtractor.hh"
#include "BinaryInstaller.hh"
#include "ChecksumVerifier.hh"
#include "Downloader.hh"
#include "HttpClient.hh"
#include "Logging.hh"
#include "PathUpdater.hh"
#include "Platform.hh"
#include "ToolBootstrapper.hh"
#include "VersionResolver.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  class InstallPipeline
  {
  public:
    using TargetDetector = std::function<outcome::std_result<ReleaseTarget>()>;
    using VerifierFactory =
      std::function<outcome::std_result<std::unique_ptr<SignatureVerifier>>(const ReleaseTarget &target, const std::filesystem::path &workspace)>;

    /// Seams replaced by tests. Empty members select the production behaviour.
    struct Dependencies
    {
      std::shared_ptr<HttpClient> http_client;
      TargetDetector detect_target;
      VerifierFactory verifier_factory;
      ToolBootstrapper::ToolLocator tool_locator{ToolBootstrapper::search_path_locator()};
      std::shared_ptr<PathStore> path_store;
      std::filesystem::path workspace_parent;
      std::string api_root{VersionResolver::default_api_root};
      std::string embedded_public_key;
    };

    InstallPipeline(InstallerConfig config, Dependencies dependencies);
    ~InstallPipeline();

    InstallPipeline(const InstallPipeline &) = delete;
    InstallPipeline &operator=(const InstallPipeline &) = delete;
    InstallPipeline(InstallPipeline &&) = delete;
    InstallPipeline &operator=(InstallPipeline &&) = delete;

    outcome::std_result<InstallReport> run();

    Stage failed_stage() const;

  private:
    struct Artifact
    {
      std::filesystem::path archive;
      std::string checksum_record;
      std::filesystem::path signature;
      std::filesystem::path public_key;
    };

    outcome::std_result<void> execute(InstallReport &report);
    outcome::std_result<void> enter(Stage stage);
    outcome::std_result<void> download_release(const std::string &base_url, const std::string &asset_name, Artifact &artifact);
    outcome::std_result<std::string> fetch_checksum_record(const std::string &base_url, const std::string &asset_name);
    outcome::std_result<SignatureOutcome> run_signature_branch(const std::string &base_url, const std::string &asset_name, Artifact &artifact);
    outcome::std_result<bool> fetch_optional(const std::string &url, const std::filesystem::path &destination);
    outcome::std_result<std::optional<std::filesystem::path>> resolve_public_key(const std::string &base_url);
    outcome::std_result<std::unique_ptr<SignatureVerifier>> create_verifier();
    PathOutcome update_path();

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:pipeline")};
    InstallerConfig config_;
    Dependencies dependencies_;
    std::shared_ptr<Downloader> downloader_;
    ChecksumVerifier checksum_verifier_;
    ArchiveExtractor extractor_;
    BinaryInstaller binary_installer_;
    Stage stage_{Stage::Start};
    Stage failed_stage_{Stage::Done};
    std::optional<ReleaseTarget> target_;
    std::filesystem::path workspace_;
  };

} // namespace trustinstall

#endif // INSTALL_PIPELINE_HH
