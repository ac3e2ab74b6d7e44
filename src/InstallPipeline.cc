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

#include "InstallPipeline.hh"

#include <fstream>
#include <fmt/format.h>

#include "trustinstall/Errors.hh"
#include "BeastHttpClient.hh"
#include "CosignVerifier.hh"
#include "Interrupt.hh"
#include "PublicKeyVerifier.hh"
#include "TempWorkspace.hh"

namespace trustinstall
{
  namespace
  {
    constexpr const char *CHECKSUM_MANIFEST = "SHA256SUMS";
    constexpr const char *PUBLIC_KEY_ASSET = "cosign.pub";

    std::shared_ptr<HttpClient> make_http_client(const std::shared_ptr<HttpClient> &client, std::chrono::seconds timeout)
    {
      if (client)
        {
          return client;
        }
      return std::make_shared<BeastHttpClient>(timeout);
    }
  } // namespace

  InstallPipeline::InstallPipeline(InstallerConfig config, Dependencies dependencies)
    : config_(std::move(config))
    , dependencies_(std::move(dependencies))
  {
    downloader_ = std::make_shared<Downloader>(make_http_client(dependencies_.http_client, config_.request_timeout),
                                               config_.policy,
                                               RetryPolicy{config_.download_attempts, config_.retry_delay});
  }

  InstallPipeline::~InstallPipeline() = default;

  Stage InstallPipeline::failed_stage() const
  {
    return failed_stage_;
  }

  outcome::std_result<InstallReport> InstallPipeline::run()
  {
    stage_ = Stage::Start;
    failed_stage_ = Stage::Done;

    InstallReport report;
    auto result = execute(report);
    if (!result)
      {
        failed_stage_ = stage_;
        logger_->debug("Pipeline failed in stage {}: {}", stage_name(stage_), result.error().message());
        return result.error();
      }

    stage_ = Stage::Done;
    return report;
  }

  outcome::std_result<void> InstallPipeline::enter(Stage stage)
  {
    stage_ = stage;
    if (interrupted())
      {
        logger_->warn("Interrupted before {}", stage_name(stage));
        return InstallerError::Interrupted;
      }
    logger_->debug("Stage: {}", stage_name(stage));
    return outcome::success();
  }

  outcome::std_result<void> InstallPipeline::execute(InstallReport &report)
  {
    auto entered = enter(Stage::ResolveTarget);
    if (!entered)
      {
        return entered.error();
      }

    auto target = dependencies_.detect_target ? dependencies_.detect_target() : detect_target();
    if (!target)
      {
        return target.error();
      }
    target_ = target.value();
    report.target = target_->triple();
    report.binary_name = target_->binary_name(config_.binary_stem);

    entered = enter(Stage::ResolveVersion);
    if (!entered)
      {
        return entered.error();
      }

    VersionResolver resolver(downloader_, config_.repo, config_.base_url_override, dependencies_.api_root);
    auto version = resolver.resolve(config_.version);
    if (!version)
      {
        return version.error();
      }
    report.version = version.value();

    auto base_url = resolver.release_base_url(report.version);
    auto asset_name = target_->asset_name(config_.binary_stem);

    entered = enter(Stage::Download);
    if (!entered)
      {
        return entered.error();
      }

    auto workspace = TempWorkspace::create(dependencies_.workspace_parent);
    if (!workspace)
      {
        return workspace.error();
      }
    workspace_ = workspace.value()->root();

    logger_->info("Installing {} {} ({})", config_.binary_stem, report.version, report.target);

    Artifact artifact;
    auto downloaded = download_release(base_url, asset_name, artifact);
    if (!downloaded)
      {
        return downloaded.error();
      }

    entered = enter(Stage::SignatureBranch);
    if (!entered)
      {
        return entered.error();
      }

    auto signature = run_signature_branch(base_url, asset_name, artifact);
    if (!signature)
      {
        return signature.error();
      }
    report.signature = signature.value();

    entered = enter(Stage::VerifyChecksum);
    if (!entered)
      {
        return entered.error();
      }

    auto checksum = checksum_verifier_.verify(artifact.archive, artifact.checksum_record);
    if (!checksum)
      {
        return checksum.error();
      }
    logger_->info("Checksum verified for {}", asset_name);

    entered = enter(Stage::Extract);
    if (!entered)
      {
        return entered.error();
      }

    auto extract_dir = workspace_ / "extract";
    auto extracted = extractor_.extract(artifact.archive, extract_dir);
    if (!extracted)
      {
        return extracted.error();
      }

    auto binary = extractor_.find_binary(extract_dir, report.binary_name);
    if (!binary)
      {
        return binary.error();
      }

    entered = enter(Stage::Install);
    if (!entered)
      {
        return entered.error();
      }

    auto installed = binary_installer_.install(binary.value(), config_.install_dir, report.binary_name);
    if (!installed)
      {
        return installed.error();
      }
    report.installed_path = installed.value();

    entered = enter(Stage::PathUpdate);
    if (!entered)
      {
        return entered.error();
      }

    report.path = config_.skip_path_update ? PathOutcome::Skipped : update_path();
    return outcome::success();
  }

  outcome::std_result<void> InstallPipeline::download_release(const std::string &base_url, const std::string &asset_name, Artifact &artifact)
  {
    artifact.archive = workspace_ / asset_name;

    auto url = fmt::format("{}/{}", base_url, asset_name);
    auto archive = downloader_->download(url, artifact.archive);
    if (!archive)
      {
        logger_->error("Failed to download {}: {}", url, archive.error().message());
        return archive.error();
      }

    auto record = fetch_checksum_record(base_url, asset_name);
    if (!record)
      {
        return record.error();
      }
    artifact.checksum_record = record.value();
    return outcome::success();
  }

  outcome::std_result<std::string> InstallPipeline::fetch_checksum_record(const std::string &base_url, const std::string &asset_name)
  {
    auto record = downloader_->fetch_text(fmt::format("{}/{}.sha256", base_url, asset_name));
    if (record)
      {
        return record.value();
      }
    if (record.error() != InstallerError::AssetNotFound)
      {
        logger_->error("Failed to download checksum of {}: {}", asset_name, record.error().message());
        return record.error();
      }

    logger_->info("{}.sha256 is not published; falling back to {}", asset_name, CHECKSUM_MANIFEST);
    auto manifest = downloader_->fetch_text(fmt::format("{}/{}", base_url, CHECKSUM_MANIFEST));
    if (!manifest)
      {
        if (manifest.error() == InstallerError::AssetNotFound)
          {
            logger_->error("Release publishes no checksum for {}", asset_name);
            return InstallerError::MalformedChecksum;
          }
        logger_->error("Failed to download {}: {}", CHECKSUM_MANIFEST, manifest.error().message());
        return manifest.error();
      }

    return checksum_verifier_.find_in_manifest(manifest.value(), asset_name);
  }

  outcome::std_result<bool> InstallPipeline::fetch_optional(const std::string &url, const std::filesystem::path &destination)
  {
    auto result = downloader_->download(url, destination);
    if (result)
      {
        return true;
      }

    auto ec = result.error();
    if (ec == InstallerError::InsecureTransportRefused || ec == InstallerError::InvalidUrl || ec == InstallerError::Interrupted)
      {
        return outcome::failure(ec);
      }

    logger_->debug("Optional asset {} unavailable: {}", url, ec.message());
    return false;
  }

  outcome::std_result<std::optional<std::filesystem::path>> InstallPipeline::resolve_public_key(const std::string &base_url)
  {
    if (config_.policy.cosign_pubkey_override)
      {
        logger_->info("Using public key override {}", config_.policy.cosign_pubkey_override->string());
        return std::optional<std::filesystem::path>(*config_.policy.cosign_pubkey_override);
      }

    auto destination = workspace_ / PUBLIC_KEY_ASSET;

    if (!dependencies_.embedded_public_key.empty())
      {
        std::ofstream out(destination, std::ios::out | std::ios::binary | std::ios::trunc);
        out << dependencies_.embedded_public_key;
        out.close();
        if (out.fail())
          {
            logger_->error("Failed to write embedded public key to {}", destination.string());
            return InstallerError::IOError;
          }
        logger_->info("Using embedded public key");
        return std::optional<std::filesystem::path>(destination);
      }

    auto fetched = fetch_optional(fmt::format("{}/{}", base_url, PUBLIC_KEY_ASSET), destination);
    if (!fetched)
      {
        return fetched.error();
      }
    if (!fetched.value())
      {
        return std::optional<std::filesystem::path>();
      }
    return std::optional<std::filesystem::path>(destination);
  }

  outcome::std_result<SignatureOutcome> InstallPipeline::run_signature_branch(const std::string &base_url,
                                                                             const std::string &asset_name,
                                                                             Artifact &artifact)
  {
    const auto &policy = config_.policy;

    if (policy.skip_signature_verify)
      {
        logger_->warn("Signature verification skipped (FPS_TRACKER_SKIP_SIGNATURE_VERIFY=1)");
        return SignatureOutcome::SkippedByPolicy;
      }

    if (policy.cosign_pubkey_override)
      {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*policy.cosign_pubkey_override, ec))
          {
            logger_->error("Public key override not found: {}", policy.cosign_pubkey_override->string());
            return InstallerError::PublicKeyNotFound;
          }
      }

    artifact.signature = workspace_ / (asset_name + ".sig");
    auto have_signature = fetch_optional(fmt::format("{}/{}.sig", base_url, asset_name), artifact.signature);
    if (!have_signature)
      {
        return have_signature.error();
      }

    std::optional<std::filesystem::path> public_key;
    if (have_signature.value())
      {
        auto key = resolve_public_key(base_url);
        if (!key)
          {
            return key.error();
          }
        public_key = key.value();
      }

    if (!have_signature.value() || !public_key)
      {
        if (policy.require_signature_verify)
          {
            logger_->error("Signature assets not available for this release");
            return InstallerError::SignatureAssetsMissing;
          }
        logger_->warn("Signature assets not available for this release; skipping signature verification");
        return SignatureOutcome::AssetsUnavailable;
      }
    artifact.public_key = *public_key;

    auto verifier = create_verifier();
    if (!verifier)
      {
        return verifier.error();
      }

    auto verified = verifier.value()->verify(artifact.archive, artifact.signature, artifact.public_key);
    if (!verified)
      {
        logger_->error("Signature verification of {} failed: {}", asset_name, verified.error().message());
        return verified.error();
      }

    logger_->info("Signature verification succeeded");
    return SignatureOutcome::Verified;
  }

  outcome::std_result<std::unique_ptr<SignatureVerifier>> InstallPipeline::create_verifier()
  {
    if (dependencies_.verifier_factory)
      {
        return dependencies_.verifier_factory(*target_, workspace_);
      }

    std::unique_ptr<SignatureVerifier> verifier;
    if (config_.verifier == VerifierKind::Builtin)
      {
        verifier = std::make_unique<PublicKeyVerifier>();
        return std::move(verifier);
      }

    ToolBootstrapper bootstrapper(downloader_, *target_, config_.tool_version, config_.skip_tool_checksum_verify, dependencies_.tool_locator);
    auto tool = bootstrapper.ensure_tool(workspace_);
    if (!tool)
      {
        return tool.error();
      }

    verifier = std::make_unique<CosignVerifier>(tool.value());
    return std::move(verifier);
  }

  PathOutcome InstallPipeline::update_path()
  {
    auto store = dependencies_.path_store ? dependencies_.path_store : PathUpdater::default_store();
    PathUpdater updater(store);

    auto status = updater.ensure_on_path(config_.install_dir);
    if (!status)
      {
        logger_->warn("Failed to update PATH: {}", status.error().message());
        return PathOutcome::UpdateFailed;
      }

    switch (status.value())
      {
      case PathStatus::AlreadyPresent:
        return PathOutcome::AlreadyPresent;
      case PathStatus::Added:
        return PathOutcome::Added;
      case PathStatus::NotOnPath:
        return PathOutcome::NotOnPath;
      }
    return PathOutcome::NotOnPath;
  }

} // namespace trustinstall
