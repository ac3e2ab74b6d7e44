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

#include "ToolBootstrapper.hh"

#include <array>
#include <boost/process/search_path.hpp>
#include <fmt/format.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    struct PinnedDigest
    {
      const char *version;
      const char *asset;
      const char *sha256;
    };

    constexpr std::array<PinnedDigest, 3> pinned_digests{{
      {"v2.4.1", "cosign-linux-amd64", "8b24b946dd5809c6bd93de08033bcf6bc0ed7d336b7785787c080f574b89249b"},
      {"v2.4.1", "cosign-darwin-amd64", "666032ca283da92b6f7953965688fd51200fdc891a86c19e05c98b898ea0af4e"},
      {"v2.4.1", "cosign-darwin-arm64", "13343856b69f70388c4fe0b986a31dde5958e444b41be22d785d3dc5e1a9cc62"},
    }};
  } // namespace

  ToolBootstrapper::ToolBootstrapper(std::shared_ptr<Downloader> downloader,
                                     ReleaseTarget target,
                                     std::string version,
                                     bool skip_checksum_verify,
                                     ToolLocator locator,
                                     std::string download_root)
    : downloader_(std::move(downloader))
    , target_(std::move(target))
    , version_(std::move(version))
    , skip_checksum_verify_(skip_checksum_verify)
    , locator_(std::move(locator))
    , download_root_(std::move(download_root))
  {
  }

  std::optional<std::string> ToolBootstrapper::pinned_digest(const std::string &version, const std::string &asset)
  {
    for (const auto &pin: pinned_digests)
      {
        if (version == pin.version && asset == pin.asset)
          {
            return std::string(pin.sha256);
          }
      }
    return std::nullopt;
  }

  ToolBootstrapper::ToolLocator ToolBootstrapper::search_path_locator()
  {
    return [](const std::string &name) -> std::optional<std::filesystem::path> {
      auto found = boost::process::search_path(name);
      if (found.empty())
        {
          return std::nullopt;
        }
      return std::filesystem::path(found.string());
    };
  }

  outcome::std_result<std::filesystem::path> ToolBootstrapper::ensure_tool(const std::filesystem::path &workspace)
  {
    auto tool_name = target_.tool_binary_name();
    if (locator_)
      {
        if (auto existing = locator_(tool_name))
          {
            logger_->info("Using {} from PATH: {}", tool_name, existing->string());
            return *existing;
          }
      }

    const auto &asset = target_.tool_asset_name();
    auto expected = pinned_digest(version_, asset);
    if (!expected)
      {
        if (!skip_checksum_verify_)
          {
            logger_->error("No pinned checksum available for cosign {} ({})", version_, asset);
            return InstallerError::ToolChecksumUnpinned;
          }
        logger_->warn("cosign checksum verification skipped (FPS_TRACKER_SKIP_COSIGN_CHECKSUM_VERIFY=1)");
      }

    auto url = fmt::format("{}/{}/{}", download_root_, version_, asset);
    auto destination = workspace / tool_name;
    logger_->info("Downloading cosign {} ({})", version_, asset);

    auto downloaded = downloader_->download(url, destination);
    if (!downloaded)
      {
        if (downloaded.error() == InstallerError::Interrupted || downloaded.error() == InstallerError::InsecureTransportRefused)
          {
            return downloaded.error();
          }
        logger_->error("Failed to download cosign from {}: {}", url, downloaded.error().message());
        return InstallerError::ToolAcquisitionError;
      }

    if (expected)
      {
        auto verified = checksum_verifier_.verify_digest(destination, *expected);
        if (!verified)
          {
            logger_->error("Cosign checksum mismatch for {} ({})", asset, version_);
            return InstallerError::ToolAcquisitionError;
          }
      }

    std::error_code ec;
    std::filesystem::permissions(destination,
                                 std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add,
                                 ec);
    if (ec)
      {
        logger_->error("Failed to make {} executable: {}", destination.string(), ec.message());
        return InstallerError::ToolAcquisitionError;
      }

    return destination;
  }

} // namespace trustinstall
