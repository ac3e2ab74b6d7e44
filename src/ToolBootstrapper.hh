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

#ifndef TOOL_BOOTSTRAPPER_HH
#define TOOL_BOOTSTRAPPER_HH

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "ChecksumVerifier.hh"
#include "Downloader.hh"
#include "Logging.hh"
#include "Platform.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /**
   * @brief Provides the cosign binary used for signature verification
   *
   * A cosign found on PATH is used as is. Otherwise the release binary for
   * the current platform is downloaded into the workspace and checked
   * against a table of pinned SHA-256 digests. An unpinned version is
   * refused unless the checksum bypass is set.
   */
  class ToolBootstrapper
  {
  public:
    using ToolLocator = std::function<std::optional<std::filesystem::path>(const std::string &name)>;

    static constexpr const char *default_download_root = "https://github.com/sigstore/cosign/releases/download";

    ToolBootstrapper(std::shared_ptr<Downloader> downloader,
                     ReleaseTarget target,
                     std::string version,
                     bool skip_checksum_verify,
                     ToolLocator locator = search_path_locator(),
                     std::string download_root = default_download_root);

    outcome::std_result<std::filesystem::path> ensure_tool(const std::filesystem::path &workspace);

    static std::optional<std::string> pinned_digest(const std::string &version, const std::string &asset);
    static ToolLocator search_path_locator();

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:bootstrap")};
    std::shared_ptr<Downloader> downloader_;
    ReleaseTarget target_;
    std::string version_;
    bool skip_checksum_verify_;
    ToolLocator locator_;
    std::string download_root_;
    ChecksumVerifier checksum_verifier_;
  };

} // namespace trustinstall

#endif // TOOL_BOOTSTRAPPER_HH
