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

#ifndef VERSION_RESOLVER_HH
#define VERSION_RESOLVER_HH

#include <memory>
#include <optional>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Downloader.hh"
#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  class VersionResolver
  {
  public:
    /// Version reported when assets come from a mirror and no version was requested.
    static constexpr const char *custom_version = "custom";
    static constexpr const char *default_api_root = "https://api.github.com";
    static constexpr const char *default_release_root = "https://github.com";

    VersionResolver(std::shared_ptr<Downloader> downloader,
                    std::string repo,
                    std::optional<std::string> base_url_override,
                    std::string api_root = default_api_root);

    /**
     * @brief Determines the release tag to install
     *
     * An explicit version is returned verbatim without any network access.
     * With a base URL override and no explicit version the result is
     * custom_version. Otherwise the latest release is queried.
     *
     * @param explicit_version Requested tag, if any
     * @return outcome::std_result<std::string> Release tag, or
     *         InstallerError::VersionResolutionError
     */
    outcome::std_result<std::string> resolve(const std::optional<std::string> &explicit_version);

    /// Directory URL holding the assets of @p version, without trailing slash.
    std::string release_base_url(const std::string &version) const;

    outcome::std_result<std::string> parse_latest_release(const std::string &json_content) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:version")};
    std::shared_ptr<Downloader> downloader_;
    std::string repo_;
    std::optional<std::string> base_url_override_;
    std::string api_root_;
  };

} // namespace trustinstall

#endif // VERSION_RESOLVER_HH
