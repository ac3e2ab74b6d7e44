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

#ifndef CHECKSUM_VERIFIER_HH
#define CHECKSUM_VERIFIER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /**
   * @brief SHA-256 integrity check of downloaded files
   *
   * A checksum record is the content of a "<asset>.sha256" file: the first
   * whitespace separated token is the hex digest, anything after it is
   * ignored. Digests compare case-insensitively.
   */
  class ChecksumVerifier
  {
  public:
    static constexpr std::size_t digest_hex_length = 64;

    /// Lowercase hex SHA-256 digest of the file contents.
    outcome::std_result<std::string> compute(const std::filesystem::path &file) const;

    outcome::std_result<void> verify(const std::filesystem::path &file, const std::string &record) const;
    outcome::std_result<void> verify_digest(const std::filesystem::path &file, std::string_view expected) const;

    /// Extracts the digest from a checksum record; MalformedChecksum when absent.
    outcome::std_result<std::string> parse_record(const std::string &record) const;

    /**
     * @brief Looks up an asset in a SHA256SUMS style manifest
     *
     * Lines have the form "<digest> <name>" or "<digest> *<name>". Blank
     * lines and lines starting with '#' are ignored.
     */
    outcome::std_result<std::string> find_in_manifest(const std::string &manifest, std::string_view asset_name) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:checksum")};
  };

} // namespace trustinstall

#endif // CHECKSUM_VERIFIER_HH
