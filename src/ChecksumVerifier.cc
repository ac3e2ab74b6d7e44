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

#include "ChecksumVerifier.hh"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <openssl/evp.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

    bool is_hex_digest(std::string_view token)
    {
      return token.size() == ChecksumVerifier::digest_hex_length
             && std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    std::string to_lower(std::string_view text)
    {
      std::string result(text);
      std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
      return result;
    }
  } // namespace

  outcome::std_result<std::string> ChecksumVerifier::compute(const std::filesystem::path &file) const
  {
    std::ifstream in(file, std::ios::in | std::ios::binary);
    if (!in.is_open())
      {
        logger_->error("Failed to open file: {}", file.string());
        return InstallerError::IOError;
      }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
      {
        logger_->error("Failed to initialise SHA-256 digest");
        return InstallerError::IOError;
      }

    std::array<char, READ_CHUNK_SIZE> buffer{};
    while (in)
      {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = in.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1)
          {
            logger_->error("Failed to update SHA-256 digest for {}", file.string());
            return InstallerError::IOError;
          }
      }
    if (in.bad())
      {
        logger_->error("Error while reading file: {}", file.string());
        return InstallerError::IOError;
      }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1)
      {
        logger_->error("Failed to finalise SHA-256 digest for {}", file.string());
        return InstallerError::IOError;
      }

    std::string hex;
    hex.reserve(digest_length * 2);
    for (unsigned int i = 0; i < digest_length; ++i)
      {
        hex += fmt::format("{:02x}", digest[i]);
      }
    return hex;
  }

  outcome::std_result<std::string> ChecksumVerifier::parse_record(const std::string &record) const
  {
    std::istringstream stream(record);
    std::string token;
    stream >> token;

    if (token.empty())
      {
        logger_->error("Checksum record is empty");
        return InstallerError::MalformedChecksum;
      }
    if (!is_hex_digest(token))
      {
        logger_->warn("Checksum record does not look like a SHA-256 digest: {}", token);
      }
    return to_lower(token);
  }

  outcome::std_result<std::string> ChecksumVerifier::find_in_manifest(const std::string &manifest, std::string_view asset_name) const
  {
    std::istringstream stream(manifest);
    std::string line;

    while (std::getline(stream, line))
      {
        std::istringstream fields(line);
        std::string digest;
        std::string name;
        fields >> digest >> name;

        if (digest.empty() || digest.front() == '#')
          {
            continue;
          }
        if (!name.empty() && name.front() == '*')
          {
            name.erase(0, 1);
          }
        if (name != asset_name)
          {
            continue;
          }

        if (!is_hex_digest(digest))
          {
            logger_->warn("Manifest entry for {} does not look like a SHA-256 digest: {}", asset_name, digest);
          }
        return to_lower(digest);
      }

    logger_->error("Checksum manifest has no entry for {}", asset_name);
    return InstallerError::MalformedChecksum;
  }

  outcome::std_result<void> ChecksumVerifier::verify(const std::filesystem::path &file, const std::string &record) const
  {
    auto expected = parse_record(record);
    if (!expected)
      {
        return expected.error();
      }
    return verify_digest(file, expected.value());
  }

  outcome::std_result<void> ChecksumVerifier::verify_digest(const std::filesystem::path &file, std::string_view expected) const
  {
    auto actual = compute(file);
    if (!actual)
      {
        return actual.error();
      }

    if (to_lower(expected) != actual.value())
      {
        logger_->error("Checksum mismatch for {}: expected {}, actual {}", file.filename().string(), expected, actual.value());
        return InstallerError::ChecksumMismatch;
      }

    logger_->debug("Checksum verified for {}: {}", file.filename().string(), actual.value());
    return outcome::success();
  }

} // namespace trustinstall
