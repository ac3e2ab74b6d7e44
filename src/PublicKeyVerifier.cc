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

#include "PublicKeyVerifier.hh"

#include <fstream>
#include <iterator>

#include "trustinstall/Errors.hh"
#include "Base64.hh"
#include "PublicKey.hh"

namespace trustinstall
{
  outcome::std_result<std::string> PublicKeyVerifier::read_file(const std::filesystem::path &file) const
  {
    std::ifstream in(file, std::ios::in | std::ios::binary);
    if (!in.is_open())
      {
        logger_->error("Failed to open file: {}", file.string());
        return InstallerError::IOError;
      }

    std::string content;
    try
      {
        content.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      }
    catch (const std::exception &e)
      {
        logger_->error("Error while reading file: {}: {}", file.string(), e.what());
        return InstallerError::IOError;
      }

    if (in.bad())
      {
        logger_->error("Error while reading file: {}", file.string());
        return InstallerError::IOError;
      }
    return content;
  }

  outcome::std_result<void> PublicKeyVerifier::verify(const std::filesystem::path &archive,
                                                      const std::filesystem::path &signature,
                                                      const std::filesystem::path &public_key)
  {
    auto pem = read_file(public_key);
    if (!pem)
      {
        return pem.error();
      }

    auto key = PublicKey::from_pem(pem.value());
    if (!key)
      {
        return key.error();
      }

    auto signature_b64 = read_file(signature);
    if (!signature_b64)
      {
        return signature_b64.error();
      }

    auto signature_data = Base64::decode(signature_b64.value());
    if (!signature_data || signature_data.value().empty())
      {
        logger_->error("Signature file {} is not valid base64", signature.filename().string());
        return InstallerError::SignatureVerificationFailed;
      }

    auto data = read_file(archive);
    if (!data)
      {
        return data.error();
      }

    auto result = key.value()->verify_signature(data.value(), signature_data.value());
    if (!result)
      {
        logger_->error("Signature of {} does not match {} key", archive.filename().string(), key.value()->get_algorithm_name());
        return result.error();
      }

    logger_->info("Signature verification succeeded ({})", key.value()->get_algorithm_name());
    return outcome::success();
  }

} // namespace trustinstall
