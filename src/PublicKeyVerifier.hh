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

#ifndef PUBLIC_KEY_VERIFIER_HH
#define PUBLIC_KEY_VERIFIER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

#include "trustinstall/SignatureVerifier.hh"
#include "Logging.hh"

namespace trustinstall
{
  /// Verifies cosign blob signatures in-process with OpenSSL.
  class PublicKeyVerifier : public SignatureVerifier
  {
  public:
    outcome::std_result<void> verify(const std::filesystem::path &archive,
                                     const std::filesystem::path &signature,
                                     const std::filesystem::path &public_key) override;

  private:
    outcome::std_result<std::string> read_file(const std::filesystem::path &file) const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:builtin_verifier")};
  };

} // namespace trustinstall

#endif // PUBLIC_KEY_VERIFIER_HH
