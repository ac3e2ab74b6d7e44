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

#ifndef COSIGN_VERIFIER_HH
#define COSIGN_VERIFIER_HH

#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

#include "trustinstall/SignatureVerifier.hh"
#include "Logging.hh"

namespace trustinstall
{
  /// Runs "cosign verify-blob" as a subprocess.
  class CosignVerifier : public SignatureVerifier
  {
  public:
    explicit CosignVerifier(std::filesystem::path tool);

    outcome::std_result<void> verify(const std::filesystem::path &archive,
                                     const std::filesystem::path &signature,
                                     const std::filesystem::path &public_key) override;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:cosign")};
    std::filesystem::path tool_;
  };

} // namespace trustinstall

#endif // COSIGN_VERIFIER_HH
