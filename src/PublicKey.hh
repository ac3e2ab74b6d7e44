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

#ifndef PUBLIC_KEY_HH
#define PUBLIC_KEY_HH

#include <memory>
#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  class PublicKey
  {
  public:
    explicit PublicKey(EVP_PKEY *key);

    static outcome::std_result<std::shared_ptr<PublicKey>> from_pem(const std::string &pem);

    /**
     * @brief Verifies a raw signature over @p data
     *
     * EC and RSA keys use SHA-256 (RSA with PKCS#1 v1.5 padding). Ed25519
     * signs the message itself.
     *
     * @param data Signed bytes
     * @param signature DER (EC), raw (RSA, Ed25519) signature bytes
     * @return outcome::std_result<void> Success, or
     *         InstallerError::SignatureVerificationFailed
     */
    outcome::std_result<void> verify_signature(std::string_view data, std::string_view signature) const;

    std::string get_algorithm_name() const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:public_key")};
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  };

} // namespace trustinstall

#endif // PUBLIC_KEY_HH
