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

#ifndef TRUSTINSTALL_SIGNATURE_VERIFIER_HH
#define TRUSTINSTALL_SIGNATURE_VERIFIER_HH

#include <filesystem>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /**
   * @brief Checks a detached signature over a downloaded archive
   *
   * Implementations confirm that @p signature was produced over exactly the
   * bytes of @p archive by the private half of @p public_key. The signature
   * file uses the cosign blob format: base64 text of the raw signature.
   *
   * Any failure is final. Callers never retry a failed verification and
   * never install an archive whose verification failed.
   *
   * @par Example
   * @code
   * std::unique_ptr<SignatureVerifier> verifier = std::make_unique<PublicKeyVerifier>();
   * auto result = verifier->verify(archive, archive_sig, cosign_pub);
   * if (!result)
   *   {
   *     // result.error() == InstallerError::SignatureVerificationFailed
   *   }
   * @endcode
   */
  class SignatureVerifier
  {
  public:
    virtual ~SignatureVerifier() = default;

    /**
     * @brief Verifies @p signature over @p archive with @p public_key
     *
     * @param archive Downloaded release archive
     * @param signature Detached signature file
     * @param public_key PEM encoded public key file
     *
     * @return outcome::std_result<void> Success when the signature is valid,
     *         InstallerError::SignatureVerificationFailed when it is not,
     *         InstallerError::InvalidPublicKey or InstallerError::IOError
     *         when the inputs cannot be used
     */
    virtual outcome::std_result<void> verify(const std::filesystem::path &archive,
                                             const std::filesystem::path &signature,
                                             const std::filesystem::path &public_key) = 0;
  };

} // namespace trustinstall

#endif // TRUSTINSTALL_SIGNATURE_VERIFIER_HH
