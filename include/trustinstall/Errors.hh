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

#ifndef TRUSTINSTALL_ERRORS_HH
#define TRUSTINSTALL_ERRORS_HH

#include <string>
#include <system_error>

namespace trustinstall
{
  enum class InstallerError
  {
    UnsupportedPlatform = 1,
    VersionResolutionError,
    DownloadError,
    AssetNotFound,
    InsecureTransportRefused,
    InvalidUrl,
    ChecksumMismatch,
    MalformedChecksum,
    SignatureAssetsMissing,
    SignatureVerificationFailed,
    PublicKeyNotFound,
    InvalidPublicKey,
    ToolAcquisitionError,
    ToolChecksumUnpinned,
    ExtractionError,
    BinaryNotFound,
    IOError,
    InvalidConfiguration,
    Interrupted,
  };

  class InstallerErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "trustinstall";
    }

    std::string message(int ev) const override
    {
      switch (static_cast<InstallerError>(ev))
        {
        case InstallerError::UnsupportedPlatform:
          return "Unsupported platform";
        case InstallerError::VersionResolutionError:
          return "Could not resolve release version";
        case InstallerError::DownloadError:
          return "Download failed";
        case InstallerError::AssetNotFound:
          return "Release asset not found";
        case InstallerError::InsecureTransportRefused:
          return "Refusing insecure HTTP transport";
        case InstallerError::InvalidUrl:
          return "Invalid URL";
        case InstallerError::ChecksumMismatch:
          return "Checksum mismatch";
        case InstallerError::MalformedChecksum:
          return "Malformed checksum record";
        case InstallerError::SignatureAssetsMissing:
          return "Signature assets not available for this release";
        case InstallerError::SignatureVerificationFailed:
          return "Signature verification failed";
        case InstallerError::PublicKeyNotFound:
          return "Public key override not found";
        case InstallerError::InvalidPublicKey:
          return "Invalid public key";
        case InstallerError::ToolAcquisitionError:
          return "Could not acquire signature verification tool";
        case InstallerError::ToolChecksumUnpinned:
          return "No pinned checksum for signature verification tool";
        case InstallerError::ExtractionError:
          return "Archive extraction failed";
        case InstallerError::BinaryNotFound:
          return "Binary not found in release archive";
        case InstallerError::IOError:
          return "I/O error";
        case InstallerError::InvalidConfiguration:
          return "Invalid configuration";
        case InstallerError::Interrupted:
          return "Interrupted";
        default:
          return "Unknown error";
        }
    }
  };

  const std::error_category &installer_error_category();
  std::error_code make_error_code(InstallerError e);

  /**
   * @brief Returns the operator-facing remediation for an error
   *
   * The text tells the user how to fix the cause, or which setting bypasses
   * the check when bypassing is intentional. Empty when there is nothing
   * actionable to suggest.
   *
   * @param ec Error code, usually from the trustinstall category
   * @return std::string Remediation hint, possibly empty
   */
  std::string remediation(const std::error_code &ec);

} // namespace trustinstall

namespace std
{
  template<>
  struct is_error_code_enum<trustinstall::InstallerError> : std::true_type
  {
  };
} // namespace std

#endif // TRUSTINSTALL_ERRORS_HH
