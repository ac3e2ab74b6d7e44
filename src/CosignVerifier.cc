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

#include "CosignVerifier.hh"

#include <string>
#include <boost/process.hpp>

#include "trustinstall/Errors.hh"

namespace bp = boost::process;

namespace trustinstall
{
  CosignVerifier::CosignVerifier(std::filesystem::path tool)
    : tool_(std::move(tool))
  {
  }

  outcome::std_result<void> CosignVerifier::verify(const std::filesystem::path &archive,
                                                   const std::filesystem::path &signature,
                                                   const std::filesystem::path &public_key)
  {
    logger_->debug("Running {} verify-blob for {}", tool_.string(), archive.filename().string());

    int exit_code = -1;
    try
      {
        bp::ipstream errors;
        bp::child child(tool_.string(),
                        "verify-blob",
                        "--key",
                        public_key.string(),
                        "--signature",
                        signature.string(),
                        archive.string(),
                        bp::std_out > bp::null,
                        bp::std_err > errors,
                        bp::std_in < bp::null);

        std::string line;
        while (std::getline(errors, line))
          {
            if (!line.empty())
              {
                logger_->info("cosign: {}", line);
              }
          }

        child.wait();
        exit_code = child.exit_code();
      }
    catch (const bp::process_error &e)
      {
        logger_->error("Failed to run {}: {}", tool_.string(), e.what());
        return InstallerError::ToolAcquisitionError;
      }

    if (exit_code != 0)
      {
        logger_->error("cosign rejected the signature of {} (exit code {})", archive.filename().string(), exit_code);
        return InstallerError::SignatureVerificationFailed;
      }

    logger_->info("Signature verification succeeded");
    return outcome::success();
  }

} // namespace trustinstall
