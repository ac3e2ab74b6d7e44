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

#include "Base64.hh"

#include <memory>
#include <openssl/evp.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  outcome::std_result<std::string> Base64::encode(std::string_view data)
  {
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()),
                                 reinterpret_cast<const unsigned char *>(data.data()),
                                 static_cast<int>(data.size()));
    if (length < 0)
      {
        return InstallerError::IOError;
      }
    encoded.resize(static_cast<std::size_t>(length));
    return encoded;
  }

  outcome::std_result<std::string> Base64::decode(std::string_view encoded)
  {
    std::unique_ptr<EVP_ENCODE_CTX, decltype(&EVP_ENCODE_CTX_free)> ctx(EVP_ENCODE_CTX_new(), EVP_ENCODE_CTX_free);
    if (!ctx)
      {
        return InstallerError::SignatureVerificationFailed;
      }

    EVP_DecodeInit(ctx.get());

    std::string decoded(encoded.size() + 3, '\0');
    int length = 0;
    if (EVP_DecodeUpdate(ctx.get(),
                         reinterpret_cast<unsigned char *>(decoded.data()),
                         &length,
                         reinterpret_cast<const unsigned char *>(encoded.data()),
                         static_cast<int>(encoded.size()))
        < 0)
      {
        return InstallerError::SignatureVerificationFailed;
      }

    int final_length = 0;
    if (EVP_DecodeFinal(ctx.get(), reinterpret_cast<unsigned char *>(decoded.data()) + length, &final_length) != 1)
      {
        return InstallerError::SignatureVerificationFailed;
      }

    decoded.resize(static_cast<std::size_t>(length + final_length));
    return decoded;
  }

} // namespace trustinstall
