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

#include "PublicKey.hh"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include "trustinstall/Errors.hh"

namespace trustinstall
{
  namespace
  {
    std::string openssl_error()
    {
      unsigned long code = ERR_get_error();
      if (code == 0)
        {
          return "unknown error";
        }
      char buffer[256];
      ERR_error_string_n(code, buffer, sizeof(buffer));
      ERR_clear_error();
      return buffer;
    }
  } // namespace

  PublicKey::PublicKey(EVP_PKEY *key)
    : key_(key, EVP_PKEY_free)
  {
  }

  outcome::std_result<std::shared_ptr<PublicKey>> PublicKey::from_pem(const std::string &pem)
  {
    auto logger = Logging::create("trustinstall:public_key");

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio)
      {
        logger->error("Failed to create BIO for public key");
        return InstallerError::InvalidPublicKey;
      }

    EVP_PKEY *key = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (key == nullptr)
      {
        logger->error("Failed to parse PEM public key: {}", openssl_error());
        return InstallerError::InvalidPublicKey;
      }

    switch (EVP_PKEY_base_id(key))
      {
      case EVP_PKEY_EC:
      case EVP_PKEY_RSA:
      case EVP_PKEY_ED25519:
        break;
      default:
        logger->error("Unsupported public key type {}", EVP_PKEY_base_id(key));
        EVP_PKEY_free(key);
        return InstallerError::InvalidPublicKey;
      }

    return std::make_shared<PublicKey>(key);
  }

  std::string PublicKey::get_algorithm_name() const
  {
    switch (EVP_PKEY_base_id(key_.get()))
      {
      case EVP_PKEY_EC:
        return "ECDSA";
      case EVP_PKEY_RSA:
        return "RSA";
      case EVP_PKEY_ED25519:
        return "Ed25519";
      default:
        return "unknown";
      }
  }

  outcome::std_result<void> PublicKey::verify_signature(std::string_view data, std::string_view signature) const
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx)
      {
        logger_->error("Failed to create digest context");
        return InstallerError::SignatureVerificationFailed;
      }

    const EVP_MD *md = EVP_PKEY_base_id(key_.get()) == EVP_PKEY_ED25519 ? nullptr : EVP_sha256();
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, key_.get()) != 1)
      {
        logger_->error("Failed to initialise signature verification: {}", openssl_error());
        return InstallerError::SignatureVerificationFailed;
      }

    int rc = EVP_DigestVerify(ctx.get(),
                              reinterpret_cast<const unsigned char *>(signature.data()),
                              signature.size(),
                              reinterpret_cast<const unsigned char *>(data.data()),
                              data.size());
    if (rc != 1)
      {
        logger_->error("{} signature verification failed: {}", get_algorithm_name(), openssl_error());
        return InstallerError::SignatureVerificationFailed;
      }

    return outcome::success();
  }

} // namespace trustinstall
