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

#include "trustinstall/Installer.hh"

#include "InstallPipeline.hh"

#include "embedded_pubkey.h"

namespace trustinstall
{
  const char *stage_name(Stage stage)
  {
    switch (stage)
      {
      case Stage::Start:
        return "start";
      case Stage::ResolveTarget:
        return "resolve target";
      case Stage::ResolveVersion:
        return "resolve version";
      case Stage::Download:
        return "download";
      case Stage::SignatureBranch:
        return "signature verification";
      case Stage::VerifyChecksum:
        return "checksum verification";
      case Stage::Extract:
        return "extract";
      case Stage::Install:
        return "install";
      case Stage::PathUpdate:
        return "path update";
      case Stage::Done:
        return "done";
      }
    return "unknown";
  }

  class Installer::Impl
  {
  public:
    explicit Impl(InstallerConfig config)
      : pipeline_(std::move(config), production_dependencies())
    {
    }

    outcome::std_result<InstallReport> run()
    {
      return pipeline_.run();
    }

    Stage failed_stage() const
    {
      return pipeline_.failed_stage();
    }

  private:
    static InstallPipeline::Dependencies production_dependencies()
    {
      InstallPipeline::Dependencies dependencies;
      dependencies.embedded_public_key = embedded_cosign_pubkey;
      return dependencies;
    }

  private:
    InstallPipeline pipeline_;
  };

  Installer::Installer(InstallerConfig config)
    : pimpl(std::make_unique<Impl>(std::move(config)))
  {
  }

  Installer::~Installer() = default;
  Installer::Installer(Installer &&) noexcept = default;
  Installer &Installer::operator=(Installer &&) noexcept = default;

  outcome::std_result<InstallReport> Installer::run()
  {
    return pimpl->run();
  }

  Stage Installer::failed_stage() const
  {
    return pimpl->failed_stage();
  }

} // namespace trustinstall
