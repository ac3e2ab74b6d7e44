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

#ifndef PLATFORM_HH
#define PLATFORM_HH

#include <string>
#include <string_view>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  enum class ArchiveFormat
  {
    TarGz,
    Zip,
  };

  class ReleaseTarget
  {
  public:
    ReleaseTarget(std::string triple, ArchiveFormat format, bool windows, std::string tool_asset);

    const std::string &triple() const;
    ArchiveFormat archive_format() const;
    bool is_windows() const;

    std::string archive_extension() const;
    std::string asset_name(std::string_view binary_stem) const;
    std::string binary_name(std::string_view binary_stem) const;
    const std::string &tool_asset_name() const;
    std::string tool_binary_name() const;

  private:
    std::string triple_;
    ArchiveFormat format_;
    bool windows_;
    std::string tool_asset_;
  };

  outcome::std_result<ReleaseTarget> resolve_target(std::string_view os, std::string_view arch);
  outcome::std_result<ReleaseTarget> detect_target();

} // namespace trustinstall

#endif // PLATFORM_HH
