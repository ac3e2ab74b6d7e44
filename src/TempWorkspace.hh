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

#ifndef TEMP_WORKSPACE_HH
#define TEMP_WORKSPACE_HH

#include <filesystem>
#include <memory>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace trustinstall
{
  /// Private temporary directory, removed with its contents on destruction.
  class TempWorkspace
  {
  public:
    static outcome::std_result<std::unique_ptr<TempWorkspace>> create(const std::filesystem::path &parent = {});

    explicit TempWorkspace(std::filesystem::path root);
    ~TempWorkspace();

    TempWorkspace(const TempWorkspace &) = delete;
    TempWorkspace &operator=(const TempWorkspace &) = delete;
    TempWorkspace(TempWorkspace &&) = delete;
    TempWorkspace &operator=(TempWorkspace &&) = delete;

    const std::filesystem::path &root() const;

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("trustinstall:workspace")};
    std::filesystem::path root_;
  };

} // namespace trustinstall

#endif // TEMP_WORKSPACE_HH
