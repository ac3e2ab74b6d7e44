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

#include "Interrupt.hh"

#include <csignal>

namespace trustinstall
{
  namespace
  {
    volatile std::sig_atomic_t interrupt_flag = 0;

    void on_interrupt_signal(int /*signal*/)
    {
      interrupt_flag = 1;
    }
  } // namespace

  void install_interrupt_handlers()
  {
    std::signal(SIGINT, on_interrupt_signal);
    std::signal(SIGTERM, on_interrupt_signal);
  }

  bool interrupted()
  {
    return interrupt_flag != 0;
  }

  void reset_interrupted()
  {
    interrupt_flag = 0;
  }

  void raise_interrupted()
  {
    interrupt_flag = 1;
  }

} // namespace trustinstall
