#pragma once

#include <iostream>
#include <ostream>
#include <streambuf>

#include "customio/color_printer.hpp"

namespace customio {

// Terminal output of the CLI. Operation transcripts and results go to
// stdout; diagnostics go to stderr, filtered by verbosity
// (0 silent .. 5 trace, see CliCtx::verbosity_level()).
class ConsoleOutput {
  struct NullBuffer : std::streambuf {
    int overflow(int c) override { return c; }
  };

  size_t verbosity_;
  ColorPrinter out_;
  ColorPrinter err_;
  NullBuffer null_buffer_;
  std::ostream null_stream_{&null_buffer_};

public:
  explicit ConsoleOutput(size_t verbosity,
                         std::ostream &out = std::cout,
                         std::ostream &err = std::cerr)
      : verbosity_(verbosity), out_(out), err_(err) {}

  ConsoleOutput(const ConsoleOutput &) = delete;
  ConsoleOutput &operator=(const ConsoleOutput &) = delete;

  size_t verbosity() const { return verbosity_; }

  // Results; printed unless silent.
  std::ostream &out() { return verbosity_ > 0 ? out_.stream() : null_stream_; }
  ColorPrinter &printer() { return out_; }

  ColorPrinter::ColorProxy error() {
    return verbosity_ >= 1 ? err_.red() : ColorPrinter::ColorProxy(null_stream_, "", false);
  }
  ColorPrinter::ColorProxy warning() {
    return verbosity_ >= 2 ? err_.yellow() : ColorPrinter::ColorProxy(null_stream_, "", false);
  }
  ColorPrinter::ColorProxy info() {
    return verbosity_ >= 3 ? err_.plain() : ColorPrinter::ColorProxy(null_stream_, "", false);
  }
  ColorPrinter::ColorProxy debug() {
    return verbosity_ >= 4 ? err_.cyan() : ColorPrinter::ColorProxy(null_stream_, "", false);
  }
};

} // namespace customio
