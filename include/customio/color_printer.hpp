#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

// ANSI color printer for terminals. Colors are enabled only when the stream
// is a TTY and TERM is not "dumb".
//
//   customio::ColorPrinter cp(std::cerr);
//   cp.red() << "error: " << detail << std::endl; // reset emitted at the end
//   cp.green("Done");

namespace customio {

class ColorPrinter {
 public:
  // Emits the color code on construction, reset on destruction.
  class ColorProxy {
   public:
    ColorProxy(std::ostream& os, const char* code, bool enabled)
        : os_(os), enabled_(enabled) {
      if (enabled_) os_ << code;
    }
    ~ColorProxy() {
      if (enabled_) os_ << "\033[0m";
    }
    template <typename T>
    ColorProxy& operator<<(const T& v) {
      os_ << v;
      return *this;
    }
    using Manip = std::ostream& (*)(std::ostream&);
    ColorProxy& operator<<(Manip m) {
      m(os_);
      return *this;
    }

   private:
    std::ostream& os_;
    bool enabled_;
  };

  explicit ColorPrinter(std::ostream& os)
      : stream_(&os), enable_colors_(detect_tty_for_stream(os)) {}

  ColorPrinter(std::ostream& os, bool enable_colors)
      : stream_(&os), enable_colors_(enable_colors) {}

  bool enabled() const { return enable_colors_; }
  std::ostream& stream() const { return *stream_; }

  void red(const std::string& msg) { red() << msg << std::endl; }
  void green(const std::string& msg) { green() << msg << std::endl; }
  void yellow(const std::string& msg) { yellow() << msg << std::endl; }

  ColorProxy plain() { return ColorProxy(stream(), "", false); }
  ColorProxy red() { return ColorProxy(stream(), "\033[31m", enable_colors_); }
  ColorProxy green() {
    return ColorProxy(stream(), "\033[32m", enable_colors_);
  }
  ColorProxy yellow() {
    return ColorProxy(stream(), "\033[33m", enable_colors_);
  }
  ColorProxy cyan() { return ColorProxy(stream(), "\033[36m", enable_colors_); }

 private:
  std::ostream* stream_;
  bool enable_colors_;

  static bool detect_tty_for_stream(std::ostream& os) {
    bool is_tty = false;
    if (&os == &std::cout) {
      is_tty = ::isatty(fileno(stdout));
    } else if (&os == &std::cerr) {
      is_tty = ::isatty(fileno(stderr));
    }
    const char* term = std::getenv("TERM");
    bool term_ok = term && std::strcmp(term, "dumb") != 0;
    return is_tty && term_ok;
  }
};

}  // namespace customio
