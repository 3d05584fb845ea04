/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/terminal_prompt.hpp"

#include <iostream>
#include <optional>

#include <termios.h>
#include <unistd.h>

OUTCOME_CPP_DEFINE_CATEGORY(gorc::application, PromptError, e) {
  using E = gorc::application::PromptError;
  switch (e) {
    case E::INPUT_CLOSED:
      return "input closed before a line was entered";
    case E::TERMINAL_ERROR:
      return "failed to configure terminal";
  }
  return "unknown PromptError";
}

namespace gorc::application {

  namespace {
    /// turns terminal echo off for its lifetime
    class EchoOff {
     public:
      explicit EchoOff(int fd) : fd_{fd} {
        if (::tcgetattr(fd_, &saved_) != 0) {
          return;
        }
        auto silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(fd_, TCSAFLUSH, &silent) == 0;
      }

      EchoOff(const EchoOff &) = delete;
      EchoOff &operator=(const EchoOff &) = delete;

      ~EchoOff() {
        if (active_) {
          ::tcsetattr(fd_, TCSAFLUSH, &saved_);
        }
      }

      bool active() const {
        return active_;
      }

     private:
      int fd_;
      termios saved_{};
      bool active_ = false;
    };
  }  // namespace

  TerminalPrompt::TerminalPrompt(std::istream &in, std::ostream &out)
      : in_{in}, out_{out} {}

  outcome::result<crypto::SecureString> TerminalPrompt::readSecret(
      std::string_view message) {
    out_ << message << std::flush;

    std::optional<EchoOff> echo_off;
    if (&in_ == &std::cin and ::isatty(STDIN_FILENO) == 1) {
      echo_off.emplace(STDIN_FILENO);
      if (not echo_off->active()) {
        return PromptError::TERMINAL_ERROR;
      }
    }

    crypto::SecureString line;
    bool terminated = false;
    for (int c = in_.get(); c != std::char_traits<char>::eof(); c = in_.get()) {
      if (c == '\n') {
        terminated = true;
        break;
      }
      line.push_back(static_cast<char>(c));
    }
    if (echo_off) {
      // the newline typed by the operator was not echoed
      out_ << std::endl;
    }
    if (not terminated and line.empty()) {
      return PromptError::INPUT_CLOSED;
    }
    if (not line.empty() and line.back() == '\r') {
      line.pop_back();
    }
    return line;
  }

}  // namespace gorc::application
