#pragma once
#include <stdexcept>
#include <string>

// How a collaborator failed. The engine maps each class to its own ErrorKind
// so a caller can tell an explained rejection from a silent failure.
enum class FailureClass {
  Revert,   // explicit reason string
  Panic,    // arithmetic / overflow fault
  Opaque,   // no reason given
};

class ExternalCallError : public std::runtime_error {
public:
  ExternalCallError(FailureClass cls, std::string reason)
    : std::runtime_error(reason.empty() ? std::string("external call failed") : reason),
      cls_(cls),
      reason_(std::move(reason)) {}

  FailureClass failure() const noexcept { return cls_; }
  const std::string& reason() const noexcept { return reason_; }

private:
  FailureClass cls_;
  std::string  reason_;
};
