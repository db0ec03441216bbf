#include "sigflow/signal/Signal.hpp"

namespace sigflow::signal {

const char* toString(Direction d) {
  return d == Direction::Call ? "CALL" : "PUT";
}

const char* toString(Strength s) {
  switch (s) {
    case Strength::Weak:     return "WEAK";
    case Strength::Moderate: return "MODERATE";
    case Strength::Strong:   return "STRONG";
    case Strength::Max:      return "MAX";
  }
  return "WEAK";
}

const char* toString(Status s) {
  switch (s) {
    case Status::Pending: return "PENDING";
    case Status::Win:     return "WIN";
    case Status::Loss:    return "LOSS";
  }
  return "PENDING";
}

Strength strengthFor(double score) {
  if (score > 100.0) return Strength::Max;
  if (score > 85.0)  return Strength::Strong;
  if (score > 70.0)  return Strength::Moderate;
  return Strength::Weak;
}

} // namespace sigflow::signal
