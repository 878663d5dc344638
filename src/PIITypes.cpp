#include "PIITypes.hpp"

#include <algorithm>
#include <cmath>

namespace redact {

std::string piiTypeName(PIIType type) {
  switch (type) {
  case PIIType::Email:
    return "email";
  case PIIType::SSN:
    return "ssn";
  case PIIType::Phone:
    return "phone";
  case PIIType::CreditCard:
    return "credit_card";
  }
  return "unknown";
}

std::string errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::DocumentUnreadable:
    return "DocumentUnreadable";
  case ErrorKind::DocumentEncrypted:
    return "DocumentEncrypted";
  case ErrorKind::RedactionApplyFailure:
    return "RedactionApplyFailure";
  case ErrorKind::SaveFailure:
    return "SaveFailure";
  case ErrorKind::InvalidState:
    return "InvalidState";
  case ErrorKind::TimedOut:
    return "TimedOut";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

bool BBox::isValid() const {
  if (!std::isfinite(x0) || !std::isfinite(y0) || !std::isfinite(x1) ||
      !std::isfinite(y1)) {
    return false;
  }
  return x0 < x1 && y0 < y1;
}

bool BBox::intersects(const BBox &other) const {
  double left = std::max(x0, other.x0);
  double right = std::min(x1, other.x1);
  double top = std::max(y0, other.y0);
  double bottom = std::min(y1, other.y1);
  return left < right && top < bottom;
}

bool BBox::contains(const BBox &other) const {
  return x0 <= other.x0 && y0 <= other.y0 && x1 >= other.x1 &&
         y1 >= other.y1;
}

BBox BBox::expanded(double margin) const {
  return BBox(x0 - margin, y0 - margin, x1 + margin, y1 + margin);
}

} // namespace redact
