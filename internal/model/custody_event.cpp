#include "custody_event.hpp"

namespace lifebank::model {

std::string_view ToString(CustodyStatus status) {
  switch (status) {
    case CustodyStatus::kPending:
      return "pending";
    case CustodyStatus::kConfirmed:
      return "confirmed";
    case CustodyStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

} // namespace lifebank::model
