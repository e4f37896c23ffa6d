#include "dtwin/domain/order.hpp"

#include <algorithm>

namespace dtwin {
namespace domain {

int Order::totalItems() const {
  int total = 0;
  for (const auto& line : lines) {
    total += line.quantity;
  }
  return total;
}

int Order::pickedItems() const {
  int total = 0;
  for (const auto& line : lines) {
    total += line.picked_quantity;
  }
  return total;
}

bool Order::isFullyPicked() const {
  return std::all_of(lines.begin(), lines.end(), [](const OrderLine& l) {
    return l.picked_quantity >= l.quantity;
  });
}

bool Order::requiresTransport() const {
  return std::any_of(lines.begin(), lines.end(), [](const OrderLine& l) {
    return !l.location.empty();
  });
}

}  // namespace domain
}  // namespace dtwin
