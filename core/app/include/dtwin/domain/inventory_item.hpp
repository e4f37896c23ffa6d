#pragma once

#include "dtwin/time/time_utils.hpp"

#include <map>
#include <string>

namespace dtwin {
namespace domain {

// -----------------------------------------------------------------------------
// InventoryItem — one SKU held in a storage location
// -----------------------------------------------------------------------------
//
// @brief  On-hand stock for a SKU together with its reorder metadata.
//
// @details
// quantity never goes below zero. The simulation decrements it on pick and
// raises it on replenishment; the ERP collaborator raises or lowers it from
// the outside. min_stock/max_stock drive the automatic reorder inside a run:
// when a pick leaves quantity below min_stock, a replenishment up to
// max_stock is scheduled.
// -----------------------------------------------------------------------------
struct InventoryItem {
  std::string sku;
  std::string name;
  int quantity{0};
  std::string location;
  int min_stock{10};
  int max_stock{100};
  double unit_cost{0.0};
  Timestamp last_updated{};
};

// Keyed by SKU. std::map keeps iteration order stable, which the arrival
// generator relies on for reproducible SKU selection.
using InventoryMap = std::map<std::string, InventoryItem>;

}  // namespace domain
}  // namespace dtwin
