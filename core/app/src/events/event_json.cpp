#include "dtwin/events/event_json.hpp"
#include "dtwin/common/errors.hpp"

#include <string>
#include <type_traits>

namespace dtwin {

namespace {

nlohmann::json optionalNumber(const std::optional<double>& value) {
  if (value.has_value()) {
    return *value;
  }
  return nullptr;
}

std::optional<double> readOptionalNumber(const nlohmann::json& j,
                                         const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

domain::OrderStatus readStatus(const nlohmann::json& data, const char* key) {
  auto name = data.at(key).get<std::string>();
  auto status = domain::orderStatusFromString(name);
  if (!status) {
    throw EventLogError(std::string("unknown order status '") + name +
                        "' in field '" + key + "'");
  }
  return *status;
}

EventSource readSource(const nlohmann::json& record) {
  auto it = record.find("source");
  if (it == record.end()) {
    return EventSource::Simulation;
  }
  auto name = it->get<std::string>();
  if (name == "simulation") return EventSource::Simulation;
  if (name == "erp") return EventSource::Erp;
  throw EventLogError("unknown event source '" + name + "'");
}

}  // namespace

nlohmann::json eventToJson(const Event& event) {
  const EventHeader& header = headerOf(event);

  nlohmann::json j;
  j["event_type"] = toString(kindOf(event));
  j["sequence_id"] = header.sequence_id;
  j["sim_time"] = optionalNumber(header.sim_time);
  j["timestamp_ms"] = timestamp_to_ms(header.timestamp);
  j["source"] = toString(header.source);

  nlohmann::json data = nlohmann::json::object();
  std::visit(
      [&data](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OrderCreatedEvent>) {
          data["order_id"] = e.order_id;
          data["customer_id"] = e.customer_id;
          data["num_lines"] = e.num_lines;
          data["total_items"] = e.total_items;
          data["priority"] = e.priority;
        } else if constexpr (std::is_same_v<T, OrderStatusChangedEvent>) {
          data["order_id"] = e.order_id;
          data["old_status"] = domain::toString(e.old_status);
          data["new_status"] = domain::toString(e.new_status);
          if (e.total_time.has_value()) {
            data["total_time"] = *e.total_time;
          }
        } else if constexpr (std::is_same_v<T, InventoryUpdatedEvent>) {
          data["sku"] = e.sku;
          data["delta"] = e.delta;
          data["new_quantity"] = e.new_quantity;
          data["reason"] = e.reason;
          if (e.order_id.has_value()) {
            data["order_id"] = *e.order_id;
          }
        } else if constexpr (std::is_same_v<T, ResourceEvent>) {
          data["resource"] = toString(e.resource);
          data["order_id"] = e.order_id;
          data["in_use"] = e.in_use;
          data["capacity"] = e.capacity;
        } else if constexpr (std::is_same_v<T, PickShortageEvent>) {
          data["order_id"] = e.order_id;
          data["sku"] = e.sku;
          data["requested"] = e.requested;
          data["available"] = e.available;
        } else {
          data["drift_ratio"] = e.drift_ratio;
          data["threshold"] = e.threshold;
        }
      },
      event);
  j["data"] = std::move(data);
  return j;
}

Event eventFromJson(const nlohmann::json& record) {
  try {
    auto type_name = record.at("event_type").get<std::string>();
    auto kind = eventKindFromString(type_name);
    if (!kind) {
      throw EventLogError("unknown event_type '" + type_name + "'");
    }

    EventHeader header;
    header.sequence_id = record.at("sequence_id").get<std::uint64_t>();
    header.sim_time = readOptionalNumber(record, "sim_time");
    header.timestamp =
        ms_to_timestamp(record.at("timestamp_ms").get<std::int64_t>());
    header.source = readSource(record);

    const nlohmann::json& data = record.at("data");

    switch (*kind) {
      case EventKind::OrderCreated: {
        OrderCreatedEvent e;
        e.header = header;
        e.order_id = data.at("order_id").get<std::string>();
        e.customer_id = data.value("customer_id", std::string{});
        e.num_lines = data.value("num_lines", 0);
        e.total_items = data.value("total_items", 0);
        e.priority = data.value("priority", 1);
        return e;
      }
      case EventKind::OrderStatusChanged: {
        OrderStatusChangedEvent e;
        e.header = header;
        e.order_id = data.at("order_id").get<std::string>();
        e.old_status = readStatus(data, "old_status");
        e.new_status = readStatus(data, "new_status");
        e.total_time = readOptionalNumber(data, "total_time");
        return e;
      }
      case EventKind::InventoryUpdated: {
        InventoryUpdatedEvent e;
        e.header = header;
        e.sku = data.at("sku").get<std::string>();
        e.delta = data.at("delta").get<int>();
        e.new_quantity = data.at("new_quantity").get<int>();
        e.reason = data.value("reason", std::string{});
        if (data.contains("order_id")) {
          e.order_id = data.at("order_id").get<std::string>();
        }
        return e;
      }
      case EventKind::WorkerAssigned:
      case EventKind::WorkerReleased:
      case EventKind::ResourceAllocated:
      case EventKind::ResourceReleased: {
        ResourceEvent e;
        e.header = header;
        e.resource = (*kind == EventKind::WorkerAssigned ||
                      *kind == EventKind::WorkerReleased)
                         ? ResourceType::Worker
                         : ResourceType::Forklift;
        e.action = (*kind == EventKind::WorkerAssigned ||
                    *kind == EventKind::ResourceAllocated)
                       ? ResourceEvent::Action::Assigned
                       : ResourceEvent::Action::Released;
        e.order_id = data.value("order_id", std::string{});
        e.in_use = data.value("in_use", 0);
        e.capacity = data.value("capacity", 0);
        return e;
      }
      case EventKind::PickShortage: {
        PickShortageEvent e;
        e.header = header;
        e.order_id = data.at("order_id").get<std::string>();
        e.sku = data.at("sku").get<std::string>();
        e.requested = data.at("requested").get<int>();
        e.available = data.at("available").get<int>();
        return e;
      }
      case EventKind::CalibrationTrigger: {
        CalibrationTriggerEvent e;
        e.header = header;
        e.drift_ratio = data.at("drift_ratio").get<double>();
        e.threshold = data.at("threshold").get<double>();
        return e;
      }
    }
    throw EventLogError("unhandled event_type '" + type_name + "'");
  } catch (const nlohmann::json::exception& e) {
    throw EventLogError(std::string("malformed event record: ") + e.what());
  }
}

std::vector<Event> readEventLog(std::istream& in) {
  std::vector<Event> events;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      events.push_back(eventFromJson(nlohmann::json::parse(line)));
    } catch (const nlohmann::json::exception& e) {
      throw EventLogError("event log line " + std::to_string(line_no) +
                          ": " + e.what());
    } catch (const EventLogError& e) {
      throw EventLogError("event log line " + std::to_string(line_no) +
                          ": " + e.what());
    }
  }
  return events;
}

}  // namespace dtwin
