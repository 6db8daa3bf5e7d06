#include "solseek/events/event_parser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace solseek {

namespace {

// Missing keys fall back to the default; a present key of the wrong JSON
// type throws nlohmann::json::type_error, handled by parseLog().
double numberOr(const nlohmann::json& j, const char* key, double fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<double>();
}

// Only JSON integers that fit in int64 are timestamps; a float or an
// out-of-range value makes the record malformed.
std::optional<std::int64_t> timestampOr(const nlohmann::json& j,
                                        std::int64_t fallback) {
  auto it = j.find("ts");
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(
                    std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
  }
  if (!it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<std::int64_t>();
}

}  // namespace

std::optional<Event> parseLog(std::string_view raw) {
  try {
    auto json = nlohmann::json::parse(raw.begin(), raw.end());
    if (!json.is_object()) {
      return std::nullopt;
    }

    auto type_it = json.find("type");
    if (type_it == json.end() || !type_it->is_string()) {
      return std::nullopt;
    }
    const std::string type = type_it->get<std::string>();
    const auto parsed_ts = timestampOr(json, 0);
    if (!parsed_ts) {
      return std::nullopt;
    }
    const std::int64_t ts = *parsed_ts;

    if (type == "swap") {
      SwapEvent e;
      e.ts = ts;
      e.amount_in = numberOr(json, "amount_in", 0.0);
      e.amount_out = numberOr(json, "amount_out", 0.0);
      e.fee = numberOr(json, "fee", 0.0);
      return e;
    }
    if (type == "add_liquidity") {
      AddLiquidityEvent e;
      e.ts = ts;
      e.reserve_a = numberOr(json, "reserve_a", 0.0);
      e.reserve_b = numberOr(json, "reserve_b", 0.0);
      return e;
    }
    if (type == "remove_liquidity") {
      RemoveLiquidityEvent e;
      e.ts = ts;
      e.reserve_a = numberOr(json, "reserve_a", 0.0);
      e.reserve_b = numberOr(json, "reserve_b", 0.0);
      return e;
    }
    if (type == "mint") {
      MintEvent e;
      e.ts = ts;
      e.amount_in = numberOr(json, "amount_in", 0.0);
      e.amount_out = numberOr(json, "amount_out", 0.0);
      return e;
    }
    return std::nullopt;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace solseek
