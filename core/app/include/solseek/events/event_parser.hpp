#pragma once

#include "solseek/events/event.hpp"

#include <optional>
#include <string_view>

namespace solseek {

// -----------------------------------------------------------------------------
// parseLog(raw)
// -----------------------------------------------------------------------------
//
// @brief  Decodes one raw JSON log record into a typed Event.
//
// @param  raw  One log line as delivered by the ingestion stream, e.g.
//              {"type":"swap","ts":1,"amount_in":2.0,"amount_out":1.0}
//
// @return The decoded Event, or std::nullopt if the record is malformed.
//
// @details
// Expected JSON fields:
//   type        "swap" | "add_liquidity" | "remove_liquidity" | "mint"
//   ts          int64 source timestamp         (default 0)
//   amount_in   number, swap / mint            (default 0)
//   amount_out  number, swap / mint            (default 0)
//   reserve_a   number, liquidity events       (default 0)
//   reserve_b   number, liquidity events       (default 0)
//   fee         number, swap                   (default 0)
//
// Malformed input (invalid JSON, missing or unknown type, a field of the
// wrong JSON type, a ts that is fractional or outside int64) is not an error: the stream keeps running and the
// record is skipped.
//
// Thread-safety: Pure function. Safe from any thread.
// -----------------------------------------------------------------------------
std::optional<Event> parseLog(std::string_view raw);

}  // namespace solseek
