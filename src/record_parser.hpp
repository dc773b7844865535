#pragma once

#include "record.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace session_tail {

// Thrown for a line that is not a JSON object.
class record_parse_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parse one JSONL line into the record its "type" implies.
// Returns nullopt for unknown or missing types (e.g. "queue-operation").
// Throws record_parse_error on malformed JSON.
std::optional<record> parse_record(std::string_view line);

// Map the top-level "type" string. nullopt if unknown.
std::optional<record_type> parse_record_type(std::string_view s);

// ISO-8601 "YYYY-MM-DDTHH:MM:SS[.fff][Z|+hh:mm]" to UTC. nullopt if invalid.
std::optional<timestamp> parse_timestamp(std::string_view text);

// FNV-1a 64. Stable across runs and platforms.
uint64_t content_hash(std::string_view bytes);

// Deduplication identity: uuid if present, else "<type>|<timestamp>|<hash>".
std::string make_seen_key(const record& r, std::string_view raw_line);

} // namespace session_tail
