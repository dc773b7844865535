#include "record.hpp"

namespace session_tail {

const record_header& header_of(const record& r) {
    return std::visit([](const auto& rec) -> const record_header& { return rec.header; }, r);
}

record_header& header_of(record& r) {
    return std::visit([](auto& rec) -> record_header& { return rec.header; }, r);
}

const char* to_string(record_type type) {
    switch (type) {
        case record_type::assistant:             return "assistant";
        case record_type::user:                  return "user";
        case record_type::system:                return "system";
        case record_type::summary:               return "summary";
        case record_type::file_history_snapshot: return "file-history-snapshot";
    }
    return "unknown";
}

} // namespace session_tail
