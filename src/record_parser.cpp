#include "record_parser.hpp"
#include <charconv>

namespace session_tail {

namespace {

using json = nlohmann::json;

std::string get_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<std::string> get_optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

bool get_bool(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

uint64_t get_u64(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return 0;
}

const json* get_object(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return nullptr;
    return &*it;
}

// Text of a block's "content", which is either a string or a list of blocks.
std::string flatten_content(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) {
        std::string out;
        for (const auto& item : value) {
            if (!item.is_object()) continue;
            if (get_string(item, "type") != "text") continue;
            if (!out.empty()) out += '\n';
            out += get_string(item, "text");
        }
        return out;
    }
    if (value.is_null()) return {};
    return value.dump();
}

record_header parse_header(const json& root, record_type type) {
    record_header h;
    h.type = type;
    h.timestamp_text = get_string(root, "timestamp");
    h.time = parse_timestamp(h.timestamp_text);
    h.session_id = get_string(root, "sessionId");
    h.uuid = get_string(root, "uuid");
    h.parent_uuid = get_optional_string(root, "parentUuid");
    h.cwd = get_string(root, "cwd");
    h.version = get_string(root, "version");
    h.git_branch = get_string(root, "gitBranch");

    auto agent = get_optional_string(root, "agentId");
    if (agent && !agent->empty()) {
        h.agent_id = std::move(agent);
        h.is_sub_agent = true;
    }
    if (get_bool(root, "isSidechain")) h.is_sub_agent = true;
    return h;
}

token_usage parse_usage(const json& u) {
    token_usage usage;
    usage.input_tokens = get_u64(u, "input_tokens");
    usage.output_tokens = get_u64(u, "output_tokens");
    usage.cache_read_input_tokens = get_u64(u, "cache_read_input_tokens");
    usage.cache_creation_input_tokens = get_u64(u, "cache_creation_input_tokens");
    if (auto server = get_object(u, "server_tool_use")) {
        usage.web_search_requests = get_u64(*server, "web_search_requests");
        usage.web_fetch_requests = get_u64(*server, "web_fetch_requests");
    }
    return usage;
}

record parse_assistant(const json& root) {
    assistant_record r;
    r.header = parse_header(root, record_type::assistant);
    r.request_id = get_string(root, "requestId");

    const json* msg = get_object(root, "message");
    if (!msg) return r;

    r.message_id = get_string(*msg, "id");
    r.model = get_string(*msg, "model");
    r.stop_reason = get_optional_string(*msg, "stop_reason");

    if (auto usage = get_object(*msg, "usage")) r.usage = parse_usage(*usage);

    if (auto ctx = get_object(*msg, "context_management")) {
        auto it = ctx->find("truncated");
        if (it != ctx->end() && it->is_boolean()) r.context_truncated = it->get<bool>();
    }

    auto content = msg->find("content");
    if (content == msg->end()) return r;

    if (content->is_string()) {
        r.content.emplace_back(text_block{content->get<std::string>()});
        return r;
    }
    if (!content->is_array()) return r;

    for (const auto& item : *content) {
        if (!item.is_object()) continue;
        auto block_type = get_string(item, "type");

        if (block_type == "tool_use") {
            tool_use_block b;
            b.id = get_string(item, "id");
            b.name = get_string(item, "name");
            if (b.name.empty()) b.name = "unknown";
            auto input = item.find("input");
            if (input != item.end()) b.input = *input;
            r.content.emplace_back(std::move(b));
        } else if (block_type == "text") {
            r.content.emplace_back(text_block{get_string(item, "text")});
        } else if (block_type == "thinking") {
            r.content.emplace_back(thinking_block{get_string(item, "thinking")});
        }
    }
    return r;
}

record parse_user(const json& root) {
    user_record r;
    r.header = parse_header(root, record_type::user);
    r.content = std::string{};

    if (const json* msg = get_object(root, "message")) {
        auto content = msg->find("content");
        if (content != msg->end() && content->is_string()) {
            r.content = content->get<std::string>();
        } else if (content != msg->end() && content->is_array()) {
            std::vector<tool_result_block> results;
            std::string text;
            for (const auto& item : *content) {
                if (!item.is_object()) continue;
                auto block_type = get_string(item, "type");
                if (block_type == "tool_result") {
                    tool_result_block b;
                    b.tool_use_id = get_string(item, "tool_use_id");
                    b.is_error = get_bool(item, "is_error");
                    auto rc = item.find("content");
                    if (rc != item.end()) b.content = flatten_content(*rc);
                    results.push_back(std::move(b));
                } else if (block_type == "text") {
                    if (!text.empty()) text += '\n';
                    text += get_string(item, "text");
                }
            }
            if (!results.empty()) {
                r.content = std::move(results);
            } else {
                r.content = std::move(text);
            }
        }
    }

    auto todos = root.find("todos");
    if (todos != root.end() && todos->is_array() && !todos->empty()) {
        std::vector<todo_item> items;
        for (const auto& t : *todos) {
            if (!t.is_object()) continue;
            items.push_back({get_string(t, "content"),
                             get_string(t, "status"),
                             get_string(t, "activeForm")});
        }
        r.todos = std::move(items);
    }

    if (auto exec = get_object(root, "toolUseResult")) {
        tool_execution_info info;
        info.has_stdout = !get_string(*exec, "stdout").empty();
        info.has_stderr = !get_string(*exec, "stderr").empty();
        info.interrupted = get_bool(*exec, "interrupted");
        info.is_image = get_bool(*exec, "isImage");
        r.tool_execution = info;
    }
    return r;
}

record parse_system(const json& root) {
    system_record r;
    r.header = parse_header(root, record_type::system);
    r.subtype = get_string(root, "subtype");
    r.content = get_string(root, "content");
    r.level = get_string(root, "level");
    return r;
}

record parse_summary(const json& root) {
    summary_record r;
    r.header = parse_header(root, record_type::summary);
    r.summary = get_string(root, "summary");
    r.leaf_uuid = get_string(root, "leafUuid");
    return r;
}

record parse_file_history_snapshot(const json& root) {
    file_history_snapshot_record r;
    r.header = parse_header(root, record_type::file_history_snapshot);
    r.message_id = get_string(root, "messageId");
    r.is_snapshot_update = get_bool(root, "isSnapshotUpdate");

    const json* snap = get_object(root, "snapshot");
    if (!snap) return r;

    if (r.header.timestamp_text.empty()) {
        r.header.timestamp_text = get_string(*snap, "timestamp");
        r.header.time = parse_timestamp(r.header.timestamp_text);
    }

    if (auto backups = get_object(*snap, "trackedFileBackups")) {
        for (const auto& [path, entry] : backups->items()) {
            if (!entry.is_object()) continue;
            file_backup b;
            b.original_path = path;
            b.backup_file_name = get_string(entry, "backupFileName");
            b.version = static_cast<int>(get_u64(entry, "version"));
            b.backup_time_text = get_string(entry, "backupTime");
            b.backup_time = parse_timestamp(b.backup_time_text);
            r.backups.push_back(std::move(b));
        }
    }
    return r;
}

bool read_int(std::string_view s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size()) return false;
    const char* first = s.data() + pos;
    const char* last = first + len;
    for (const char* c = first; c != last; ++c) {
        if (*c < '0' || *c > '9') return false;  // from_chars takes a sign
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // anonymous namespace

std::optional<record_type> parse_record_type(std::string_view s) {
    if (s == "assistant")             return record_type::assistant;
    if (s == "user")                  return record_type::user;
    if (s == "system")                return record_type::system;
    if (s == "summary")               return record_type::summary;
    if (s == "file-history-snapshot") return record_type::file_history_snapshot;
    return std::nullopt;
}

std::optional<record> parse_record(std::string_view line) {
    json root;
    try {
        root = json::parse(line);
    } catch (const json::parse_error& e) {
        throw record_parse_error(e.what());
    }

    if (!root.is_object()) {
        throw record_parse_error("record is not a JSON object");
    }

    auto type = parse_record_type(get_string(root, "type"));
    if (!type) return std::nullopt;

    switch (*type) {
        case record_type::assistant:             return parse_assistant(root);
        case record_type::user:                  return parse_user(root);
        case record_type::system:                return parse_system(root);
        case record_type::summary:               return parse_summary(root);
        case record_type::file_history_snapshot: return parse_file_history_snapshot(root);
    }
    return std::nullopt;
}

std::optional<timestamp> parse_timestamp(std::string_view text) {
    // 2025-01-15T10:30:00
    if (text.size() < 19) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[13] != ':' || text[16] != ':') return std::nullopt;
    if (text[10] != 'T' && text[10] != 't' && text[10] != ' ') return std::nullopt;

    int year, month, day, hour, minute, second;
    if (!read_int(text, 0, 4, year) || !read_int(text, 5, 2, month) ||
        !read_int(text, 8, 2, day) || !read_int(text, 11, 2, hour) ||
        !read_int(text, 14, 2, minute) || !read_int(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 9; ++digits) nanos *= 10;
    }

    int64_t offset_seconds = 0;
    if (pos < text.size()) {
        char z = text[pos];
        if (z == 'Z' || z == 'z') {
            ++pos;
        } else if (z == '+' || z == '-') {
            int oh, om;
            if (!read_int(text, pos + 1, 2, oh)) return std::nullopt;
            std::size_t mpos = pos + 3;
            if (mpos < text.size() && text[mpos] == ':') ++mpos;
            if (!read_int(text, mpos, 2, om)) return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offset_seconds = (oh * 3600 + om * 60) * (z == '+' ? 1 : -1);
            pos = mpos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return timestamp(std::chrono::duration_cast<timestamp::duration>(since_epoch));
}

uint64_t content_hash(std::string_view bytes) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : bytes) {
        h ^= static_cast<uint64_t>(c);
        h *= 1099511628211ull;
    }
    return h;
}

std::string make_seen_key(const record& r, std::string_view raw_line) {
    const auto& h = header_of(r);
    if (!h.uuid.empty()) return h.uuid;

    static constexpr char kHex[] = "0123456789abcdef";
    uint64_t v = content_hash(raw_line);
    std::string hex(16, '0');
    for (int i = 15; i >= 0; --i) {
        hex[static_cast<std::size_t>(i)] = kHex[v & 0xF];
        v >>= 4;
    }
    return std::string(to_string(h.type)) + "|" + h.timestamp_text + "|" + hex;
}

} // namespace session_tail
