#include "session_aggregator.hpp"
#include <algorithm>
#include <type_traits>

namespace session_tail {

uint64_t session_stats::count(record_type type) const {
    auto it = records_by_type.find(type);
    return it != records_by_type.end() ? it->second : 0;
}

std::size_t session_stats::completed_tool_calls() const {
    return static_cast<std::size_t>(std::count_if(correlations.begin(), correlations.end(),
        [](const auto& entry) { return entry.second.completed; }));
}

double session_stats::average_cache_hit_rate() const {
    return usage_samples > 0 ? cache_hit_rate_sum / static_cast<double>(usage_samples) : 0.0;
}

std::chrono::milliseconds session_stats::average_tool_duration() const {
    std::chrono::milliseconds total{0};
    std::size_t completed = 0;
    for (const auto& [id, c] : correlations) {
        if (!c.completed) continue;
        total += c.duration;
        ++completed;
    }
    if (completed == 0) return std::chrono::milliseconds{0};
    return total / static_cast<long long>(completed);
}

std::chrono::milliseconds session_stats::max_tool_duration() const {
    std::chrono::milliseconds longest{0};
    for (const auto& [id, c] : correlations) {
        if (c.completed) longest = std::max(longest, c.duration);
    }
    return longest;
}

void session_aggregator::apply(const record& rec) {
    std::lock_guard<std::mutex> lock(m_mutex);

    count_header(header_of(rec));
    std::visit([this](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, assistant_record>) apply_assistant(r);
        else if constexpr (std::is_same_v<T, user_record>) apply_user(r);
        else if constexpr (std::is_same_v<T, system_record>) apply_system(r);
        else if constexpr (std::is_same_v<T, summary_record>) apply_summary(r);
        else apply_file_history(r);
    }, rec);
}

session_stats session_aggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void session_aggregator::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats = session_stats{};
}

void session_aggregator::count_header(const record_header& header) {
    ++m_stats.records_by_type[header.type];
    ++m_stats.total_records;
    if (!header.parent_uuid) ++m_stats.root_messages;

    if (header.time) {
        if (!m_stats.first_activity || *header.time < *m_stats.first_activity) {
            m_stats.first_activity = header.time;
        }
        if (!m_stats.last_activity || *header.time > *m_stats.last_activity) {
            m_stats.last_activity = header.time;
        }
    }

    if (header.is_sub_agent) {
        std::string id = header.agent_id.value_or("");
        auto& group = m_stats.agents[id];
        group.agent_id = id;
        ++group.record_count;
        if (header.time) {
            if (!group.first_activity) group.first_activity = header.time;
            group.last_activity = header.time;
        }
    }
}

void session_aggregator::apply_assistant(const assistant_record& rec) {
    if (!rec.model.empty()) ++m_stats.model_usage[rec.model];
    if (rec.stop_reason) ++m_stats.stop_reasons[*rec.stop_reason];
    if (rec.context_truncated.value_or(false)) ++m_stats.context_truncations;

    if (rec.usage) {
        auto& t = m_stats.tokens;
        t.input_tokens += rec.usage->input_tokens;
        t.output_tokens += rec.usage->output_tokens;
        t.cache_read_input_tokens += rec.usage->cache_read_input_tokens;
        t.cache_creation_input_tokens += rec.usage->cache_creation_input_tokens;
        t.web_search_requests += rec.usage->web_search_requests;
        t.web_fetch_requests += rec.usage->web_fetch_requests;
        ++m_stats.usage_samples;
        m_stats.cache_hit_rate_sum += rec.usage->cache_hit_rate();
    }

    for (const auto& block : rec.content) {
        if (auto* use = std::get_if<tool_use_block>(&block)) {
            ++m_stats.tool_calls;
            ++m_stats.tool_usage[use->name];
            if (rec.header.is_sub_agent) {
                ++m_stats.agents[rec.header.agent_id.value_or("")].tool_calls;
            }

            // First call wins on a repeated id
            auto [it, inserted] = m_stats.correlations.try_emplace(use->id);
            if (!inserted) continue;
            it->second.tool_use_id = use->id;
            it->second.tool_name = use->name;
            it->second.call_time = rec.header.time;
            m_stats.pending_tool_uses.insert(use->id);
        } else if (std::holds_alternative<text_block>(block)) {
            ++m_stats.text_blocks;
        } else {
            ++m_stats.thinking_blocks;
        }
    }
}

void session_aggregator::apply_user(const user_record& rec) {
    if (rec.todos) {
        m_stats.latest_todos = *rec.todos;
        ++m_stats.todo_snapshots;
    }

    if (rec.tool_execution) {
        if (rec.tool_execution->has_stdout) ++m_stats.results_with_stdout;
        if (rec.tool_execution->has_stderr) ++m_stats.results_with_stderr;
        if (rec.tool_execution->interrupted) ++m_stats.interrupted_results;
        if (rec.tool_execution->is_image) ++m_stats.image_results;
    }

    auto* results = rec.tool_results();
    if (!results) return;

    for (const auto& result : *results) {
        ++m_stats.tool_results;
        if (result.is_error) ++m_stats.tool_errors;

        auto it = m_stats.correlations.find(result.tool_use_id);
        if (it == m_stats.correlations.end() || it->second.completed) {
            ++m_stats.unmatched_results;
            continue;
        }

        auto& c = it->second;
        c.result_time = rec.header.time;
        c.success = result.success();
        c.completed = true;
        if (c.call_time && c.result_time) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(*c.result_time - *c.call_time);
            c.duration = std::max(elapsed, std::chrono::milliseconds{0});
        }
        m_stats.pending_tool_uses.erase(result.tool_use_id);
    }
}

void session_aggregator::apply_system(const system_record& rec) {
    system_entry entry{rec.header.timestamp_text, rec.subtype, rec.level, rec.content};
    if (rec.is_error()) m_stats.errors.push_back(entry);
    m_stats.system_events.push_back(std::move(entry));
}

void session_aggregator::apply_summary(const summary_record& rec) {
    m_stats.summaries.push_back(rec);
}

void session_aggregator::apply_file_history(const file_history_snapshot_record& rec) {
    for (const auto& backup : rec.backups) {
        m_stats.backups.push_back({rec.message_id, backup});
        m_stats.modified_files.insert(backup.original_path);
    }
}

} // namespace session_tail
