#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace session_tail {

// Turns arbitrarily chunked bytes into complete lines.
//
// Only bytes up to the last '\n' are ever split into lines; the remainder is
// held back as the pending tail until a later chunk terminates it. Because
// '\n' never occurs inside a UTF-8 multi-byte sequence, a codepoint split
// across two chunks is always reassembled before it reaches a line.
class line_framer {
public:
    // Append a chunk and return the lines it completes (without '\n' or a
    // trailing '\r'). Whitespace-only lines are skipped.
    std::vector<std::string> feed(std::string_view chunk);

    // Discard the pending tail (file truncated or rotated).
    void reset();

    const std::string& pending() const { return m_pending; }

private:
    std::string m_pending;
};

// Per-file tail position: the byte offset consumed so far plus its framer.
// Not synchronized; the owner serializes access (see tracked_file).
class tail_cursor {
public:
    struct read_result {
        std::vector<std::string> lines;
        std::size_t bytes_read = 0;
        bool truncated = false;  // file shrank below the offset; restarted at 0
    };

    // Read at most max_bytes of new content from path and frame it.
    // Throws std::system_error / std::runtime_error on I/O failure; the
    // offset only advances after the read completed.
    read_result read_from(const std::string& path, std::size_t max_bytes);

    // Skip everything currently in the file (tail from "now").
    void seek_to_end(const std::string& path);

    uint64_t offset() const { return m_offset; }
    const line_framer& framer() const { return m_framer; }

private:
    uint64_t m_offset = 0;
    line_framer m_framer;
};

} // namespace session_tail
