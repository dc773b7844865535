#include "line_framer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace session_tail {

static bool is_blank(std::string_view line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\f' && c != '\v') return false;
    }
    return true;
}

std::vector<std::string> line_framer::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    if (chunk.empty()) return lines;

    m_pending.append(chunk.data(), chunk.size());

    auto last_nl = m_pending.rfind('\n');
    if (last_nl == std::string::npos) return lines;  // no complete line yet

    std::string_view complete(m_pending.data(), last_nl + 1);
    std::size_t start = 0;
    while (start < complete.size()) {
        auto nl = complete.find('\n', start);
        auto line = complete.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!is_blank(line)) lines.emplace_back(line);
        start = nl + 1;
    }

    m_pending.erase(0, last_nl + 1);
    return lines;
}

void line_framer::reset() {
    m_pending.clear();
}

tail_cursor::read_result tail_cursor::read_from(const std::string& path,
                                                std::size_t max_bytes) {
    read_result result;

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) throw std::system_error(ec, "stat " + path);

    if (size < m_offset) {
        // Truncated or replaced: start over without the stale tail
        m_offset = 0;
        m_framer.reset();
        result.truncated = true;
    }

    if (size == m_offset) return result;

    auto want = static_cast<std::size_t>(
        std::min<uint64_t>(size - m_offset, static_cast<uint64_t>(max_bytes)));

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file: " + path);
    }
    file.seekg(static_cast<std::streamoff>(m_offset));

    std::string buf(want, '\0');
    file.read(buf.data(), static_cast<std::streamsize>(want));
    auto got = static_cast<std::size_t>(file.gcount());
    if (got == 0 && !file.eof()) {
        throw std::runtime_error("failed to read file: " + path);
    }
    buf.resize(got);

    result.lines = m_framer.feed(buf);
    result.bytes_read = got;
    m_offset += got;
    return result;
}

void tail_cursor::seek_to_end(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) throw std::system_error(ec, "stat " + path);
    m_offset = size;
    m_framer.reset();
}

} // namespace session_tail
