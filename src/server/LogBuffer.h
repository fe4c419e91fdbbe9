#pragma once
#include <cstddef>
#include <ctime>
#include <deque>
#include <string>
#include <vector>

/**
 * @brief Bounded FIFO store of timestamped server output lines.
 *
 * Not synchronized; BedrockServerManager guards it together with the
 * presence set so readers see both in a consistent state.
 */
class LogBuffer {
public:
    struct Entry {
        std::time_t timestamp;
        std::string text;
    };

    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit LogBuffer(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Append a line, evicting the oldest entry first when full.
     */
    void append(const std::string& text, std::time_t timestamp);

    /**
     * @brief Last n entries formatted as "[HH:MM:SS] text", oldest first.
     * Returns every entry when fewer than n are buffered.
     */
    std::vector<std::string> tail(size_t n) const;

    std::vector<Entry> entries() const { return {lines.begin(), lines.end()}; }

    size_t size() const { return lines.size(); }
    size_t capacity() const { return maxLines; }
    bool empty() const { return lines.empty(); }

    // Number of lines ever appended, evicted ones included.
    size_t totalAppended() const { return appended; }

    static std::string format(const Entry& entry);

private:
    std::deque<Entry> lines;
    size_t maxLines;
    size_t appended = 0;
};
