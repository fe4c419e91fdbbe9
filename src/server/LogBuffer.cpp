#include "server/LogBuffer.h"
#include <iomanip>
#include <sstream>

LogBuffer::LogBuffer(size_t capacity) : maxLines(capacity == 0 ? 1 : capacity) {}

void LogBuffer::append(const std::string& text, std::time_t timestamp) {
    while (lines.size() >= maxLines) {
        lines.pop_front();
    }
    lines.push_back({timestamp, text});
    ++appended;
}

std::vector<std::string> LogBuffer::tail(size_t n) const {
    std::vector<std::string> out;
    size_t count = n < lines.size() ? n : lines.size();
    out.reserve(count);
    for (auto it = lines.end() - static_cast<std::ptrdiff_t>(count); it != lines.end(); ++it) {
        out.push_back(format(*it));
    }
    return out;
}

std::string LogBuffer::format(const Entry& entry) {
    std::tm local{};
    localtime_r(&entry.timestamp, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "[%H:%M:%S] ") << entry.text;
    return oss.str();
}
