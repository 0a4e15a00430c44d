#include "transport/SseParser.h"
#include <sstream>

void SseParser::feed(const char* data, size_t length) {
    buffer.append(data, length);

    size_t start = 0;
    while (true) {
        size_t nl = buffer.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = buffer.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        processLine(line);
        start = nl + 1;
    }
    buffer.erase(0, start);
}

void SseParser::finish() {
    if (!buffer.empty()) {
        std::string line = buffer;
        buffer.clear();
        if (!line.empty() && line.back() == '\r') line.pop_back();
        processLine(line);
    }
    dispatch();
}

void SseParser::processLine(const std::string& line) {
    if (line.empty()) {
        dispatch();
        return;
    }
    if (line[0] == ':') return;

    std::string field = line;
    std::string value;
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }

    if (field == "event") {
        pending.event = value;
    } else if (field == "data") {
        if (hasData) pending.data += '\n';
        pending.data += value;
        hasData = true;
    } else if (field == "id") {
        pending.id = value;
    }
    // "retry" and unknown fields are ignored
}

void SseParser::dispatch() {
    if (hasData && onEvent) {
        onEvent(pending);
    }
    pending = SseEvent();
    hasData = false;
}

std::string SseParser::format(const std::string& event, const std::string& data) {
    std::ostringstream out;
    out << "event: " << event << "\n";
    std::istringstream lines(data);
    std::string line;
    bool any = false;
    while (std::getline(lines, line)) {
        out << "data: " << line << "\n";
        any = true;
    }
    if (!any) out << "data: \n";
    out << "\n";
    return out.str();
}
