#include "server/CalendarTools.h"
#include "server/ToolHost.h"
#include <fstream>
#include <stdexcept>

GetEventsTool::GetEventsTool(std::string eventsFile) : eventsFile(std::move(eventsFile)) {}

std::string GetEventsTool::getDescription() const {
    return "Get the user's calendar events with title, start and end time. "
           "Optional 'date' (YYYY-MM-DD) limits the result to events starting that day.";
}

nlohmann::ordered_json GetEventsTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"]["date"] = {{"type", "string"}, {"description", "Only events starting on this day (YYYY-MM-DD)"}};
    return schema;
}

nlohmann::json GetEventsTool::sampleEvents() {
    return nlohmann::json::array({
        {{"title", "MCP Stream"}, {"start", "2025-05-30T10:00:00"}, {"end", "2025-05-30T11:00:00"}},
        {{"title", "Team Meeting"}, {"start", "2025-05-30T14:00:00"}, {"end", "2025-05-30T15:00:00"}}
    });
}

nlohmann::json GetEventsTool::loadEvents() const {
    if (eventsFile.empty()) return sampleEvents();

    std::ifstream in(eventsFile);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open events file '" + eventsFile + "'");
    }
    nlohmann::json events;
    try {
        in >> events;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("events file '" + eventsFile + "' is not valid JSON: " + e.what());
    }
    if (!events.is_array()) {
        throw std::runtime_error("events file '" + eventsFile + "' must contain a JSON array");
    }
    return events;
}

nlohmann::json GetEventsTool::execute(const nlohmann::json& args, const ToolCallContext&) {
    nlohmann::json events = loadEvents();

    if (args.contains("date") && args["date"].is_string()) {
        std::string day = args["date"].get<std::string>();
        nlohmann::json filtered = nlohmann::json::array();
        for (const auto& ev : events) {
            if (ev.is_object() && ev.value("start", "").compare(0, day.size(), day) == 0) {
                filtered.push_back(ev);
            }
        }
        events = std::move(filtered);
    }

    if (events.empty()) return textResult("No events found");
    return textResult(events.dump(2));
}

void registerCalendarTools(ToolHost& host, const std::string& eventsFile) {
    host.registerTool(std::make_unique<GetEventsTool>(eventsFile));
}
