#include "server/MemoryTools.h"
#include "server/ToolHost.h"

namespace {
    nlohmann::json contents(const std::vector<MemoryEntry>& entries) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& e : entries) arr.push_back(e.content);
        return arr;
    }
}

SaveMemoryTool::SaveMemoryTool(std::shared_ptr<IMemoryStore> store, std::string userId)
    : store(std::move(store)), userId(std::move(userId)) {}

std::string SaveMemoryTool::getDescription() const {
    return "Save a piece of information to the user's long-term memory.";
}

nlohmann::ordered_json SaveMemoryTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"]["content"] = {{"type", "string"}, {"description", "The text to remember"}};
    schema["required"] = nlohmann::ordered_json::array({"content"});
    return schema;
}

nlohmann::json SaveMemoryTool::execute(const nlohmann::json& args, const ToolCallContext&) {
    if (!args.contains("content") || !args["content"].is_string()) {
        return errorResult("Missing required parameter: content");
    }
    std::string content = args["content"].get<std::string>();
    try {
        store->add(userId, content);
    } catch (const std::invalid_argument& e) {
        return errorResult(e.what());
    }
    return textResult("Successfully saved memory: " + content);
}

SearchMemoriesTool::SearchMemoriesTool(std::shared_ptr<IMemoryStore> store, std::string userId, size_t limit)
    : store(std::move(store)), userId(std::move(userId)), limit(limit) {}

std::string SearchMemoriesTool::getDescription() const {
    return "Search the user's long-term memory for entries related to a query.";
}

nlohmann::ordered_json SearchMemoriesTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"]["query"] = {{"type", "string"}, {"description", "What to look for"}};
    schema["required"] = nlohmann::ordered_json::array({"query"});
    return schema;
}

nlohmann::json SearchMemoriesTool::execute(const nlohmann::json& args, const ToolCallContext&) {
    if (!args.contains("query") || !args["query"].is_string()) {
        return errorResult("Missing required parameter: query");
    }
    return textResult(contents(store->search(userId, args["query"].get<std::string>(), limit)).dump());
}

GetAllMemoriesTool::GetAllMemoriesTool(std::shared_ptr<IMemoryStore> store, std::string userId)
    : store(std::move(store)), userId(std::move(userId)) {}

std::string GetAllMemoriesTool::getDescription() const {
    return "List everything stored in the user's long-term memory.";
}

nlohmann::ordered_json GetAllMemoriesTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"] = nlohmann::ordered_json::object();
    return schema;
}

nlohmann::json GetAllMemoriesTool::execute(const nlohmann::json&, const ToolCallContext&) {
    return textResult(contents(store->getAll(userId)).dump());
}

void registerMemoryTools(ToolHost& host, std::shared_ptr<IMemoryStore> store, const std::string& userId) {
    host.registerTool(std::make_unique<SaveMemoryTool>(store, userId));
    host.registerTool(std::make_unique<SearchMemoriesTool>(store, userId));
    host.registerTool(std::make_unique<GetAllMemoriesTool>(store, userId));
}
