#include "server/TaskStore.h"
#include "utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

TaskStore::TaskStore(std::string directory) : dir(std::move(directory)) {}

std::string TaskStore::filePath(const std::string& userId) const {
    if (userId.empty() || userId.find_first_of("/\\") != std::string::npos || userId == "." || userId == "..") {
        throw std::invalid_argument("invalid user id '" + userId + "'");
    }
    return (fs::path(dir) / fs::u8path(userId + ".json")).u8string();
}

std::vector<Task> TaskStore::load(const std::string& userId) const {
    std::vector<Task> tasks;
    std::ifstream in(filePath(userId));
    if (!in.is_open()) return tasks;

    std::stringstream buffer;
    buffer << in.rdbuf();
    auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded() || !data.is_array()) {
        if (!buffer.str().empty()) {
            Logger::getInstance().warn("Task file for '" + userId + "' is not a JSON array, treating as empty");
        }
        return tasks;
    }

    for (const auto& item : data) {
        if (!item.is_object() || !item.contains("title") || !item["title"].is_string()) continue;
        tasks.push_back({item["title"].get<std::string>(), item.value("isDone", false)});
    }
    return tasks;
}

void TaskStore::save(const std::string& userId, const std::vector<Task>& tasks) const {
    std::error_code ec;
    fs::create_directories(fs::u8path(dir), ec);
    if (ec) {
        throw std::runtime_error("cannot create task directory '" + dir + "': " + ec.message());
    }

    std::string path = filePath(userId);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write task file '" + path + "'");
    }
    out << toJson(tasks).dump(2);
}

nlohmann::json TaskStore::toJson(const std::vector<Task>& tasks) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& t : tasks) {
        arr.push_back({{"title", t.title}, {"isDone", t.isDone}});
    }
    return arr;
}

std::vector<Task> TaskStore::readTasks(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return load(userId);
}

void TaskStore::addTask(const std::string& userId, const std::string& title) {
    if (title.empty()) {
        throw std::invalid_argument("task title must not be empty");
    }
    std::lock_guard<std::mutex> lock(mtx);
    auto tasks = load(userId);
    for (const auto& t : tasks) {
        if (t.title == title) {
            throw std::invalid_argument("Task with title '" + title + "' already exists.");
        }
    }
    tasks.push_back({title, false});
    save(userId, tasks);
}

void TaskStore::completeTask(const std::string& userId, const std::string& title) {
    std::lock_guard<std::mutex> lock(mtx);
    auto tasks = load(userId);
    for (auto& t : tasks) {
        if (t.title == title) {
            t.isDone = true;
            save(userId, tasks);
            return;
        }
    }
    throw std::invalid_argument("Task with title '" + title + "' not found.");
}
