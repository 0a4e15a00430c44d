#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Task {
    std::string title;
    bool isDone = false;
};

/**
 * @brief 每个用户一个 JSON 文件的任务存储: <dir>/<userId>.json
 *
 * 文件内容为 [{"title": "...", "isDone": false}, ...]。
 * 空文件或损坏的文件按没有任务处理。
 */
class TaskStore {
public:
    explicit TaskStore(std::string directory);

    std::vector<Task> readTasks(const std::string& userId) const;

    // 同名任务已存在时抛 std::invalid_argument
    void addTask(const std::string& userId, const std::string& title);

    // 任务不存在时抛 std::invalid_argument
    void completeTask(const std::string& userId, const std::string& title);

    std::string filePath(const std::string& userId) const;

    static nlohmann::json toJson(const std::vector<Task>& tasks);

private:
    std::string dir;
    mutable std::mutex mtx;

    std::vector<Task> load(const std::string& userId) const;
    void save(const std::string& userId, const std::vector<Task>& tasks) const;
};
