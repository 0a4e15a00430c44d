#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct MemoryEntry {
    std::string content;
    std::string timestamp;
};

/**
 * @brief 记忆存储接口: 保存 / 按查询检索 / 全部列出
 *
 * 向量检索服务可以实现此接口替换默认的文件存储。
 */
class IMemoryStore {
public:
    virtual ~IMemoryStore() = default;

    // 内容为空时抛 std::invalid_argument
    virtual void add(const std::string& userId, const std::string& content) = 0;

    // 按相关度降序, 最多 limit 条; 不相关的条目不返回
    virtual std::vector<MemoryEntry> search(const std::string& userId, const std::string& query, size_t limit) = 0;

    // 按保存顺序
    virtual std::vector<MemoryEntry> getAll(const std::string& userId) = 0;
};

/**
 * @brief 每个用户一个 JSON 文件的记忆存储: <dir>/<userId>.json
 *
 * 相关度按关键词计算: 完全相同 1.0, 互相包含 0.9, 否则为查询词命中比例。
 */
class FileMemoryStore : public IMemoryStore {
public:
    explicit FileMemoryStore(std::string directory);

    void add(const std::string& userId, const std::string& content) override;
    std::vector<MemoryEntry> search(const std::string& userId, const std::string& query, size_t limit) override;
    std::vector<MemoryEntry> getAll(const std::string& userId) override;

    std::string filePath(const std::string& userId) const;

    static double relevance(const std::string& content, const std::string& query);

private:
    std::string dir;
    mutable std::mutex mtx;

    std::vector<MemoryEntry> load(const std::string& userId) const;
    void save(const std::string& userId, const std::vector<MemoryEntry>& entries) const;
};
