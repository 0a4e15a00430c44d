#include "server/MemoryStore.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    // Lowercased alphanumeric runs; bytes >= 0x80 count as word characters
    std::set<std::string> words(const std::string& text) {
        std::set<std::string> out;
        std::string current;
        for (unsigned char c : text) {
            if (std::isalnum(c) || c >= 0x80) {
                current += static_cast<char>(std::tolower(c));
            } else if (!current.empty()) {
                out.insert(current);
                current.clear();
            }
        }
        if (!current.empty()) out.insert(current);
        return out;
    }

    std::string nowIso() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&now, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
}

FileMemoryStore::FileMemoryStore(std::string directory) : dir(std::move(directory)) {}

std::string FileMemoryStore::filePath(const std::string& userId) const {
    if (userId.empty() || userId.find_first_of("/\\") != std::string::npos || userId == "." || userId == "..") {
        throw std::invalid_argument("invalid user id '" + userId + "'");
    }
    return (fs::path(dir) / fs::u8path(userId + ".json")).u8string();
}

std::vector<MemoryEntry> FileMemoryStore::load(const std::string& userId) const {
    std::vector<MemoryEntry> entries;
    std::ifstream in(filePath(userId));
    if (!in.is_open()) return entries;

    std::stringstream buffer;
    buffer << in.rdbuf();
    auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded() || !data.is_array()) {
        if (!buffer.str().empty()) {
            Logger::getInstance().warn("Memory file for '" + userId + "' is not a JSON array, treating as empty");
        }
        return entries;
    }

    for (const auto& item : data) {
        if (!item.is_object() || !item.contains("content") || !item["content"].is_string()) continue;
        entries.push_back({item["content"].get<std::string>(), item.value("timestamp", "")});
    }
    return entries;
}

void FileMemoryStore::save(const std::string& userId, const std::vector<MemoryEntry>& entries) const {
    std::error_code ec;
    fs::create_directories(fs::u8path(dir), ec);
    if (ec) {
        throw std::runtime_error("cannot create memory directory '" + dir + "': " + ec.message());
    }

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        arr.push_back({{"content", e.content}, {"timestamp", e.timestamp}});
    }

    std::string path = filePath(userId);
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write memory file '" + path + "'");
    }
    out << arr.dump(2);
}

double FileMemoryStore::relevance(const std::string& content, const std::string& query) {
    std::string c = lower(content), q = lower(query);
    if (q.empty()) return 0.0;
    if (c == q) return 1.0;
    if (c.find(q) != std::string::npos || q.find(c) != std::string::npos) return 0.9;

    auto queryWords = words(q);
    if (queryWords.empty()) return 0.0;
    auto contentWords = words(c);
    size_t hits = 0;
    for (const auto& w : queryWords) {
        if (contentWords.count(w)) hits++;
    }
    // Kept below a substring match
    return 0.8 * static_cast<double>(hits) / static_cast<double>(queryWords.size());
}

void FileMemoryStore::add(const std::string& userId, const std::string& content) {
    if (content.empty()) {
        throw std::invalid_argument("memory content must not be empty");
    }
    std::lock_guard<std::mutex> lock(mtx);
    auto entries = load(userId);
    entries.push_back({content, nowIso()});
    save(userId, entries);
}

std::vector<MemoryEntry> FileMemoryStore::search(const std::string& userId, const std::string& query, size_t limit) {
    std::vector<MemoryEntry> entries;
    {
        std::lock_guard<std::mutex> lock(mtx);
        entries = load(userId);
    }

    std::vector<std::pair<double, size_t>> scored;
    for (size_t i = 0; i < entries.size(); ++i) {
        double score = relevance(entries[i].content, query);
        if (score > 0.0) scored.push_back({score, i});
    }
    // Ties keep save order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<MemoryEntry> out;
    for (const auto& [score, index] : scored) {
        if (limit > 0 && out.size() >= limit) break;
        out.push_back(entries[index]);
    }
    return out;
}

std::vector<MemoryEntry> FileMemoryStore::getAll(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mtx);
    return load(userId);
}
