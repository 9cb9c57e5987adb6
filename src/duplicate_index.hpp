#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

enum class EntryKind { File, Directory };

const char* entry_kind_name(EntryKind kind);

struct DuplicateGroup {
    std::string hash;
    std::vector<std::string> paths; // discovery order

    // The first-discovered member; the copy that is kept when extras are deleted.
    const std::string& canonical_member() const { return paths.front(); }
    std::vector<std::string> extra_members() const {
        return paths.size() > 1 ? std::vector<std::string>(paths.begin() + 1, paths.end())
                                : std::vector<std::string>();
    }
};

struct DuplicateReport {
    std::vector<DuplicateGroup> files;
    std::vector<DuplicateGroup> dirs;

    bool empty() const { return files.empty() && dirs.empty(); }
    std::vector<DuplicateGroup>& groups(EntryKind kind) { return kind == EntryKind::File ? files : dirs; }
    const std::vector<DuplicateGroup>& groups(EntryKind kind) const { return kind == EntryKind::File ? files : dirs; }
    // Number of members beyond the canonical one, over every group.
    std::size_t extra_count() const;
};

// One hash -> ordered paths mapping. A path lives in at most one bucket.
class HashBuckets {
public:
    bool insert(const std::string& hash, const std::string& path);
    // Returns the hash the path was filed under. The bucket is dropped when
    // fewer than two members remain.
    std::optional<std::string> remove(const std::string& path);
    // Drops every path strictly beneath dir. Returns how many were filed.
    std::size_t remove_under(const std::string& dir);
    std::optional<std::string> hash_of(const std::string& path) const;
    const std::vector<std::string>* bucket(const std::string& hash) const;

    std::vector<DuplicateGroup> groups(std::size_t min_members) const;
    std::size_t bucket_count() const { return buckets_.size(); }
    std::size_t path_count() const { return path_to_hash_.size(); }
    void clear();

    nlohmann::ordered_json to_json() const;
    static HashBuckets from_json(const nlohmann::ordered_json& j);

private:
    void erase_bucket(const std::string& hash);

    std::vector<std::string> order_; // bucket insertion order
    std::unordered_map<std::string, std::vector<std::string>> buckets_;
    std::unordered_map<std::string, std::string> path_to_hash_;
};

// Persisted hash -> paths store for files and directories. Every member is
// safe to call from a progress reporter while a scan thread inserts.
class DuplicateIndex {
public:
    static constexpr int kFormatVersion = 1;

    explicit DuplicateIndex(std::filesystem::path store_path,
                            std::shared_ptr<Logger> logger = nullptr);

    // Replaces the in-memory state with the store's content. A missing,
    // unreadable or malformed store leaves the index empty; returns false then.
    bool load();
    // Writes to a temporary file and renames it over the store. Throws IoError.
    void save() const;
    // Empties both mappings and persists the empty state.
    void clear();

    bool insert(EntryKind kind, const std::string& hash, const std::string& path);
    // Files first, then directories. A path in neither is a no-op.
    bool remove_path(const std::string& path);
    // Forgets everything beneath a deleted directory, in both mappings.
    std::size_t remove_under(const std::string& dir);

    DuplicateReport detect_duplicates() const;

    std::optional<std::string> canonical_member(EntryKind kind, const std::string& hash) const;
    std::optional<std::string> hash_of(EntryKind kind, const std::string& path) const;
    std::vector<std::string> members(EntryKind kind, const std::string& hash) const;
    std::size_t bucket_count(EntryKind kind) const;
    std::size_t path_count(EntryKind kind) const;

    const std::filesystem::path& store_path() const { return store_path_; }
    nlohmann::ordered_json to_json() const;

private:
    HashBuckets& mapping(EntryKind kind) { return kind == EntryKind::File ? files_ : dirs_; }
    const HashBuckets& mapping(EntryKind kind) const { return kind == EntryKind::File ? files_ : dirs_; }
    nlohmann::ordered_json to_json_locked() const;

    std::filesystem::path store_path_;
    std::shared_ptr<Logger> logger_;
    mutable std::mutex m_;
    HashBuckets files_;
    HashBuckets dirs_;
};
