#include "duplicate_index.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

const char* entry_kind_name(EntryKind kind) {
    return kind == EntryKind::File ? "files" : "dirs";
}

std::size_t DuplicateReport::extra_count() const {
    std::size_t total = 0;
    for(const auto& g : files) total += g.paths.size() - 1;
    for(const auto& g : dirs) total += g.paths.size() - 1;
    return total;
}

// ---- HashBuckets ----------------------------------------------------------

bool HashBuckets::insert(const std::string& hash, const std::string& path) {
    auto known = path_to_hash_.find(path);
    if(known != path_to_hash_.end()) {
        if(known->second == hash) return false;
        // Content changed since the path was filed; move it.
        auto& old_bucket = buckets_[known->second];
        old_bucket.erase(std::remove(old_bucket.begin(), old_bucket.end(), path), old_bucket.end());
        if(old_bucket.empty()) erase_bucket(known->second);
    }
    auto it = buckets_.find(hash);
    if(it == buckets_.end()) {
        order_.push_back(hash);
        it = buckets_.emplace(hash, std::vector<std::string>{}).first;
    }
    it->second.push_back(path);
    path_to_hash_[path] = hash;
    return true;
}

std::optional<std::string> HashBuckets::remove(const std::string& path) {
    auto known = path_to_hash_.find(path);
    if(known == path_to_hash_.end()) return std::nullopt;
    std::string hash = known->second;
    path_to_hash_.erase(known);

    auto& bucket = buckets_[hash];
    bucket.erase(std::remove(bucket.begin(), bucket.end(), path), bucket.end());
    if(bucket.size() < 2) {
        for(const auto& leftover : bucket) path_to_hash_.erase(leftover);
        erase_bucket(hash);
    }
    return hash;
}

std::size_t HashBuckets::remove_under(const std::string& dir) {
    std::vector<std::string> doomed;
    for(const auto& entry : path_to_hash_) {
        if(entry.first != dir && path_is_within(entry.first, dir)) doomed.push_back(entry.first);
    }
    for(const auto& path : doomed) remove(path);
    return doomed.size();
}

void HashBuckets::erase_bucket(const std::string& hash) {
    buckets_.erase(hash);
    order_.erase(std::remove(order_.begin(), order_.end(), hash), order_.end());
}

std::optional<std::string> HashBuckets::hash_of(const std::string& path) const {
    auto it = path_to_hash_.find(path);
    if(it == path_to_hash_.end()) return std::nullopt;
    return it->second;
}

const std::vector<std::string>* HashBuckets::bucket(const std::string& hash) const {
    auto it = buckets_.find(hash);
    return it == buckets_.end() ? nullptr : &it->second;
}

std::vector<DuplicateGroup> HashBuckets::groups(std::size_t min_members) const {
    std::vector<DuplicateGroup> out;
    for(const auto& hash : order_) {
        const auto& paths = buckets_.at(hash);
        if(paths.size() >= min_members) out.push_back({hash, paths});
    }
    return out;
}

void HashBuckets::clear() {
    order_.clear();
    buckets_.clear();
    path_to_hash_.clear();
}

namespace {

// JSON text must be UTF-8. Paths that are not (raw bytes from the filesystem)
// are stored as {"hex": "<bytes>"} so the round trip is lossless.
nlohmann::ordered_json encode_path(const std::string& path) {
    if(is_valid_utf8(path)) return path;
    nlohmann::ordered_json wrapped = nlohmann::ordered_json::object();
    wrapped["hex"] = hex_from_bytes(std::vector<unsigned char>(path.begin(), path.end()));
    return wrapped;
}

std::string decode_path(const nlohmann::ordered_json& entry, const std::string& hash) {
    if(entry.is_string()) return entry.get<std::string>();
    if(entry.is_object() && entry.size() == 1 && entry.contains("hex") && entry.at("hex").is_string()) {
        auto raw = bytes_from_hex(entry.at("hex").get<std::string>());
        if(raw) return *raw;
    }
    throw CorruptStateError("bucket '" + hash + "' holds a malformed path");
}

} // namespace

nlohmann::ordered_json HashBuckets::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for(const auto& hash : order_) {
        auto& entries = j[hash] = nlohmann::ordered_json::array();
        for(const auto& path : buckets_.at(hash)) entries.push_back(encode_path(path));
    }
    return j;
}

HashBuckets HashBuckets::from_json(const nlohmann::ordered_json& j) {
    if(!j.is_object()) throw CorruptStateError("bucket mapping is not an object");
    HashBuckets out;
    for(const auto& item : j.items()) {
        if(!item.value().is_array()) {
            throw CorruptStateError("bucket '" + item.key() + "' is not an array");
        }
        for(const auto& entry : item.value()) {
            out.insert(item.key(), decode_path(entry, item.key()));
        }
    }
    return out;
}

// ---- DuplicateIndex -------------------------------------------------------

DuplicateIndex::DuplicateIndex(std::filesystem::path store_path, std::shared_ptr<Logger> logger)
    : store_path_(std::move(store_path)), logger_(std::move(logger)) {}

bool DuplicateIndex::load() {
    HashBuckets files;
    HashBuckets dirs;
    bool loaded = false;

    std::ifstream in(store_path_);
    if(!in) {
        log_debug(logger_.get(), "no index at {}, starting empty", store_path_.string());
    } else {
        try {
            nlohmann::ordered_json doc;
            try {
                in >> doc;
            } catch(const nlohmann::json::exception& e) {
                throw CorruptStateError(e.what());
            }
            if(!doc.is_object() || !doc.contains("files") || !doc.contains("dirs")) {
                throw CorruptStateError("missing 'files' or 'dirs'");
            }
            files = HashBuckets::from_json(doc.at("files"));
            dirs = HashBuckets::from_json(doc.at("dirs"));
            loaded = true;
        } catch(const CorruptStateError& e) {
            log_warn(logger_.get(), "index {} is unreadable ({}), starting empty",
                     store_path_.string(), e.what());
            files.clear();
            dirs.clear();
        }
    }

    std::lock_guard lg(m_);
    files_ = std::move(files);
    dirs_ = std::move(dirs);
    return loaded;
}

nlohmann::ordered_json DuplicateIndex::to_json_locked() const {
    nlohmann::ordered_json doc = nlohmann::ordered_json::object();
    doc["version"] = kFormatVersion;
    doc["files"] = files_.to_json();
    doc["dirs"] = dirs_.to_json();
    return doc;
}

nlohmann::ordered_json DuplicateIndex::to_json() const {
    std::lock_guard lg(m_);
    return to_json_locked();
}

void DuplicateIndex::save() const {
    std::string payload;
    {
        std::lock_guard lg(m_);
        try {
            payload = to_json_locked().dump(2);
        } catch(const nlohmann::json::exception& e) {
            throw IoError(std::string("cannot serialize index: ") + e.what(), store_path_);
        }
    }

    std::error_code ec;
    if(store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
        if(ec) throw_io_error(ec, "cannot create index directory", store_path_.parent_path());
    }

    auto tmp_path = store_path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if(!out) throw IoError("cannot open index for writing", tmp_path);
        out << payload;
        out.flush();
        if(!out) throw IoError("short write to index", tmp_path);
    }
    std::filesystem::rename(tmp_path, store_path_, ec);
    if(ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp_path, cleanup_ec);
        throw_io_error(ec, "cannot replace index", store_path_);
    }
    log_debug(logger_.get(), "saved index to {}", store_path_.string());
}

void DuplicateIndex::clear() {
    {
        std::lock_guard lg(m_);
        files_.clear();
        dirs_.clear();
    }
    save();
}

bool DuplicateIndex::insert(EntryKind kind, const std::string& hash, const std::string& path) {
    std::lock_guard lg(m_);
    return mapping(kind).insert(hash, path);
}

bool DuplicateIndex::remove_path(const std::string& path) {
    std::lock_guard lg(m_);
    if(files_.remove(path)) return true;
    return dirs_.remove(path).has_value();
}

std::size_t DuplicateIndex::remove_under(const std::string& dir) {
    std::lock_guard lg(m_);
    return files_.remove_under(dir) + dirs_.remove_under(dir);
}

DuplicateReport DuplicateIndex::detect_duplicates() const {
    std::lock_guard lg(m_);
    DuplicateReport report;
    report.files = files_.groups(2);
    report.dirs = dirs_.groups(2);
    return report;
}

std::optional<std::string> DuplicateIndex::canonical_member(EntryKind kind, const std::string& hash) const {
    std::lock_guard lg(m_);
    const auto* bucket = mapping(kind).bucket(hash);
    if(!bucket || bucket->empty()) return std::nullopt;
    return bucket->front();
}

std::optional<std::string> DuplicateIndex::hash_of(EntryKind kind, const std::string& path) const {
    std::lock_guard lg(m_);
    return mapping(kind).hash_of(path);
}

std::vector<std::string> DuplicateIndex::members(EntryKind kind, const std::string& hash) const {
    std::lock_guard lg(m_);
    const auto* bucket = mapping(kind).bucket(hash);
    return bucket ? *bucket : std::vector<std::string>{};
}

std::size_t DuplicateIndex::bucket_count(EntryKind kind) const {
    std::lock_guard lg(m_);
    return mapping(kind).bucket_count();
}

std::size_t DuplicateIndex::path_count(EntryKind kind) const {
    std::lock_guard lg(m_);
    return mapping(kind).path_count();
}
