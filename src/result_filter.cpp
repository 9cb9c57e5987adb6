#include "result_filter.hpp"

#include <algorithm>
#include <filesystem>
#include <numeric>
#include <utility>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::unordered_set<std::string> kImages = {
  ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".svg", ".webp", ".ico",
  ".tiff", ".tif", ".raw", ".heic", ".heif", ".psd", ".ai"};
const std::unordered_set<std::string> kVideos = {
  ".mp4", ".avi", ".mkv", ".mov", ".wmv", ".flv", ".webm", ".m4v",
  ".mpg", ".mpeg", ".3gp", ".f4v", ".swf", ".vob", ".ogv"};
const std::unordered_set<std::string> kDocuments = {
  ".pdf", ".doc", ".docx", ".txt", ".rtf", ".odt", ".xls", ".xlsx",
  ".ppt", ".pptx", ".csv", ".ods", ".odp", ".tex", ".md", ".epub"};
const std::unordered_set<std::string> kAudio = {
  ".mp3", ".wav", ".flac", ".aac", ".ogg", ".wma", ".m4a", ".opus",
  ".ape", ".alac", ".aiff"};
const std::unordered_set<std::string> kArchives = {
  ".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz", ".iso",
  ".dmg", ".pkg", ".deb", ".rpm"};
const std::unordered_set<std::string> kCode = {
  ".py", ".js", ".java", ".c", ".cpp", ".h", ".hpp", ".cs", ".go",
  ".rs", ".rb", ".php", ".swift", ".kt", ".ts", ".tsx", ".jsx", ".html",
  ".css", ".scss", ".sass", ".less", ".sql", ".sh", ".bat", ".ps1"};
const std::unordered_set<std::string> kNone;

bool matches_search(const std::string& path, const FilterOptions& options) {
  if(options.search.empty()) return true;
  if(options.case_sensitive) return path.find(options.search) != std::string::npos;
  return contains_icase(path, options.search);
}

template<typename Key>
void sort_by_key(std::vector<std::string>& paths, Key key_of, bool descending) {
  using K = decltype(key_of(paths.front()));
  std::vector<std::pair<K, std::string>> keyed;
  keyed.reserve(paths.size());
  for(auto& p : paths) keyed.emplace_back(key_of(p), std::move(p));
  std::stable_sort(keyed.begin(), keyed.end(),
                   [descending](const auto& a, const auto& b){
                     return descending ? b.first < a.first : a.first < b.first;
                   });
  paths.clear();
  for(auto& k : keyed) paths.push_back(std::move(k.second));
}

} // namespace

const std::unordered_set<std::string>& ResultFilterSort::extensions_for(FileTypeCategory category) {
  switch(category) {
    case FileTypeCategory::Images: return kImages;
    case FileTypeCategory::Videos: return kVideos;
    case FileTypeCategory::Documents: return kDocuments;
    case FileTypeCategory::Audio: return kAudio;
    case FileTypeCategory::Archives: return kArchives;
    case FileTypeCategory::Code: return kCode;
    case FileTypeCategory::All: break;
  }
  return kNone;
}

bool ResultFilterSort::matches_category(const std::string& path, FileTypeCategory category) {
  if(category == FileTypeCategory::All) return true;
  return extensions_for(category).count(normalize_extension(fs::path(path).extension().string())) > 0;
}

FileTypeCategory ResultFilterSort::parse_file_type(const std::string& name) {
  auto v = to_lower(trim_copy(name));
  if(v == "images" || v == "image") return FileTypeCategory::Images;
  if(v == "videos" || v == "video") return FileTypeCategory::Videos;
  if(v == "documents" || v == "docs") return FileTypeCategory::Documents;
  if(v == "audio") return FileTypeCategory::Audio;
  if(v == "archives" || v == "archive") return FileTypeCategory::Archives;
  if(v == "code") return FileTypeCategory::Code;
  return FileTypeCategory::All;
}

const char* ResultFilterSort::file_type_name(FileTypeCategory category) {
  switch(category) {
    case FileTypeCategory::Images: return "images";
    case FileTypeCategory::Videos: return "videos";
    case FileTypeCategory::Documents: return "documents";
    case FileTypeCategory::Audio: return "audio";
    case FileTypeCategory::Archives: return "archives";
    case FileTypeCategory::Code: return "code";
    case FileTypeCategory::All: break;
  }
  return "all";
}

std::optional<PathSortKey> ResultFilterSort::parse_sort_key(const std::string& name) {
  auto v = to_lower(trim_copy(name));
  if(v == "none" || v.empty()) return PathSortKey::None;
  if(v == "size") return PathSortKey::Size;
  if(v == "name") return PathSortKey::Name;
  if(v == "date" || v == "date-modified" || v == "mtime") return PathSortKey::Date;
  if(v == "path") return PathSortKey::Path;
  return std::nullopt;
}

std::optional<GroupSortKey> ResultFilterSort::parse_group_sort_key(const std::string& name) {
  auto v = to_lower(trim_copy(name));
  if(v == "none" || v.empty()) return GroupSortKey::None;
  if(v == "group_size" || v == "group-size" || v == "size") return GroupSortKey::GroupSize;
  if(v == "count") return GroupSortKey::Count;
  return std::nullopt;
}

int64_t ResultFilterSort::modified_time(const std::string& path) {
  std::error_code ec;
  auto t = fs::last_write_time(path, ec);
  if(ec) return 0;
  return static_cast<int64_t>(t.time_since_epoch().count());
}

void ResultFilterSort::sort_paths(std::vector<std::string>& paths, PathSortKey key, bool reverse) {
  if(paths.empty()) return;
  switch(key) {
    case PathSortKey::None:
      return;
    case PathSortKey::Size:
      sort_by_key(paths, [](const std::string& p){ return path_size(p); }, reverse);
      return;
    case PathSortKey::Name:
      sort_by_key(paths, [](const std::string& p){ return to_lower(fs::path(p).filename().string()); }, reverse);
      return;
    case PathSortKey::Date:
      sort_by_key(paths, [](const std::string& p){ return modified_time(p); }, reverse);
      return;
    case PathSortKey::Path:
      sort_by_key(paths, [](const std::string& p){ return to_lower(p); }, reverse);
      return;
  }
}

std::vector<std::string> ResultFilterSort::filter_paths(std::vector<std::string> paths,
                                                        EntryKind kind,
                                                        const FilterOptions& options) {
  std::vector<std::string> out;
  out.reserve(paths.size());
  for(auto& p : paths) {
    if(kind == EntryKind::File && !matches_category(p, options.file_type)) continue;
    if(options.min_size > 0 && path_size(p) < options.min_size) continue;
    if(!matches_search(p, options)) continue;
    out.push_back(std::move(p));
  }
  return out;
}

DuplicateReport ResultFilterSort::filter(const DuplicateReport& report, const FilterOptions& options) {
  DuplicateReport out;
  for(auto kind : {EntryKind::File, EntryKind::Directory}) {
    for(const auto& group : report.groups(kind)) {
      auto kept = filter_paths(group.paths, kind, options);
      if(kept.size() < 2) continue;
      sort_paths(kept, options.sort_by, options.reverse);
      out.groups(kind).push_back({group.hash, std::move(kept)});
    }
  }
  return out;
}

DuplicateReport ResultFilterSort::sort_groups(const DuplicateReport& report, GroupSortKey key) {
  DuplicateReport out = report;
  if(key == GroupSortKey::None) return out;

  auto weight = [key](const DuplicateGroup& g) -> uint64_t {
    if(key == GroupSortKey::Count) return g.paths.size();
    return std::accumulate(g.paths.begin(), g.paths.end(), uint64_t{0},
                           [](uint64_t acc, const std::string& p){ return acc + path_size(p); });
  };
  for(auto kind : {EntryKind::File, EntryKind::Directory}) {
    auto& groups = out.groups(kind);
    std::vector<std::pair<uint64_t, DuplicateGroup>> keyed;
    keyed.reserve(groups.size());
    for(auto& g : groups) keyed.emplace_back(weight(g), std::move(g));
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b){ return a.first > b.first; });
    groups.clear();
    for(auto& k : keyed) groups.push_back(std::move(k.second));
  }
  return out;
}
