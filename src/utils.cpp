#include "utils.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::optional<std::string> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(hex.size() / 2);
    for(size_t i = 0; i < hex.size(); i += 2){
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

// Rejects overlong forms, surrogates and code points past U+10FFFF, the same
// inputs nlohmann::json refuses to dump.
bool is_valid_utf8(const std::string& text){
    size_t i = 0;
    const size_t n = text.size();
    while(i < n){
        const auto c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if(c < 0x80){ ++i; continue; }
        else if((c & 0xE0) == 0xC0){ extra = 1; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ extra = 2; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ extra = 3; cp = c & 0x07; }
        else return false;
        if(i + extra >= n) return false;
        for(size_t k = 1; k <= extra; ++k){
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        static const uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if(cp < kMinForLength[extra]) return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::vector<std::string> split_list(const std::string& value, char separator){
    std::vector<std::string> out;
    std::istringstream iss(value);
    std::string item;
    while(std::getline(iss, item, separator)){
        item = trim_copy(item);
        if(!item.empty()) out.push_back(item);
    }
    return out;
}

bool contains_icase(const std::string& haystack, const std::string& needle){
    if(needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string normalize_extension(const std::string& ext){
    std::string clean = to_lower(trim_copy(ext));
    if(clean.empty()) return clean;
    if(clean[0] != '.') clean.insert(clean.begin(), '.');
    return clean;
}

uint64_t parse_size_string(const std::string& text){
    return try_parse_size(text).value_or(0);
}

std::optional<uint64_t> try_parse_size(const std::string& text){
    static const std::regex pattern(R"(^([0-9]*\.?[0-9]+)\s*([KMGT]?)B?$)");
    std::string clean = trim_copy(text);
    std::transform(clean.begin(), clean.end(), clean.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
    std::smatch match;
    if(!std::regex_match(clean, match, pattern)) return std::nullopt;

    double value = 0.0;
    try {
        value = std::stod(match[1].str());
    } catch(const std::exception&) {
        return std::nullopt;
    }
    uint64_t multiplier = 1;
    const std::string unit = match[2].str();
    if(unit == "K") multiplier = 1ull << 10;
    else if(unit == "M") multiplier = 1ull << 20;
    else if(unit == "G") multiplier = 1ull << 30;
    else if(unit == "T") multiplier = 1ull << 40;
    return static_cast<uint64_t>(value * static_cast<double>(multiplier));
}

std::string format_size(uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(value >= 1024.0 && idx + 1 < sizeof(units) / sizeof(units[0])){
        value /= 1024.0;
        ++idx;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[idx];
    return oss.str();
}

uint64_t path_size(const std::filesystem::path& path){
    namespace fs = std::filesystem;
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if(ec) return 0;
    if(fs::is_regular_file(status)){
        auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }
    if(!fs::is_directory(status)) return 0;

    uint64_t total = 0;
    for(auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
        !ec && it != fs::recursive_directory_iterator(); it.increment(ec)){
        std::error_code entry_ec;
        if(it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)){
            auto size = it->file_size(entry_ec);
            if(!entry_ec) total += size;
        }
    }
    return total;
}

bool path_is_within(const std::string& path, const std::string& dir){
    if(dir.empty() || path.size() < dir.size()) return false;
    if(path.compare(0, dir.size(), dir) != 0) return false;
    if(path.size() == dir.size()) return true;
    auto is_sep = [](char c){
        return c == '/' || c == static_cast<char>(std::filesystem::path::preferred_separator);
    };
    return is_sep(dir.back()) || is_sep(path[dir.size()]);
}
