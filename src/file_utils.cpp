#include "file_utils.h"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace gradebox {

namespace fs = std::filesystem;

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

bool FileUtils::matches_pattern(const std::string& path, const std::string& pattern) {
    // Simple glob pattern matching
    // Supports: *, exact, *.ext, prefix*, dir/*.ext

    if (pattern == "*") {
        return true;
    }

    size_t star_pos = pattern.find('*');
    if (star_pos == std::string::npos) {
        return path == pattern;
    }

    // Only one wildcard is supported; anything after a second star is literal
    std::string before_star = pattern.substr(0, star_pos);
    std::string after_star = pattern.substr(star_pos + 1);

    if (path.size() < before_star.size() + after_star.size()) {
        return false;
    }

    return path.compare(0, before_star.size(), before_star) == 0 &&
           path.compare(path.size() - after_star.size(), after_star.size(), after_star) == 0;
}

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::fingerprint(const std::string& language, const FileMap& files) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }

    // Length-prefix every field so that ("ab", "c") and ("a", "bc") differ
    auto feed = [&ctx](const std::string& field) {
        std::string prefix = std::to_string(field.size()) + ":";
        EVP_DigestUpdate(ctx.get(), prefix.data(), prefix.size());
        EVP_DigestUpdate(ctx.get(), field.data(), field.size());
    };

    feed(language);
    for (const auto& [path, content] : files) {  // std::map iterates in path order
        feed(path);
        feed(content);
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return bytes_to_hex(hash, hash_len);
}

std::string FileUtils::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

std::string FileUtils::read_file(const fs::path& path, size_t max_bytes) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + path.string() + ": " + ec.message());
    }
    if (size > max_bytes) {
        throw std::runtime_error("File " + path.string() + " exceeds " + format_file_size(max_bytes));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

std::map<std::string, std::string> FileUtils::collect_files(
    const std::string& dirpath,
    const std::string& pattern,
    size_t max_bytes
) {
    std::map<std::string, std::string> result;

    if (!fs::exists(dirpath) || !fs::is_directory(dirpath)) {
        return result;
    }

    for (const auto& entry : fs::recursive_directory_iterator(dirpath)) {
        // Symlinks written by the sandboxed process are never followed
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }

        std::string relpath = fs::relative(entry.path(), dirpath).generic_string();
        if (!matches_pattern(relpath, pattern)) {
            continue;
        }
        if (entry.file_size() > max_bytes) {
            continue;
        }

        result[relpath] = read_file(entry.path(), max_bytes);
    }

    return result;
}

std::string FileUtils::truncate(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    return text.substr(0, max_bytes) + "\n... [truncated " +
           std::to_string(text.size() - max_bytes) + " bytes]";
}

} // namespace gradebox
