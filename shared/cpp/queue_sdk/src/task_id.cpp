#include "../include/task_id.hpp"
#include "../include/errors.hpp"
#include <openssl/evp.h>
#include <cctype>

namespace nlpq {

bool looks_like_task_id(const std::string& value) noexcept {
    if (value.size() != kTaskIdLength || value.compare(0, 2, "0x") != 0) return false;
    for (std::size_t i = 2; i < value.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

std::string task_id(const std::string& doc) {
    if (looks_like_task_id(doc)) return doc;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(doc.data(), doc.size(), md, &len, EVP_md5(), nullptr) != 1) {
        throw QueueError(ErrorKind::StorageError, "MD5 digest failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + 2 * len);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[(md[i] >> 4) & 0xF]);
        out.push_back(hex[md[i] & 0xF]);
    }
    return out;
}

bool is_safe_name(const std::string& name) noexcept {
    if (name.empty() || name.front() == '.') return false;
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') return false;
    }
    return true;
}

} // namespace nlpq
