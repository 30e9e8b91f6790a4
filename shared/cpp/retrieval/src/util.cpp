#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace ragcore {

namespace {
struct DigestCtx {
    EVP_MD_CTX* ctx{nullptr};
    explicit DigestCtx(const EVP_MD* md) {
        ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
            if (ctx) EVP_MD_CTX_free(ctx);
            throw RetrievalError("EVP_DigestInit_ex failed");
        }
    }
    ~DigestCtx() { EVP_MD_CTX_free(ctx); }
    void update(const void* data, size_t n) {
        if (EVP_DigestUpdate(ctx, data, n) != 1) throw RetrievalError("EVP_DigestUpdate failed");
    }
    std::string hex() {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, md, &len) != 1) throw RetrievalError("EVP_DigestFinal_ex failed");
        std::ostringstream oss;
        for (unsigned int i = 0; i < len; ++i) {
            oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
        }
        return oss.str();
    }
};
}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string sha256_hex(const std::string& data) {
    DigestCtx d(EVP_sha256());
    d.update(data.data(), data.size());
    return d.hex();
}

std::string sha1_hex(const std::string& data) {
    DigestCtx d(EVP_sha1());
    d.update(data.data(), data.size());
    return d.hex();
}

std::string sha1_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw RetrievalError("cannot open " + p.string());
    DigestCtx d(EVP_sha1());
    std::vector<char> buf(1 << 16);
    while (f) {
        f.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize n = f.gcount();
        if (n > 0) d.update(buf.data(), (size_t)n);
    }
    return d.hex();
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) throw RetrievalError("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs) {
    std::vector<std::filesystem::path> out;
    auto extset = std::unordered_set<std::string>(exts.begin(), exts.end());
    auto igset = std::unordered_set<std::string>(ignore_dirs.begin(), ignore_dirs.end());
    for (auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto rel = std::filesystem::relative(entry.path(), root);
        bool ignored = false;
        for (auto& part : rel) {
            if (igset.count(part.string())) { ignored = true; break; }
        }
        if (ignored) continue;
        auto ext = entry.path().extension().string();
        if (extset.empty() || extset.count(ext)) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace ragcore
