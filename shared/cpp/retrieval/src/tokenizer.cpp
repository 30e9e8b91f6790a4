#include "../include/tokenizer.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <cctype>

namespace ragcore {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Bytes >= 0x80 are treated as word characters so UTF-8 sequences stay whole.
static bool is_word(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

template <typename Emit>
static void scan_tokens(const std::string& text, Emit emit) {
    size_t i = 0, n = text.size();
    while (i < n) {
        size_t start = i;
        while (i < n && is_space(text[i])) ++i;
        if (i == n) { emit(start, n); break; }
        if (is_word(text[i])) {
            while (i < n && is_word(text[i])) ++i;
        } else {
            ++i;
        }
        emit(start, i);
    }
}

std::vector<TokenSpan> ApproxTokenizer::tokenize(const std::string& text) const {
    std::vector<TokenSpan> out;
    scan_tokens(text, [&](size_t b, size_t e){ out.push_back({b, e}); });
    return out;
}

std::size_t ApproxTokenizer::count(const std::string& text) const {
    std::size_t n = 0;
    scan_tokens(text, [&](size_t, size_t){ ++n; });
    return n;
}

std::size_t estimate_tokens(std::size_t bytes) {
    if (bytes == 0) return 0;
    return std::max<std::size_t>(1, bytes / kBytesPerTokenEstimate);
}

std::size_t count_tokens_or_estimate(const Tokenizer& tokenizer, const std::string& text) {
    try {
        return tokenizer.count(text);
    } catch (const std::exception& e) {
        log_debug(std::string("token counter failed, using estimate: ") + e.what());
        return estimate_tokens(text.size());
    }
}

std::vector<std::string> default_lexical_tokens(const std::string& text) {
    std::vector<std::string> out;
    size_t i = 0, n = text.size();
    while (i < n) {
        while (i < n && is_space(text[i])) ++i;
        size_t start = i;
        while (i < n && !is_space(text[i])) ++i;
        if (start == i) continue;
        size_t b = start, e = i;
        while (b < e && !is_word(text[b])) ++b;
        while (e > b && !is_word(text[e - 1])) --e;
        if (b == e) continue;
        std::string term = text.substr(b, e - b);
        for (auto& c : term) c = (char)std::tolower(static_cast<unsigned char>(c));
        out.push_back(std::move(term));
    }
    return out;
}

} // namespace ragcore
