#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ragcore {

// Byte span [begin, end) into the tokenized text.
struct TokenSpan {
    std::size_t begin{0};
    std::size_t end{0};
};

// Token counting is approximate and swappable. Spans returned by tokenize()
// tile the input: the first begins at 0, each begins where the previous
// ended, the last ends at text.size().
class Tokenizer {
public:
    virtual ~Tokenizer() = default;
    virtual std::vector<TokenSpan> tokenize(const std::string& text) const = 0;
    virtual std::size_t count(const std::string& text) const { return tokenize(text).size(); }
};

// Word runs and single punctuation marks, each carrying the whitespace that
// precedes it. Trailing whitespace is one extra token.
class ApproxTokenizer : public Tokenizer {
public:
    std::vector<TokenSpan> tokenize(const std::string& text) const override;
    std::size_t count(const std::string& text) const override;
};

constexpr std::size_t kBytesPerTokenEstimate = 4;

std::size_t estimate_tokens(std::size_t bytes);

// Falls back to the byte estimate when the tokenizer throws.
std::size_t count_tokens_or_estimate(const Tokenizer& tokenizer, const std::string& text);

// Term extraction for the lexical index.
using LexicalTokenizer = std::function<std::vector<std::string>(const std::string&)>;

// Lowercase, whitespace split, surrounding punctuation stripped.
std::vector<std::string> default_lexical_tokens(const std::string& text);

} // namespace ragcore
