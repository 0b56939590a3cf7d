//
// content_stream_detector.cpp
//

#include "../../include/content_stream_detector.hpp"
#include <charconv>
#include <cmath>
#include <numbers>

namespace docscrub {

namespace {

enum class TokenType {
    Number,
    Name,
    Operator,
    String,
    HexString,
    Delimiter, // [ ] { } << >>
    Comment
};

struct Token {
    TokenType type;
    std::size_t begin;
    std::size_t end;
};

bool is_pdf_whitespace(const char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
}

bool is_pdf_delimiter(const char c) {
    return c == '(' || c == ')' || c == '<' || c == '>' || c == '[' || c == ']' ||
           c == '{' || c == '}' || c == '/' || c == '%';
}

bool looks_numeric(const std::string_view s) {
    if (s.empty()) return false;
    bool digit = false;
    for (const char c : s) {
        if (c >= '0' && c <= '9') digit = true;
        else if (c != '.' && c != '+' && c != '-') return false;
    }
    return digit;
}

/**
 * Minimal content-stream lexer. Strings are balanced with escape handling,
 * hex strings run to '>', comments to end of line, and inline image data
 * after ID is skipped up to the EI operator.
 */
class Tokenizer {
public:
    explicit Tokenizer(const std::string_view s) : s_(s) {}

    std::optional<Token> next() {
        while (pos_ < s_.size() && is_pdf_whitespace(s_[pos_])) ++pos_;
        if (pos_ >= s_.size()) return std::nullopt;

        const std::size_t begin = pos_;
        const char c = s_[pos_];

        if (c == '%') {
            while (pos_ < s_.size() && s_[pos_] != '\n' && s_[pos_] != '\r') ++pos_;
            return Token{TokenType::Comment, begin, pos_};
        }
        if (c == '(') {
            skip_literal_string();
            return Token{TokenType::String, begin, pos_};
        }
        if (c == '<') {
            if (pos_ + 1 < s_.size() && s_[pos_ + 1] == '<') {
                pos_ += 2;
                return Token{TokenType::Delimiter, begin, pos_};
            }
            const auto close = s_.find('>', pos_ + 1);
            pos_ = close == std::string_view::npos ? s_.size() : close + 1;
            return Token{TokenType::HexString, begin, pos_};
        }
        if (c == '>') {
            pos_ += (pos_ + 1 < s_.size() && s_[pos_ + 1] == '>') ? 2 : 1;
            return Token{TokenType::Delimiter, begin, pos_};
        }
        if (c == '[' || c == ']' || c == '{' || c == '}' || c == ')') {
            ++pos_;
            return Token{TokenType::Delimiter, begin, pos_};
        }
        if (c == '/') {
            ++pos_;
            while (pos_ < s_.size() && !is_pdf_whitespace(s_[pos_]) && !is_pdf_delimiter(s_[pos_])) ++pos_;
            return Token{TokenType::Name, begin, pos_};
        }

        while (pos_ < s_.size() && !is_pdf_whitespace(s_[pos_]) && !is_pdf_delimiter(s_[pos_])) ++pos_;
        const auto word = s_.substr(begin, pos_ - begin);
        if (looks_numeric(word)) {
            return Token{TokenType::Number, begin, pos_};
        }
        if (word == "ID") {
            skip_inline_image_data();
        }
        return Token{TokenType::Operator, begin, pos_};
    }

private:
    void skip_literal_string() {
        int depth = 0;
        while (pos_ < s_.size()) {
            const char c = s_[pos_++];
            if (c == '\\') {
                if (pos_ < s_.size()) ++pos_;
            } else if (c == '(') {
                ++depth;
            } else if (c == ')') {
                if (--depth == 0) return;
            }
        }
    }

    // binary data follows a single whitespace byte and ends at a standalone EI
    void skip_inline_image_data() {
        if (pos_ < s_.size()) ++pos_;
        while (pos_ + 1 < s_.size()) {
            if (s_[pos_] == 'E' && s_[pos_ + 1] == 'I' &&
                is_pdf_whitespace(s_[pos_ - 1]) &&
                (pos_ + 2 >= s_.size() || is_pdf_whitespace(s_[pos_ + 2]))) {
                return; // EI itself is emitted as the next operator token
            }
            ++pos_;
        }
        pos_ = s_.size();
    }

    std::string_view s_;
    std::size_t pos_ = 0;
};

std::optional<double> parse_number(std::string_view s) {
    if (s.starts_with('+')) s.remove_prefix(1);
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

ContentStreamDetector::ContentStreamDetector(const SanitizeOptions& options) : options_(options) {}

std::vector<TextBlock> ContentStreamDetector::find_text_blocks(const std::string_view stream) {
    std::vector<TextBlock> blocks;
    Tokenizer tok(stream);
    std::optional<std::size_t> open;

    while (const auto t = tok.next()) {
        if (t->type != TokenType::Operator) continue;
        const auto word = stream.substr(t->begin, t->end - t->begin);
        if (word == "BT" && !open) {
            open = t->begin;
        } else if (word == "ET" && open) {
            blocks.push_back({*open, t->end});
            open.reset();
        }
    }
    return blocks;
}

std::optional<Matrix> ContentStreamDetector::last_text_matrix(const std::string_view block) {
    std::optional<Matrix> last;
    std::vector<Token> operands;
    Tokenizer tok(block);

    while (const auto t = tok.next()) {
        if (t->type == TokenType::Comment) continue;
        if (t->type != TokenType::Operator) {
            operands.push_back(*t);
            continue;
        }
        if (block.substr(t->begin, t->end - t->begin) == "Tm" && operands.size() >= 6) {
            Matrix m{};
            bool ok = true;
            const std::size_t first = operands.size() - 6;
            for (std::size_t k = 0; k < 6 && ok; ++k) {
                const auto& op = operands[first + k];
                if (op.type != TokenType::Number) {
                    ok = false;
                    break;
                }
                const auto v = parse_number(block.substr(op.begin, op.end - op.begin));
                if (!v) ok = false;
                else m[k] = *v;
            }
            if (ok) last = m;
        }
        operands.clear();
    }
    return last;
}

double ContentStreamDetector::rotation_angle(const Matrix& m) {
    return std::abs(std::atan2(m[1], 1.0)) * 180.0 / std::numbers::pi;
}

std::optional<WatermarkKind> ContentStreamDetector::classify(const std::string_view block) const {
    if (const auto m = last_text_matrix(block)) {
        const double b = (*m)[1];
        const double c = (*m)[2];
        if (std::abs(b) > options_.rotation_threshold || std::abs(c) > options_.rotation_threshold) {
            const double angle = rotation_angle(*m);
            if (angle >= options_.angle_min && angle <= options_.angle_max) {
                return RotatedText{angle, *m};
            }
        }
    }
    for (const auto& kw : options_.keywords) {
        if (!kw.empty() && block.find(kw) != std::string_view::npos) {
            return KeywordMatch{kw};
        }
    }
    return std::nullopt;
}

StreamScan ContentStreamDetector::scan(const std::string_view stream, const std::size_t page_index,
                                       const bool remove) const {
    StreamScan result;
    const auto blocks = find_text_blocks(stream);
    result.blocks_scanned = blocks.size();

    std::vector<TextBlock> doomed;
    for (const auto& block : blocks) {
        const auto kind = classify(stream.substr(block.begin, block.end - block.begin));
        if (!kind) continue;
        result.candidates.push_back({*kind, ArtifactLocation{page_index, {}, block.begin}});
        doomed.push_back(block);
    }

    if (remove && !doomed.empty()) {
        std::size_t cursor = 0;
        result.rewritten.reserve(stream.size());
        for (const auto& block : doomed) {
            result.rewritten.append(stream.substr(cursor, block.begin - cursor));
            cursor = block.end;
        }
        result.rewritten.append(stream.substr(cursor));
        result.changed = true;
    }
    return result;
}

} // namespace docscrub
