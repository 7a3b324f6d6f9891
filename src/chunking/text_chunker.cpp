// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <docmem/chunking/text_chunker.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace docmem::chunking {

namespace {

// Separator groups tried in order when a line is too long; nullptr cuts at the middle
const std::vector<const char*> kPlainTextSeparators = {".", "?!", ";", ":", ",", ")]}",
                                                       " ", "-", nullptr};
const std::vector<const char*> kMarkdownSeparators = {".", "?!", ";", ":", ",", ")]}",
                                                      " ", "-", "\n\r", nullptr};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> splitRawLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool isFence(std::string_view line) {
    auto t = trimView(line);
    return t.starts_with("```") || t.starts_with("~~~");
}

bool isHeading(std::string_view line) {
    auto t = trimView(line);
    return !t.empty() && t.front() == '#';
}

bool isListItem(std::string_view line) {
    auto t = line;
    while (!t.empty() && (t.front() == ' ' || t.front() == '\t'))
        t.remove_prefix(1);
    if (t.size() >= 2 && (t[0] == '-' || t[0] == '*' || t[0] == '+') && t[1] == ' ')
        return true;
    size_t digits = 0;
    while (digits < t.size() && std::isdigit(static_cast<unsigned char>(t[digits])))
        ++digits;
    return digits > 0 && digits + 1 < t.size() && (t[digits] == '.' || t[digits] == ')') &&
           t[digits + 1] == ' ';
}

bool isIndented(std::string_view line) {
    return !line.empty() && (line.front() == ' ' || line.front() == '\t');
}

std::string joinLines(const std::vector<std::string_view>& lines) {
    std::string out;
    for (const auto& l : lines) {
        if (!out.empty())
            out.push_back('\n');
        out.append(l);
    }
    return out;
}

} // namespace

std::vector<std::string> WhitespaceTokenizer::tokenize(std::string_view text) const {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i]))
            ++i;
        size_t start = i;
        while (i < text.size() && !isSpace(text[i]))
            ++i;
        if (i > start)
            tokens.emplace_back(text.substr(start, i - start));
    }
    return tokens;
}

size_t WhitespaceTokenizer::countTokens(std::string_view text) const {
    size_t count = 0;
    bool inToken = false;
    for (char c : text) {
        if (isSpace(c)) {
            inToken = false;
        } else if (!inToken) {
            inToken = true;
            ++count;
        }
    }
    return count;
}

TextChunker::TextChunker(ChunkerOptions options, std::shared_ptr<const ITokenizer> tokenizer)
    : options_(std::move(options)), tokenizer_(std::move(tokenizer)) {
    if (!tokenizer_) {
        tokenizer_ = std::make_shared<WhitespaceTokenizer>();
    }
}

Result<void> TextChunker::validate() const {
    if (options_.max_tokens_per_line == 0) {
        return Error{ErrorCode::InvalidArgument, "max_tokens_per_line must be greater than zero"};
    }
    if (options_.max_tokens_per_paragraph == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "max_tokens_per_paragraph must be greater than zero"};
    }
    if (options_.overlap_tokens >= options_.max_tokens_per_paragraph) {
        return Error{ErrorCode::InvalidArgument,
                     "overlap_tokens must be less than max_tokens_per_paragraph"};
    }
    const size_t headerTokens = tokenizer_->countTokens(options_.chunk_header);
    if (headerTokens + options_.overlap_tokens >= options_.max_tokens_per_paragraph) {
        return Error{ErrorCode::InvalidArgument,
                     "chunk header and overlap leave no room for content"};
    }
    return {};
}

std::string TextChunker::lastTokens(std::string_view text, size_t count) const {
    if (count == 0)
        return {};
    auto tokens = tokenizer_->tokenize(text);
    size_t first = tokens.size() > count ? tokens.size() - count : 0;
    std::string out;
    for (size_t i = first; i < tokens.size(); ++i) {
        if (!out.empty())
            out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

void TextChunker::splitRecursive(std::string_view text, const std::vector<const char*>& separators,
                                 size_t separatorIndex, int section,
                                 std::vector<TextLine>& out) const {
    text = trimView(text);
    if (text.empty())
        return;

    const size_t tokens = tokenizer_->countTokens(text);
    if (tokens <= options_.max_tokens_per_line) {
        out.push_back(TextLine{std::string(text), section, tokens});
        return;
    }

    const size_t mid = text.size() / 2;
    for (size_t i = separatorIndex; i < separators.size(); ++i) {
        const char* sep = separators[i];
        size_t cut = std::string_view::npos;

        if (sep == nullptr) {
            cut = mid;
            // Keep multi-byte UTF-8 sequences intact
            while (cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
                ++cut;
        } else {
            size_t bestDistance = std::string_view::npos;
            for (size_t p = 0; p + 1 < text.size(); ++p) {
                if (std::strchr(sep, text[p]) == nullptr)
                    continue;
                size_t distance = p > mid ? p - mid : mid - p;
                if (distance < bestDistance) {
                    bestDistance = distance;
                    cut = p + 1;
                }
            }
        }

        if (cut == std::string_view::npos || cut == 0 || cut >= text.size())
            continue;
        auto left = trimView(text.substr(0, cut));
        auto right = trimView(text.substr(cut));
        if (left.empty() || right.empty())
            continue;

        splitRecursive(left, separators, i, section, out);
        splitRecursive(right, separators, i, section, out);
        return;
    }

    // Nothing left to cut on; keep the oversized line rather than dropping it
    out.push_back(TextLine{std::string(text), section, tokens});
}

void TextChunker::appendLine(std::string_view text, TextFormat format, int section,
                             std::vector<TextLine>& out) const {
    const auto& separators =
        format == TextFormat::Markdown ? kMarkdownSeparators : kPlainTextSeparators;
    splitRecursive(text, separators, 0, section, out);
}

std::vector<TextLine> TextChunker::splitToLines(std::string_view text, TextFormat format,
                                                int section) const {
    std::vector<TextLine> out;
    const auto rawLines = splitRawLines(text);

    if (format == TextFormat::PlainText) {
        for (const auto& line : rawLines) {
            appendLine(line, format, section, out);
        }
        return out;
    }

    // Markdown: fenced blocks and list items are atomic, soft-wrapped prose is rejoined
    std::vector<std::string_view> paragraph;
    auto flushParagraph = [&]() {
        if (!paragraph.empty()) {
            appendLine(joinLines(paragraph), format, section, out);
            paragraph.clear();
        }
    };
    auto emitAtomic = [&](const std::vector<std::string_view>& block) {
        auto joined = joinLines(block);
        auto trimmed = trimView(joined);
        if (!trimmed.empty()) {
            out.push_back(
                TextLine{std::string(trimmed), section, tokenizer_->countTokens(trimmed)});
        }
    };

    size_t i = 0;
    while (i < rawLines.size()) {
        const auto line = rawLines[i];

        if (isFence(line)) {
            flushParagraph();
            const auto marker = trimView(line).substr(0, 3);
            std::vector<std::string_view> block{line};
            ++i;
            while (i < rawLines.size()) {
                block.push_back(rawLines[i]);
                bool closing = trimView(rawLines[i]).starts_with(marker);
                ++i;
                if (closing)
                    break;
            }
            emitAtomic(block);
            continue;
        }

        if (trimView(line).empty()) {
            flushParagraph();
            ++i;
            continue;
        }

        if (isHeading(line)) {
            flushParagraph();
            appendLine(line, format, section, out);
            ++i;
            continue;
        }

        if (isListItem(line)) {
            flushParagraph();
            std::vector<std::string_view> block{line};
            ++i;
            while (i < rawLines.size() && !trimView(rawLines[i]).empty() &&
                   isIndented(rawLines[i]) && !isListItem(rawLines[i]) && !isFence(rawLines[i])) {
                block.push_back(rawLines[i]);
                ++i;
            }
            emitAtomic(block);
            continue;
        }

        paragraph.push_back(line);
        ++i;
    }
    flushParagraph();
    return out;
}

Result<std::vector<Partition>> TextChunker::chunk(std::string_view text, TextFormat format) const {
    return chunk(std::vector<TextSection>{TextSection{0, std::string(text)}}, format, false);
}

Result<std::vector<Partition>> TextChunker::chunk(const std::vector<TextSection>& sections,
                                                  TextFormat format,
                                                  bool pagesEndSentences) const {
    if (auto v = validate(); !v) {
        return v.error();
    }

    const size_t headerTokens = tokenizer_->countTokens(options_.chunk_header);
    const size_t maxParagraph = options_.max_tokens_per_paragraph;
    const size_t overlap = options_.overlap_tokens;
    const size_t adjustedMax = maxParagraph - overlap - headerTokens;

    struct Group {
        std::vector<TextLine> lines;
        size_t tokens = 0;
        int section = 0;
        bool hardStart = false;
    };
    std::vector<Group> groups;

    for (const auto& section : sections) {
        auto lines = splitToLines(section.text, format, section.number);
        bool firstOfSection = true;
        for (auto& line : lines) {
            const bool hardBoundary = pagesEndSentences && firstOfSection;
            if (groups.empty() || hardBoundary ||
                groups.back().tokens + line.tokens > adjustedMax) {
                Group g;
                g.section = line.section;
                g.hardStart = hardBoundary;
                groups.push_back(std::move(g));
            }
            groups.back().tokens += line.tokens;
            groups.back().lines.push_back(std::move(line));
            firstOfSection = false;
        }
    }

    // Fold a small trailing group into its predecessor when the result still fits
    for (size_t i = groups.size(); i-- > 1;) {
        const bool lastOfRun = (i + 1 == groups.size()) || groups[i + 1].hardStart;
        if (!lastOfRun || groups[i].hardStart || groups[i].tokens >= adjustedMax / 4)
            continue;
        const bool prevHasOverlap = i - 1 > 0 && !groups[i - 1].hardStart;
        const size_t capacity = maxParagraph - headerTokens - (prevHasOverlap ? overlap : 0);
        if (groups[i - 1].tokens + groups[i].tokens > capacity)
            continue;
        auto& prev = groups[i - 1];
        prev.tokens += groups[i].tokens;
        for (auto& line : groups[i].lines)
            prev.lines.push_back(std::move(line));
        groups.erase(groups.begin() + static_cast<std::ptrdiff_t>(i));
    }

    std::vector<Partition> partitions;
    partitions.reserve(groups.size());
    std::string previousContent;
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& g = groups[i];
        std::string body;
        for (const auto& line : g.lines) {
            if (!body.empty())
                body.push_back('\n');
            body += line.text;
        }

        std::string content;
        if (i > 0 && !g.hardStart && overlap > 0) {
            content = lastTokens(previousContent, overlap);
            if (!content.empty())
                content.push_back('\n');
        }
        content += body;

        Partition p;
        p.number = static_cast<int>(i);
        p.section_number = g.section;
        p.sentences_are_complete = g.hardStart;
        p.text = options_.chunk_header.empty() ? content : options_.chunk_header + "\n" + content;
        p.token_count = tokenizer_->countTokens(p.text);
        partitions.push_back(std::move(p));

        previousContent = std::move(content);
    }

    return partitions;
}

} // namespace docmem::chunking
