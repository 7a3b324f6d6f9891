// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmem::chunking {

/**
 * @brief Source text format, selects line boundary rules
 */
enum class TextFormat {
    PlainText,
    Markdown
};

/**
 * @brief Splits text into tokens for size accounting and overlap extraction
 */
class ITokenizer {
public:
    virtual ~ITokenizer() = default;

    virtual std::vector<std::string> tokenize(std::string_view text) const = 0;

    virtual size_t countTokens(std::string_view text) const { return tokenize(text).size(); }
};

/**
 * @brief Whitespace-delimited word tokenizer
 */
class WhitespaceTokenizer : public ITokenizer {
public:
    std::vector<std::string> tokenize(std::string_view text) const override;
    size_t countTokens(std::string_view text) const override;
};

/**
 * @brief Chunker limits
 */
struct ChunkerOptions {
    size_t max_tokens_per_line = 300;
    size_t max_tokens_per_paragraph = 1000;
    size_t overlap_tokens = 100;
    std::string chunk_header; // Optional text prepended to every partition
};

/**
 * @brief One page (or other hard section) of extracted text
 */
struct TextSection {
    int number = 0;
    std::string text;
};

/**
 * @brief A sentence-respecting line produced by the first phase
 */
struct TextLine {
    std::string text;
    int section = 0;
    size_t tokens = 0;
};

/**
 * @brief A bounded, overlap-aware partition
 */
struct Partition {
    int number = 0;
    int section_number = 0;
    std::string text;
    size_t token_count = 0;
    // True when the partition starts at a hard boundary and carries no overlap prefix
    bool sentences_are_complete = false;
};

/**
 * @brief Two-phase text partitioner.
 *
 * Phase 1 breaks text into lines bounded by max_tokens_per_line, cutting
 * oversized lines at the separator nearest their midpoint. Markdown code
 * fences and list items are kept whole.
 *
 * Phase 2 packs lines greedily into partitions bounded by
 * max_tokens_per_paragraph, prefixing each partition with the last
 * overlap_tokens tokens of its predecessor. A line larger than the bound on
 * its own becomes exactly one partition; content is never dropped.
 */
class TextChunker {
public:
    explicit TextChunker(ChunkerOptions options,
                         std::shared_ptr<const ITokenizer> tokenizer = nullptr);

    /**
     * @brief Partition one block of text
     */
    Result<std::vector<Partition>> chunk(std::string_view text,
                                         TextFormat format = TextFormat::PlainText) const;

    /**
     * @brief Partition a sequence of sections (pages).
     *
     * With pagesEndSentences set, section boundaries are hard: lines of
     * different sections never share a partition and no overlap crosses them.
     */
    Result<std::vector<Partition>> chunk(const std::vector<TextSection>& sections,
                                         TextFormat format, bool pagesEndSentences) const;

    /**
     * @brief First phase only, exposed for diagnostics and tests
     */
    std::vector<TextLine> splitToLines(std::string_view text, TextFormat format,
                                       int section = 0) const;

    const ChunkerOptions& options() const { return options_; }
    const ITokenizer& tokenizer() const { return *tokenizer_; }

    /**
     * @brief Returns the trailing @p count tokens of @p text joined by single spaces
     */
    std::string lastTokens(std::string_view text, size_t count) const;

private:
    Result<void> validate() const;
    void splitRecursive(std::string_view text, const std::vector<const char*>& separators,
                        size_t separatorIndex, int section, std::vector<TextLine>& out) const;
    void appendLine(std::string_view text, TextFormat format, int section,
                    std::vector<TextLine>& out) const;

    ChunkerOptions options_;
    std::shared_ptr<const ITokenizer> tokenizer_;
};

} // namespace docmem::chunking
