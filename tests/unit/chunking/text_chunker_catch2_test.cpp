// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <docmem/chunking/text_chunker.h>

#include <string>
#include <vector>

using namespace docmem;
using namespace docmem::chunking;
using docmem::test::make_words;

namespace {

// count lines of wordsPerLine words, numbered continuously across lines
std::string numberedLines(size_t count, size_t wordsPerLine) {
    std::string text;
    for (size_t line = 0; line < count; ++line) {
        if (line > 0)
            text += '\n';
        for (size_t w = 0; w < wordsPerLine; ++w) {
            if (w > 0)
                text += ' ';
            text += "w" + std::to_string(line * wordsPerLine + w);
        }
    }
    return text;
}

ChunkerOptions smallOptions() {
    ChunkerOptions options;
    options.max_tokens_per_line = 10;
    options.max_tokens_per_paragraph = 40;
    options.overlap_tokens = 5;
    return options;
}

} // namespace

TEST_CASE("TextChunker: short text is a single partition", "[unit][chunking][chunker]") {
    ChunkerOptions options;
    options.max_tokens_per_line = 300;
    options.max_tokens_per_paragraph = 2000;
    options.overlap_tokens = 30;
    TextChunker chunker(options);

    auto result = chunker.chunk(make_words(50));
    REQUIRE(result.has_value());
    REQUIRE(result.value().size() == 1);

    const auto& partition = result.value().front();
    CHECK(partition.number == 0);
    CHECK(partition.token_count == 50);
    CHECK(partition.text == make_words(50));
}

TEST_CASE("TextChunker: empty input has no partitions", "[unit][chunking][chunker]") {
    TextChunker chunker(smallOptions());

    SECTION("no text") {
        auto result = chunker.chunk("");
        REQUIRE(result.has_value());
        CHECK(result.value().size() == 0);
    }

    SECTION("only whitespace and blank lines") {
        auto result = chunker.chunk(" \n\n ");
        REQUIRE(result.has_value());
        CHECK(result.value().size() == 0);
    }

    SECTION("empty markdown sections") {
        std::vector<TextSection> sections{{0, ""}, {1, "\n\t\n"}};
        auto result = chunker.chunk(sections, TextFormat::Markdown, true);
        REQUIRE(result.has_value());
        CHECK(result.value().empty());
    }
}

TEST_CASE("TextChunker: greedy packing with overlap", "[unit][chunking][chunker]") {
    TextChunker chunker(smallOptions());

    auto result = chunker.chunk(numberedLines(10, 10));
    REQUIRE(result.has_value());
    const auto& partitions = result.value();
    REQUIRE(partitions.size() == 4);

    SECTION("first partition carries no overlap") {
        CHECK(partitions[0].text.rfind("w0 w1", 0) == 0);
        CHECK_FALSE(partitions[0].sentences_are_complete);
    }

    SECTION("later partitions start with the tail of their predecessor") {
        CHECK(partitions[1].text.rfind("w25 w26 w27 w28 w29\nw30", 0) == 0);
        CHECK(partitions[2].text.rfind("w55 w56 w57 w58 w59\nw60", 0) == 0);
        CHECK(partitions[3].text.rfind("w85 w86 w87 w88 w89\nw90", 0) == 0);
    }

    SECTION("no partition exceeds the paragraph limit") {
        for (const auto& p : partitions) {
            CHECK(p.token_count <= 40);
        }
    }

    SECTION("partitions are numbered in order") {
        for (size_t i = 0; i < partitions.size(); ++i) {
            CHECK(partitions[i].number == static_cast<int>(i));
        }
    }
}

TEST_CASE("TextChunker: small tail folds into the previous partition",
          "[unit][chunking][chunker]") {
    TextChunker chunker(smallOptions());

    auto text = numberedLines(3, 10) + "\ntail1 tail2 tail3 tail4 tail5 tail6 tail7";
    auto result = chunker.chunk(text);
    REQUIRE(result.has_value());
    REQUIRE(result.value().size() == 1);
    CHECK(result.value()[0].token_count == 37);
    CHECK(result.value()[0].text.find("tail7") != std::string::npos);
}

TEST_CASE("TextChunker: oversized lines are split near the middle", "[unit][chunking][chunker]") {
    ChunkerOptions options;
    options.max_tokens_per_line = 4;
    options.max_tokens_per_paragraph = 100;
    options.overlap_tokens = 0;
    TextChunker chunker(options);

    auto lines = chunker.splitToLines("alpha beta gamma delta. epsilon zeta eta theta iota kappa",
                                      TextFormat::PlainText);
    REQUIRE(lines.size() >= 3);

    std::string rejoined;
    for (const auto& line : lines) {
        CHECK(line.tokens <= 4);
        if (!rejoined.empty())
            rejoined += ' ';
        rejoined += line.text;
    }
    CHECK(rejoined == "alpha beta gamma delta. epsilon zeta eta theta iota kappa");
}

TEST_CASE("TextChunker: content is never dropped", "[unit][chunking][chunker]") {
    ChunkerOptions options;
    options.max_tokens_per_line = 1000;
    options.max_tokens_per_paragraph = 20;
    options.overlap_tokens = 0;
    TextChunker chunker(options);

    // One line larger than a whole partition still becomes exactly one partition
    auto result = chunker.chunk(make_words(60));
    REQUIRE(result.has_value());
    REQUIRE(result.value().size() == 1);
    CHECK(result.value()[0].token_count == 60);
}

TEST_CASE("TextChunker: page boundaries ending sentences are hard", "[unit][chunking][chunker]") {
    TextChunker chunker(smallOptions());
    std::vector<TextSection> sections{{0, "first page words here."}, {1, "second page words."}};

    SECTION("with pagesEndSentences every section starts a partition") {
        auto result = chunker.chunk(sections, TextFormat::PlainText, true);
        REQUIRE(result.has_value());
        REQUIRE(result.value().size() == 2);
        CHECK(result.value()[1].sentences_are_complete);
        CHECK(result.value()[1].section_number == 1);
        CHECK(result.value()[1].text == "second page words.");
    }

    SECTION("without it small sections share a partition") {
        auto result = chunker.chunk(sections, TextFormat::PlainText, false);
        REQUIRE(result.has_value());
        REQUIRE(result.value().size() == 1);
        CHECK(result.value()[0].text == "first page words here.\nsecond page words.");
    }
}

TEST_CASE("TextChunker: markdown blocks stay whole", "[unit][chunking][chunker][markdown]") {
    ChunkerOptions options;
    options.max_tokens_per_line = 5;
    options.max_tokens_per_paragraph = 100;
    options.overlap_tokens = 0;
    TextChunker chunker(options);

    SECTION("code fence") {
        auto lines = chunker.splitToLines("```\nint a = 1; int b = 2; return a + b;\n```",
                                          TextFormat::Markdown);
        REQUIRE(lines.size() == 1);
        CHECK(lines[0].text.rfind("```", 0) == 0);
        CHECK(lines[0].tokens > 5);
    }

    SECTION("list items") {
        auto lines = chunker.splitToLines("- one two three four five six\n- seven eight",
                                          TextFormat::Markdown);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0].text == "- one two three four five six");
        CHECK(lines[1].text == "- seven eight");
    }
}

TEST_CASE("TextChunker: chunk header prefixes every partition", "[unit][chunking][chunker]") {
    auto options = smallOptions();
    options.chunk_header = "Title: report";
    TextChunker chunker(options);

    auto result = chunker.chunk(numberedLines(6, 10));
    REQUIRE(result.has_value());
    REQUIRE(result.value().size() >= 2);
    for (const auto& partition : result.value()) {
        CHECK(partition.text.rfind("Title: report\n", 0) == 0);
        CHECK(partition.token_count <= 40);
    }
}

TEST_CASE("TextChunker: invalid limits are rejected", "[unit][chunking][chunker]") {
    ChunkerOptions options;

    SECTION("zero line limit") {
        options.max_tokens_per_line = 0;
    }
    SECTION("overlap not below paragraph limit") {
        options.max_tokens_per_paragraph = 50;
        options.overlap_tokens = 50;
    }
    SECTION("header and overlap leave no room") {
        options.max_tokens_per_paragraph = 10;
        options.overlap_tokens = 5;
        options.chunk_header = "a b c d e f";
    }

    TextChunker chunker(options);
    auto result = chunker.chunk("some text");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("TextChunker: lastTokens", "[unit][chunking][chunker]") {
    TextChunker chunker(smallOptions());
    CHECK(chunker.lastTokens("a b\nc  d e", 3) == "c d e");
    CHECK(chunker.lastTokens("a b", 5) == "a b");
    CHECK(chunker.lastTokens("a b", 0).empty());
}
