// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmem::extraction {

// Canonical MIME types handled by the built-in decoders
inline constexpr const char* kMimePlainText = "text/plain";
inline constexpr const char* kMimeMarkdown = "text/markdown";
inline constexpr const char* kMimeJson = "application/json";

/**
 * @brief Decoded text of one page (or the whole document when unpaged)
 */
struct ExtractedSection {
    int number = 0;
    std::string text;
};

struct ExtractedContent {
    std::string mime_type;
    std::vector<ExtractedSection> sections;
    // True when page boundaries are known to end sentences
    bool pages_end_sentences = false;
};

/**
 * @brief Turns raw file bytes into text.
 *
 * Returns ErrorCode::NotSupported for content it cannot decode.
 */
class IContentDecoder {
public:
    virtual ~IContentDecoder() = default;

    virtual bool supportsMimeType(std::string_view mimeType) const = 0;
    virtual Result<ExtractedContent> decode(std::string_view data,
                                            std::string_view mimeType) const = 0;
};

/**
 * @brief Plain text, markdown and JSON pass-through decoder.
 *
 * Form feed characters separate pages.
 */
class TextDecoder : public IContentDecoder {
public:
    bool supportsMimeType(std::string_view mimeType) const override;
    Result<ExtractedContent> decode(std::string_view data,
                                    std::string_view mimeType) const override;
};

/**
 * @brief Ordered set of decoders; the first that supports a MIME type wins
 */
class DecoderRegistry {
public:
    void add(std::shared_ptr<IContentDecoder> decoder);
    std::shared_ptr<IContentDecoder> find(std::string_view mimeType) const;

    static DecoderRegistry withDefaults();

private:
    std::vector<std::shared_ptr<IContentDecoder>> decoders_;
};

/**
 * @brief Maps a file name's extension to a MIME type ("" when unknown)
 */
std::string mimeTypeFromFileName(const std::filesystem::path& fileName);

} // namespace docmem::extraction
