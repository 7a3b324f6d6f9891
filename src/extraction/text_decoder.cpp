// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <docmem/extraction/content_decoder.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace docmem::extraction {

namespace {

bool isValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= s.size())
            return false;
        for (size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

bool TextDecoder::supportsMimeType(std::string_view mimeType) const {
    return mimeType == kMimePlainText || mimeType == kMimeMarkdown || mimeType == kMimeJson;
}

Result<ExtractedContent> TextDecoder::decode(std::string_view data,
                                             std::string_view mimeType) const {
    if (!supportsMimeType(mimeType)) {
        return Error{ErrorCode::NotSupported,
                     "Unsupported content type: " + std::string(mimeType)};
    }
    if (!isValidUtf8(data)) {
        return Error{ErrorCode::InvalidData, "Content is not valid UTF-8 text"};
    }

    ExtractedContent content;
    content.mime_type = std::string(mimeType);

    int page = 0;
    size_t start = 0;
    while (start <= data.size()) {
        size_t end = data.find('\f', start);
        if (end == std::string_view::npos)
            end = data.size();
        content.sections.push_back(
            ExtractedSection{page++, std::string(data.substr(start, end - start))});
        start = end + 1;
    }
    return content;
}

void DecoderRegistry::add(std::shared_ptr<IContentDecoder> decoder) {
    decoders_.push_back(std::move(decoder));
}

std::shared_ptr<IContentDecoder> DecoderRegistry::find(std::string_view mimeType) const {
    for (const auto& decoder : decoders_) {
        if (decoder->supportsMimeType(mimeType))
            return decoder;
    }
    return nullptr;
}

DecoderRegistry DecoderRegistry::withDefaults() {
    DecoderRegistry registry;
    registry.add(std::make_shared<TextDecoder>());
    return registry;
}

std::string mimeTypeFromFileName(const std::filesystem::path& fileName) {
    static const std::unordered_map<std::string, std::string> kByExtension = {
        {".txt", kMimePlainText}, {".text", kMimePlainText}, {".log", kMimePlainText},
        {".md", kMimeMarkdown},   {".markdown", kMimeMarkdown}, {".json", kMimeJson},
        {".pdf", "application/pdf"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".html", "text/html"},   {".htm", "text/html"},
    };
    auto ext = fileName.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kByExtension.find(ext);
    return it == kByExtension.end() ? std::string{} : it->second;
}

} // namespace docmem::extraction
