// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <docmem/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace docmem::storage {

/**
 * @brief Document file store laid out as {root}/{index}/{documentId}/{fileName}
 */
class IFileStorage {
public:
    virtual ~IFileStorage() = default;

    virtual Result<void> createIndexDirectory(const std::string& index) = 0;
    virtual Result<void> deleteIndexDirectory(const std::string& index) = 0;
    virtual Result<void> createDocumentDirectory(const std::string& index,
                                                 const std::string& documentId) = 0;
    virtual Result<void> emptyDocumentDirectory(const std::string& index,
                                                const std::string& documentId) = 0;
    virtual Result<void> deleteDocumentDirectory(const std::string& index,
                                                 const std::string& documentId) = 0;

    /**
     * @brief Writes (or replaces) a file atomically
     */
    virtual Result<void> writeFile(const std::string& index, const std::string& documentId,
                                   const std::string& fileName, std::string_view content) = 0;
    virtual Result<std::string> readFile(const std::string& index, const std::string& documentId,
                                         const std::string& fileName) = 0;
    virtual Result<bool> fileExists(const std::string& index, const std::string& documentId,
                                    const std::string& fileName) = 0;

    /**
     * @brief Deleting a missing file succeeds
     */
    virtual Result<void> deleteFile(const std::string& index, const std::string& documentId,
                                    const std::string& fileName) = 0;
    virtual Result<std::vector<std::string>> listFiles(const std::string& index,
                                                       const std::string& documentId) = 0;
};

class DiskFileStorage : public IFileStorage {
public:
    explicit DiskFileStorage(std::filesystem::path root);

    Result<void> createIndexDirectory(const std::string& index) override;
    Result<void> deleteIndexDirectory(const std::string& index) override;
    Result<void> createDocumentDirectory(const std::string& index,
                                         const std::string& documentId) override;
    Result<void> emptyDocumentDirectory(const std::string& index,
                                        const std::string& documentId) override;
    Result<void> deleteDocumentDirectory(const std::string& index,
                                         const std::string& documentId) override;
    Result<void> writeFile(const std::string& index, const std::string& documentId,
                           const std::string& fileName, std::string_view content) override;
    Result<std::string> readFile(const std::string& index, const std::string& documentId,
                                 const std::string& fileName) override;
    Result<bool> fileExists(const std::string& index, const std::string& documentId,
                            const std::string& fileName) override;
    Result<void> deleteFile(const std::string& index, const std::string& documentId,
                            const std::string& fileName) override;
    Result<std::vector<std::string>> listFiles(const std::string& index,
                                               const std::string& documentId) override;

    const std::filesystem::path& root() const { return root_; }

private:
    Result<std::filesystem::path> resolve(const std::string& index, const std::string& documentId,
                                          const std::string& fileName = {}) const;

    std::filesystem::path root_;
};

} // namespace docmem::storage
