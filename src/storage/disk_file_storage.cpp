// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/spdlog.h>
#include <docmem/core/uuid.h>
#include <docmem/storage/file_storage.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace docmem::storage {

namespace fs = std::filesystem;

namespace {

// Path components must stay inside the storage root
bool isSafeComponent(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos;
}

Result<void> ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("[FileStorage] Failed to create directory {}: {}", dir.string(),
                      ec.message());
        return Error{ErrorCode::IOError, "Cannot create " + dir.string() + ": " + ec.message()};
    }
    return {};
}

Result<void> removeTree(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        spdlog::error("[FileStorage] Failed to remove {}: {}", dir.string(), ec.message());
        return Error{ErrorCode::IOError, "Cannot remove " + dir.string() + ": " + ec.message()};
    }
    return {};
}

} // namespace

DiskFileStorage::DiskFileStorage(fs::path root) : root_(std::move(root)) {}

Result<fs::path> DiskFileStorage::resolve(const std::string& index, const std::string& documentId,
                                          const std::string& fileName) const {
    if (!isSafeComponent(index)) {
        return Error{ErrorCode::InvalidArgument, "Invalid index name '" + index + "'"};
    }
    fs::path path = root_ / index;
    if (documentId.empty()) {
        return path;
    }
    if (!isSafeComponent(documentId)) {
        return Error{ErrorCode::InvalidArgument, "Invalid document id '" + documentId + "'"};
    }
    path /= documentId;
    if (fileName.empty()) {
        return path;
    }
    if (!isSafeComponent(fileName)) {
        return Error{ErrorCode::InvalidArgument, "Invalid file name '" + fileName + "'"};
    }
    return path / fileName;
}

Result<void> DiskFileStorage::createIndexDirectory(const std::string& index) {
    auto dir = resolve(index, {});
    if (!dir)
        return dir.error();
    return ensureDirectory(dir.value());
}

Result<void> DiskFileStorage::deleteIndexDirectory(const std::string& index) {
    auto dir = resolve(index, {});
    if (!dir)
        return dir.error();
    return removeTree(dir.value());
}

Result<void> DiskFileStorage::createDocumentDirectory(const std::string& index,
                                                      const std::string& documentId) {
    auto dir = resolve(index, documentId);
    if (!dir)
        return dir.error();
    return ensureDirectory(dir.value());
}

Result<void> DiskFileStorage::emptyDocumentDirectory(const std::string& index,
                                                     const std::string& documentId) {
    auto dir = resolve(index, documentId);
    if (!dir)
        return dir.error();
    std::error_code ec;
    if (!fs::exists(dir.value(), ec)) {
        return ensureDirectory(dir.value());
    }
    for (const auto& entry : fs::directory_iterator(dir.value(), ec)) {
        if (auto r = removeTree(entry.path()); !r)
            return r;
    }
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot list " + dir.value().string() + ": " + ec.message()};
    }
    return {};
}

Result<void> DiskFileStorage::deleteDocumentDirectory(const std::string& index,
                                                      const std::string& documentId) {
    auto dir = resolve(index, documentId);
    if (!dir)
        return dir.error();
    return removeTree(dir.value());
}

Result<void> DiskFileStorage::writeFile(const std::string& index, const std::string& documentId,
                                        const std::string& fileName, std::string_view content) {
    auto target = resolve(index, documentId, fileName);
    if (!target)
        return target.error();
    const auto& path = target.value();
    if (auto r = ensureDirectory(path.parent_path()); !r)
        return r;

    // Write to a sibling temp file, then rename over the target
    auto tempPath = path;
    tempPath += ".tmp." + core::generateUUID().substr(0, 8);
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("[FileStorage] Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::IOError, "Cannot write " + tempPath.string()};
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            file.close();
            std::error_code ignore;
            fs::remove(tempPath, ignore);
            return Error{ErrorCode::IOError, "Short write to " + tempPath.string()};
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tempPath, ignore);
        spdlog::error("[FileStorage] Failed to move {} into place: {}", path.string(),
                      ec.message());
        return Error{ErrorCode::IOError, "Cannot write " + path.string() + ": " + ec.message()};
    }
    spdlog::debug("[FileStorage] Wrote {} ({} bytes)", path.string(), content.size());
    return {};
}

Result<std::string> DiskFileStorage::readFile(const std::string& index,
                                              const std::string& documentId,
                                              const std::string& fileName) {
    auto target = resolve(index, documentId, fileName);
    if (!target)
        return target.error();
    std::ifstream file(target.value(), std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound,
                     "File not found: " + index + "/" + documentId + "/" + fileName};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::IOError, "Cannot read " + target.value().string()};
    }
    return buffer.str();
}

Result<bool> DiskFileStorage::fileExists(const std::string& index, const std::string& documentId,
                                         const std::string& fileName) {
    auto target = resolve(index, documentId, fileName);
    if (!target)
        return target.error();
    std::error_code ec;
    bool exists = fs::is_regular_file(target.value(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IOError, ec.message()};
    }
    return exists;
}

Result<void> DiskFileStorage::deleteFile(const std::string& index, const std::string& documentId,
                                         const std::string& fileName) {
    auto target = resolve(index, documentId, fileName);
    if (!target)
        return target.error();
    std::error_code ec;
    fs::remove(target.value(), ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Cannot delete " + target.value().string() + ": " + ec.message()};
    }
    return {};
}

Result<std::vector<std::string>> DiskFileStorage::listFiles(const std::string& index,
                                                            const std::string& documentId) {
    auto dir = resolve(index, documentId);
    if (!dir)
        return dir.error();
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::exists(dir.value(), ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(dir.value(), ec)) {
        if (entry.is_regular_file()) {
            names.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot list " + dir.value().string() + ": " + ec.message()};
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace docmem::storage
