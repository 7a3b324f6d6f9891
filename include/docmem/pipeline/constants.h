// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#pragma once

#include <string>
#include <vector>

namespace docmem::pipeline {

// Step names
namespace steps {
inline constexpr const char* kExtract = "extract";
inline constexpr const char* kPartition = "partition";
inline constexpr const char* kGenerateEmbeddings = "gen_embeddings";
inline constexpr const char* kSaveRecords = "save_records";
inline constexpr const char* kSummarize = "summarize";
inline constexpr const char* kDeleteGeneratedFiles = "delete_generated_files";
inline constexpr const char* kDeleteDocument = "private_delete_document";
inline constexpr const char* kDeleteIndex = "private_delete_index";

inline std::vector<std::string> defaultIngestion() {
    return {kExtract, kPartition, kGenerateEmbeddings, kSaveRecords};
}
} // namespace steps

// Tags written on every memory record; user tags may not start with "__"
namespace tags {
inline constexpr const char* kReservedPrefix = "__";
inline constexpr const char* kDocumentId = "__document_id";
inline constexpr const char* kFileId = "__file_id";
inline constexpr const char* kFilePartition = "__file_part";
inline constexpr const char* kPartitionNumber = "__part_n";
inline constexpr const char* kSectionNumber = "__sect_n";
inline constexpr const char* kFileType = "__file_type";
inline constexpr const char* kExecutionId = "__exec_id";
} // namespace tags

// Memory record payload fields
namespace payload {
inline constexpr const char* kText = "text";
inline constexpr const char* kFileName = "file";
inline constexpr const char* kLastUpdate = "last_update";
inline constexpr const char* kVectorProvider = "vector_provider";
inline constexpr const char* kVectorGenerator = "vector_generator";
} // namespace payload

inline constexpr const char* kDefaultIndex = "default";

} // namespace docmem::pipeline
