#pragma once

#include <persist/core/types.h>
#include <persist/core/value.h>
#include <persist/mapping/mapping_descriptor.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace persist::provider {

/// One data file of an export; path is relative to the manifest's directory
struct ExportFileInfo {
    std::string path;
    int64_t count = 0;
};

/**
 * @brief manifest.json of an export folder
 *
 * Data files hold a JSON array of row objects keyed by column name. Blob values
 * are hex text.
 */
struct ExportManifest {
    int schemaVersion = 1;
    std::string exportTimestamp;
    std::string entityType;
    std::string tableName;
    int64_t entityCount = 0;
    bool softDeleteEnabled = false;
    std::vector<std::string> columns;
    std::vector<ExportFileInfo> dataFiles;
};

/// Written to a temporary file first and renamed into place
Result<void> writeExportManifest(const std::filesystem::path& path,
                                 const ExportManifest& manifest);

Result<ExportManifest> readExportManifest(const std::filesystem::path& path);

Result<void> writeDataFile(const std::filesystem::path& path,
                           const mapping::MappingDescriptor& descriptor,
                           const std::vector<std::vector<Value>>& rows);

/**
 * @brief Rows in descriptor column order
 *
 * Columns absent from an object read as NULL; unknown names are ignored.
 */
Result<std::vector<std::vector<Value>>> readDataFile(const std::filesystem::path& path,
                                                     const mapping::MappingDescriptor& descriptor);

} // namespace persist::provider
