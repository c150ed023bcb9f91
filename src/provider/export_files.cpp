#include <persist/provider/export_files.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <variant>

namespace persist::provider {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::string toHex(const ByteVector& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        const auto v = std::to_integer<unsigned>(b);
        out += kHexDigits[v >> 4];
        out += kHexDigits[v & 0x0f];
    }
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

Result<ByteVector> fromHex(const std::string& text) {
    if (text.size() % 2 != 0) {
        return Error{ErrorCode::SerializationError, "Odd-length hex blob"};
    }
    ByteVector out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        const int hi = hexValue(text[i]);
        const int lo = hexValue(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::SerializationError,
                         fmt::format("Invalid hex digit at offset {}", i)};
        }
        out.push_back(static_cast<std::byte>((hi << 4) | lo));
    }
    return out;
}

nlohmann::json toJson(const Value& value) {
    return std::visit(
        [](const auto& v) -> nlohmann::json {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>)
                return nullptr;
            else if constexpr (std::is_same_v<V, ByteVector>)
                return toHex(v);
            else
                return v;
        },
        value);
}

Result<Value> fromJson(const nlohmann::json& j, const mapping::ColumnDescriptor& column) {
    if (j.is_null())
        return Value{nullptr};
    if (j.is_boolean())
        return Value{int64_t{j.get<bool>() ? 1 : 0}};
    if (j.is_number_integer())
        return Value{j.get<int64_t>()};
    if (j.is_number_float())
        return Value{j.get<double>()};
    if (j.is_string()) {
        if (column.type == mapping::ColumnType::Blob) {
            auto bytes = fromHex(j.get<std::string>());
            if (!bytes)
                return bytes.error();
            return Value{std::move(bytes).value()};
        }
        return Value{j.get<std::string>()};
    }
    return Error{ErrorCode::SerializationError,
                 fmt::format("Column {} holds an unsupported JSON {}", column.columnName,
                             j.type_name())};
}

Result<nlohmann::json> readJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::InvalidArgument, "Cannot open " + path.string()};
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::SerializationError,
                     fmt::format("Failed to parse {}: {}", path.string(), e.what())};
    }
}

Result<void> writeJsonFile(const std::filesystem::path& path, const nlohmann::json& doc) {
    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::InvalidArgument, "Cannot write " + tempPath.string()};
        }
        out << doc.dump(2);
        out.close();
        if (!out) {
            return Error{ErrorCode::InternalError, "Failed writing " + tempPath.string()};
        }
    }
    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        return Error{ErrorCode::InternalError,
                     fmt::format("Cannot move {} into place: {}", path.string(), ec.message())};
    }
    return {};
}

} // namespace

Result<void> writeExportManifest(const std::filesystem::path& path,
                                 const ExportManifest& manifest) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : manifest.dataFiles)
        files.push_back({{"path", file.path}, {"count", file.count}});

    nlohmann::json doc;
    doc["schemaVersion"] = manifest.schemaVersion;
    doc["exportTimestamp"] = manifest.exportTimestamp;
    doc["entityType"] = manifest.entityType;
    doc["tableName"] = manifest.tableName;
    doc["entityCount"] = manifest.entityCount;
    doc["softDeleteEnabled"] = manifest.softDeleteEnabled;
    doc["columns"] = manifest.columns;
    doc["dataFiles"] = files;
    return writeJsonFile(path, doc);
}

Result<ExportManifest> readExportManifest(const std::filesystem::path& path) {
    auto doc = readJsonFile(path);
    if (!doc)
        return doc.error();

    const auto& j = doc.value();
    ExportManifest manifest;
    try {
        manifest.schemaVersion = j.at("schemaVersion").get<int>();
        manifest.entityType = j.at("entityType").get<std::string>();
        manifest.tableName = j.value("tableName", std::string{});
        manifest.exportTimestamp = j.value("exportTimestamp", std::string{});
        manifest.entityCount = j.value("entityCount", int64_t{0});
        manifest.softDeleteEnabled = j.value("softDeleteEnabled", false);
        manifest.columns = j.value("columns", std::vector<std::string>{});
        for (const auto& file : j.at("dataFiles")) {
            manifest.dataFiles.push_back(
                {file.at("path").get<std::string>(), file.value("count", int64_t{0})});
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     fmt::format("Invalid export manifest {}: {}", path.string(), e.what())};
    }
    if (manifest.schemaVersion != 1) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Export schema version {} is not supported",
                                 manifest.schemaVersion)};
    }
    return manifest;
}

Result<void> writeDataFile(const std::filesystem::path& path,
                           const mapping::MappingDescriptor& descriptor,
                           const std::vector<std::vector<Value>>& rows) {
    const auto& columns = descriptor.columns();
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json object = nlohmann::json::object();
        for (size_t i = 0; i < columns.size() && i < row.size(); ++i)
            object[columns[i].columnName] = toJson(row[i]);
        doc.push_back(std::move(object));
    }
    spdlog::debug("[Export] {} rows -> {}", rows.size(), path.string());
    return writeJsonFile(path, doc);
}

Result<std::vector<std::vector<Value>>> readDataFile(const std::filesystem::path& path,
                                                     const mapping::MappingDescriptor& descriptor) {
    auto doc = readJsonFile(path);
    if (!doc)
        return doc.error();
    if (!doc.value().is_array()) {
        return Error{ErrorCode::SerializationError, path.string() + " is not a JSON array"};
    }

    const auto& columns = descriptor.columns();
    std::vector<std::vector<Value>> rows;
    rows.reserve(doc.value().size());
    for (const auto& object : doc.value()) {
        if (!object.is_object()) {
            return Error{ErrorCode::SerializationError,
                         fmt::format("{}: row {} is not an object", path.string(), rows.size())};
        }
        std::vector<Value> row;
        row.reserve(columns.size());
        for (const auto& column : columns) {
            auto it = object.find(column.columnName);
            if (it == object.end()) {
                row.emplace_back(nullptr);
                continue;
            }
            auto value = fromJson(*it, column);
            if (!value) {
                auto error = value.error();
                error.message = fmt::format("{}: row {}: {}", path.string(), rows.size(),
                                            error.message);
                return error;
            }
            row.push_back(std::move(value).value());
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace persist::provider
