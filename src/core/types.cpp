#include <persist/core/types.h>

#include <fmt/format.h>

namespace persist {

Error makeConcurrencyConflict(std::string entityKey, std::optional<int64_t> currentVersion,
                              int64_t expectedVersion) {
    std::string current = currentVersion ? std::to_string(*currentVersion) : "unknown";
    Error error{ErrorCode::ConcurrencyConflict,
                fmt::format("Version conflict on '{}': expected {}, current {}", entityKey,
                            expectedVersion, current)};
    error.entityKey = entityKey;
    error.conflict = ConflictDetail{std::move(entityKey), currentVersion, expectedVersion};
    return error;
}

Error makeEntityNotFound(std::string entityKey) {
    Error error{ErrorCode::EntityNotFound, fmt::format("Entity '{}' not found", entityKey)};
    error.entityKey = std::move(entityKey);
    return error;
}

Error makeEntityAlreadyExists(std::string entityKey) {
    Error error{ErrorCode::EntityAlreadyExists,
                fmt::format("Entity with key '{}' already exists", entityKey)};
    error.entityKey = std::move(entityKey);
    return error;
}

Error makeMappingError(std::string message) {
    return Error{ErrorCode::MappingError, std::move(message)};
}

Error makeUnsupportedExpression(std::string nodeKind, std::string detail) {
    std::string message = "Unsupported expression node: " + nodeKind;
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    return Error{ErrorCode::UnsupportedExpression, std::move(message)};
}

} // namespace persist
