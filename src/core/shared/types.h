#pragma once

#include <QString>

#include <optional>

namespace ie {

// Kind of a canonical entity. The set is closed.
enum class EntityKind {
    Person,
    Location,
    Organization,
};

QString entityKindToString(EntityKind kind);
QString entityKindLabel(EntityKind kind);
std::optional<EntityKind> entityKindFromString(const QString& str);

// Preprocessing pipeline stages, in their usual execution order.
// Nothing here enforces that order.
enum class PreprocessStage {
    Tokenization = 1,
    Segmentation = 2,
    Tagging      = 3,
    Nerc         = 4,
};

QString preprocessStageToString(PreprocessStage stage);
std::optional<PreprocessStage> preprocessStageFromString(const QString& str);

} // namespace ie
