#include "core/shared/types.h"

namespace ie {

QString entityKindToString(EntityKind kind)
{
    switch (kind) {
    case EntityKind::Person:       return QStringLiteral("person");
    case EntityKind::Location:     return QStringLiteral("location");
    case EntityKind::Organization: return QStringLiteral("organization");
    }
    return QStringLiteral("person");
}

QString entityKindLabel(EntityKind kind)
{
    switch (kind) {
    case EntityKind::Person:       return QStringLiteral("Person");
    case EntityKind::Location:     return QStringLiteral("Location");
    case EntityKind::Organization: return QStringLiteral("Organization");
    }
    return QStringLiteral("Person");
}

std::optional<EntityKind> entityKindFromString(const QString& str)
{
    if (str == QLatin1String("person"))       return EntityKind::Person;
    if (str == QLatin1String("location"))     return EntityKind::Location;
    if (str == QLatin1String("organization")) return EntityKind::Organization;
    return std::nullopt;
}

QString preprocessStageToString(PreprocessStage stage)
{
    switch (stage) {
    case PreprocessStage::Tokenization: return QStringLiteral("tokenization");
    case PreprocessStage::Segmentation: return QStringLiteral("segmentation");
    case PreprocessStage::Tagging:      return QStringLiteral("tagging");
    case PreprocessStage::Nerc:         return QStringLiteral("nerc");
    }
    return QString();
}

std::optional<PreprocessStage> preprocessStageFromString(const QString& str)
{
    if (str == QLatin1String("tokenization")) return PreprocessStage::Tokenization;
    if (str == QLatin1String("segmentation")) return PreprocessStage::Segmentation;
    if (str == QLatin1String("tagging"))      return PreprocessStage::Tagging;
    if (str == QLatin1String("nerc"))         return PreprocessStage::Nerc;
    return std::nullopt;
}

} // namespace ie
