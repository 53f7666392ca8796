#include "core/shared/errors.h"

namespace ie {

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidRange:     return QStringLiteral("INVALID_RANGE");
    case ErrorCode::InvalidIndex:     return QStringLiteral("INVALID_INDEX");
    case ErrorCode::ValidationError:  return QStringLiteral("VALIDATION_ERROR");
    case ErrorCode::CardinalityError: return QStringLiteral("CARDINALITY_ERROR");
    case ErrorCode::InvalidStage:     return QStringLiteral("INVALID_STAGE");
    case ErrorCode::UnknownEntity:    return QStringLiteral("UNKNOWN_ENTITY");
    case ErrorCode::MalformedJson:    return QStringLiteral("MALFORMED_JSON");
    }
    return QStringLiteral("UNKNOWN");
}

QString validationRuleToString(ValidationRule rule)
{
    switch (rule) {
    case ValidationRule::None:             return QString();
    case ValidationRule::WrongElementType: return QStringLiteral("wrong-element-type");
    case ValidationRule::NotSorted:        return QStringLiteral("not-sorted");
    case ValidationRule::HasDuplicates:    return QStringLiteral("has-duplicates");
    case ValidationRule::BadEndpoints:     return QStringLiteral("bad-endpoints");
    }
    return QString();
}

void reportError(Error* errorOut, ErrorCode code, const QString& message,
                 ValidationRule rule)
{
    if (!errorOut) {
        return;
    }
    errorOut->code = code;
    errorOut->rule = rule;
    errorOut->message = message;
}

} // namespace ie
