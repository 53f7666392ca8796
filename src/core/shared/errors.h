#pragma once

#include <QString>

namespace ie {

// Failure categories reported through Error* out-parameters.
enum class ErrorCode : int {
    InvalidRange     = 1,  // malformed interval or out-of-bounds token range
    InvalidIndex     = 2,  // search bounds outside the sequence
    ValidationError  = 3,  // segmentation result rejected, see ValidationRule
    CardinalityError = 4,  // tagging result length != token count
    InvalidStage     = 5,
    UnknownEntity    = 6,  // occurrence key not resolvable
    MalformedJson    = 7,
};

// Which segmentation rule a ValidationError refers to.
enum class ValidationRule : int {
    None,
    WrongElementType,
    NotSorted,
    HasDuplicates,
    BadEndpoints,
};

struct Error {
    ErrorCode code = ErrorCode::InvalidRange;
    ValidationRule rule = ValidationRule::None;
    QString message;
};

QString errorCodeToString(ErrorCode code);
QString validationRuleToString(ValidationRule rule);

// Fills *errorOut when the caller asked for it. Null is allowed.
void reportError(Error* errorOut, ErrorCode code, const QString& message,
                 ValidationRule rule = ValidationRule::None);

} // namespace ie
