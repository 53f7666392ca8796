#include "core/document/preprocess_state.h"
#include "core/shared/logging.h"

#include <QMetaType>

namespace ie {

namespace {

bool isIntegral(const QVariant& value)
{
    switch (value.metaType().id()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Short:
    case QMetaType::UShort:
        return true;
    default:
        return false;
    }
}

QStringList toStringList(const PreprocessResult& result)
{
    QStringList out;
    out.reserve(result.size());
    for (const QVariant& value : result) {
        out.append(value.toString());
    }
    return out;
}

PreprocessResult fromStringList(const QStringList& list)
{
    PreprocessResult out;
    out.reserve(list.size());
    for (const QString& value : list) {
        out.append(value);
    }
    return out;
}

PreprocessResult fromIntVector(const std::vector<int>& values)
{
    PreprocessResult out;
    out.reserve(static_cast<qsizetype>(values.size()));
    for (int value : values) {
        out.append(value);
    }
    return out;
}

} // anonymous namespace

// ── Public API ──────────────────────────────────────────────

Document* PreprocessState::setResult(Document& document,
                                     PreprocessStage stage,
                                     const PreprocessResult& result,
                                     Error* errorOut)
{
    switch (stage) {
    case PreprocessStage::Tokenization:
        document.tokens = toStringList(result);
        break;

    case PreprocessStage::Segmentation: {
        if (!validateSegmentation(document, result, errorOut)) {
            return nullptr;
        }
        std::vector<int> sentences;
        sentences.reserve(static_cast<size_t>(result.size()));
        for (const QVariant& value : result) {
            sentences.push_back(static_cast<int>(value.toLongLong()));
        }
        document.sentences = std::move(sentences);
        break;
    }

    case PreprocessStage::Tagging:
        if (result.size() != document.tokens.size()) {
            const QString message = QStringLiteral(
                "Tagging result must have the same cardinality as tokens (%1 tags, %2 tokens)")
                .arg(result.size()).arg(document.tokens.size());
            LOG_WARN(iePreprocess, "%s: %s",
                     qUtf8Printable(document.humanIdentifier), qUtf8Printable(message));
            reportError(errorOut, ErrorCode::CardinalityError, message);
            return nullptr;
        }
        document.postags = toStringList(result);
        break;

    case PreprocessStage::Nerc:
        break;

    default: {
        const QString message = QStringLiteral("Unknown preprocess stage %1")
            .arg(static_cast<int>(stage));
        LOG_WARN(iePreprocess, "%s", qUtf8Printable(message));
        reportError(errorOut, ErrorCode::InvalidStage, message);
        return nullptr;
    }
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    document.preprocessMetadata.doneAt.insert(preprocessStageToString(stage), now);

    LOG_DEBUG(iePreprocess, "%s: %s done (%d items)",
              qUtf8Printable(document.humanIdentifier),
              qUtf8Printable(preprocessStageToString(stage)),
              static_cast<int>(result.size()));

    return &document;
}

std::optional<PreprocessResult> PreprocessState::getResult(const Document& document,
                                                           PreprocessStage stage)
{
    if (!wasDone(document, stage)) {
        return std::nullopt;
    }

    switch (stage) {
    case PreprocessStage::Tokenization: return fromStringList(document.tokens);
    case PreprocessStage::Segmentation: return fromIntVector(document.sentences);
    case PreprocessStage::Tagging:      return fromStringList(document.postags);
    case PreprocessStage::Nerc:         return PreprocessResult{};
    }
    return std::nullopt;
}

bool PreprocessState::wasDone(const Document& document, PreprocessStage stage)
{
    const QString name = preprocessStageToString(stage);
    if (name.isEmpty()) {
        return false;
    }
    return document.preprocessMetadata.doneAt.contains(name);
}

std::optional<QDateTime> PreprocessState::completedAt(const Document& document,
                                                      PreprocessStage stage)
{
    const auto it = document.preprocessMetadata.doneAt.constFind(
        preprocessStageToString(stage));
    if (it == document.preprocessMetadata.doneAt.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

// ── Private helpers ─────────────────────────────────────────

bool PreprocessState::validateSegmentation(const Document& document,
                                           const PreprocessResult& result,
                                           Error* errorOut)
{
    auto reject = [&](ValidationRule rule, const QString& message) {
        LOG_WARN(iePreprocess, "%s: segmentation rejected (%s): %s",
                 qUtf8Printable(document.humanIdentifier),
                 qUtf8Printable(validationRuleToString(rule)),
                 qUtf8Printable(message));
        reportError(errorOut, ErrorCode::ValidationError, message, rule);
        return false;
    };

    for (qsizetype i = 0; i < result.size(); ++i) {
        if (!isIntegral(result.at(i))) {
            return reject(ValidationRule::WrongElementType,
                          QStringLiteral("Segmentation result shall only contain integers "
                                         "(element %1 is %2)")
                              .arg(i)
                              .arg(QString::fromLatin1(result.at(i).typeName())));
        }
    }

    for (qsizetype i = 1; i < result.size(); ++i) {
        if (result.at(i).toLongLong() < result.at(i - 1).toLongLong()) {
            return reject(ValidationRule::NotSorted,
                          QStringLiteral("Segmentation result shall be ordered"));
        }
    }

    for (qsizetype i = 1; i < result.size(); ++i) {
        if (result.at(i).toLongLong() == result.at(i - 1).toLongLong()) {
            return reject(ValidationRule::HasDuplicates,
                          QStringLiteral("Segmentation result shall not contain duplicates (%1)")
                              .arg(result.at(i).toLongLong()));
        }
    }

    const qint64 tokenCount = document.tokens.size();
    if (result.isEmpty()
        || result.first().toLongLong() != 0
        || result.last().toLongLong() != tokenCount) {
        return reject(ValidationRule::BadEndpoints,
                      QStringLiteral("Segmentation result must start at 0 and end at the "
                                     "token count %1")
                          .arg(tokenCount));
    }

    return true;
}

} // namespace ie
