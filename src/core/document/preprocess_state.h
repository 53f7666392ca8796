#pragma once

#include "core/document/document.h"
#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QVariantList>

#include <optional>

namespace ie {

// Stage output as produced by the NLP collaborators: strings for
// tokenization and tagging, integers for segmentation.
using PreprocessResult = QVariantList;

// PreprocessState -- validates and stores preprocessing stage results on a
// Document, and records when each stage completed.
//
// Stage -> field:
//   Tokenization -> tokens
//   Segmentation -> sentences
//   Tagging      -> postags
//   Nerc         -> (completion marker only)
//
// No ordering between stages is enforced. Re-running a stage replaces its
// field and its timestamp. Persisting the document is left to the caller.
class PreprocessState {
public:
    // Validate `result` for `stage` and store it. Returns &document on
    // success so a save can be chained; returns nullptr and leaves the
    // document untouched on failure.
    //
    // Segmentation failures are ValidationError with the violated rule,
    // checked in order: wrong-element-type, not-sorted, has-duplicates,
    // bad-endpoints. Tagging with a length different from the token count
    // is a CardinalityError.
    static Document* setResult(Document& document,
                               PreprocessStage stage,
                               const PreprocessResult& result,
                               Error* errorOut = nullptr);

    // Stored value of the stage's field, or nullopt if the stage never ran.
    // Never fails. Nerc yields an empty list once done.
    static std::optional<PreprocessResult> getResult(const Document& document,
                                                     PreprocessStage stage);

    static bool wasDone(const Document& document, PreprocessStage stage);
    static std::optional<QDateTime> completedAt(const Document& document,
                                                PreprocessStage stage);

private:
    static bool validateSegmentation(const Document& document,
                                     const PreprocessResult& result,
                                     Error* errorOut);
};

} // namespace ie
