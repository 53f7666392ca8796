#pragma once

namespace ie {

struct Settings {
    // Chunk planning
    int sentencesPerChunk = 1;
    int overlapSentences = 0;
    int maxTokensPerChunk = 0;        // 0 = unlimited
    bool requireSegmentation = false;
};

} // namespace ie
