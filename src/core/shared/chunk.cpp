#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace ie {

bool operator==(const EntityInChunk& a, const EntityInChunk& b)
{
    return a.key == b.key
        && a.canonicalForm == b.canonicalForm
        && a.kind == b.kind
        && a.offset == b.offset
        && a.alias == b.alias;
}

bool operator!=(const EntityInChunk& a, const EntityInChunk& b)
{
    return !(a == b);
}

bool operator==(const TextChunk& a, const TextChunk& b)
{
    return a.chunkId == b.chunkId
        && a.documentId == b.documentId
        && a.text == b.text
        && a.offset == b.offset
        && a.tokens == b.tokens
        && a.postags == b.postags
        && a.entities == b.entities;
}

bool operator!=(const TextChunk& a, const TextChunk& b)
{
    return !(a == b);
}

QString computeChunkId(const QString& documentId, int tokenOffset, int tokenOffsetEnd)
{
    const QString seed = documentId + QStringLiteral("#") + QString::number(tokenOffset)
        + QStringLiteral(":") + QString::number(tokenOffsetEnd);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace ie
