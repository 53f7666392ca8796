#include <QtTest/QtTest>
#include "core/indexing/chunk_builder.h"
#include "core/shared/chunk.h"
#include "document_fixtures.h"

using ie::test::makeDocumentWithOccurrences;
using ie::test::makeSampleDocument;

class TestChunkBuilder : public QObject {
    Q_OBJECT

private slots:
    // ── Entity projection ────────────────────────────────────────
    void testRebasesOccurrencesInsideRange()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeDocumentWithOccurrences(
            QStringLiteral("doc"), 12, {2, 5, 5, 9}, directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 3, 9, QStringLiteral("..."));
        QVERIFY(chunk.has_value());

        QCOMPARE(static_cast<int>(chunk->entities.size()), 2);
        QCOMPARE(chunk->entities[0].offset, 2);
        QCOMPARE(chunk->entities[1].offset, 2);
        QCOMPARE(chunk->entities[0].key, QStringLiteral("e5"));
    }

    void testWholeDocumentKeepsOriginalOffsets()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 0, doc.tokenCount(), doc.text);
        QVERIFY(chunk.has_value());

        QCOMPARE(chunk->entities.size(), doc.entities.size());
        for (size_t i = 0; i < doc.entities.size(); ++i) {
            QCOMPARE(chunk->entities[i].offset, doc.entities[i].offset);
            QCOMPARE(chunk->entities[i].key, doc.entities[i].entityKey);
        }
        QCOMPARE(chunk->tokens, doc.tokens);
        QCOMPARE(chunk->postags, doc.postags);
    }

    void testCarriesEntityDataAndAlias()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 6, 10, QStringLiteral("ACME hired Alice."));
        QVERIFY(chunk.has_value());
        QCOMPARE(static_cast<int>(chunk->entities.size()), 2);

        const ie::EntityInChunk& acme = chunk->entities[0];
        QCOMPARE(acme.key, QStringLiteral("acme"));
        QCOMPARE(acme.canonicalForm, QStringLiteral("ACME Corporation"));
        QCOMPARE(acme.kind, ie::EntityKind::Organization);
        QCOMPARE(acme.offset, 0);
        QVERIFY(acme.alias.has_value());
        QCOMPARE(*acme.alias, QStringLiteral("ACME"));

        const ie::EntityInChunk& alice = chunk->entities[1];
        QCOMPARE(alice.key, QStringLiteral("alice"));
        QCOMPARE(alice.kind, ie::EntityKind::Person);
        QCOMPARE(alice.offset, 2);
    }

    void testMissingAliasStaysAbsent()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 10, 14, QStringLiteral("Bob left Paris."));
        QVERIFY(chunk.has_value());
        QCOMPARE(static_cast<int>(chunk->entities.size()), 2);
        QCOMPARE(chunk->entities[1].key, QStringLiteral("paris"));
        QVERIFY(!chunk->entities[1].alias.has_value());
    }

    void testExcludesOccurrenceAtRangeEnd()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeDocumentWithOccurrences(
            QStringLiteral("doc"), 10, {0, 4, 5}, directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 0, 4, QString());
        QVERIFY(chunk.has_value());
        QCOMPARE(static_cast<int>(chunk->entities.size()), 1);
        QCOMPARE(chunk->entities[0].key, QStringLiteral("e0"));
    }

    void testPreservesSourceOrderOfEqualOffsets()
    {
        ie::InMemoryEntityDirectory directory;
        directory.insert({QStringLiteral("x"), QStringLiteral("X"), ie::EntityKind::Person});
        directory.insert({QStringLiteral("y"), QStringLiteral("Y"), ie::EntityKind::Location});

        ie::Document doc = ie::test::makeTokenizedDocument(QStringLiteral("doc"), 6);
        doc.entities = {
            {QStringLiteral("y"), 3, std::nullopt},
            {QStringLiteral("x"), 3, std::nullopt},
            {QStringLiteral("y"), 3, QStringLiteral("why")},
        };

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 2, 5, QString());
        QVERIFY(chunk.has_value());
        QCOMPARE(static_cast<int>(chunk->entities.size()), 3);
        QCOMPARE(chunk->entities[0].key, QStringLiteral("y"));
        QCOMPARE(chunk->entities[1].key, QStringLiteral("x"));
        QCOMPARE(chunk->entities[2].key, QStringLiteral("y"));
        QCOMPARE(*chunk->entities[2].alias, QStringLiteral("why"));
    }

    // ── Token and tag slices ─────────────────────────────────────
    void testSlicesTokensAndTags()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 2, 5, QStringLiteral("Bob in Paris"));
        QVERIFY(chunk.has_value());
        QCOMPARE(chunk->tokens, QStringList({QStringLiteral("Bob"), QStringLiteral("in"),
                                             QStringLiteral("Paris")}));
        QCOMPARE(chunk->postags, QStringList({QStringLiteral("NNP"), QStringLiteral("IN"),
                                              QStringLiteral("NNP")}));
        QCOMPARE(chunk->offset, 2);
        QCOMPARE(chunk->tokenOffsetEnd(), 5);
        QCOMPARE(chunk->text, QStringLiteral("Bob in Paris"));
        QCOMPARE(chunk->documentId, QStringLiteral("sample-1"));
    }

    void testUntaggedDocumentYieldsEmptyTags()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = ie::test::makeTokenizedDocument(QStringLiteral("doc"), 5);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 1, 4, QString());
        QVERIFY(chunk.has_value());
        QCOMPARE(chunk->tokens.size(), qsizetype(3));
        QVERIFY(chunk->postags.isEmpty());
    }

    void testEmptyRangeIsValid()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        const auto chunk = builder.build(doc, 4, 4, QString());
        QVERIFY(chunk.has_value());
        QVERIFY(chunk->tokens.isEmpty());
        QVERIFY(chunk->entities.empty());
    }

    void testChunkOwnsItsData()
    {
        ie::InMemoryEntityDirectory directory;
        std::optional<ie::TextChunk> chunk;
        {
            const ie::Document doc = makeSampleDocument(directory);
            ie::ChunkBuilder builder(directory);
            chunk = builder.build(doc, 0, 6, QStringLiteral("Alice met Bob in Paris."));
        }
        QVERIFY(chunk.has_value());
        QCOMPARE(chunk->tokens.first(), QStringLiteral("Alice"));
        QCOMPARE(static_cast<int>(chunk->entities.size()), 3);
    }

    // ── Determinism ──────────────────────────────────────────────
    void testSameRangeTwiceIsIdentical()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        const auto first = builder.build(doc, 3, 11, QStringLiteral("t"));
        const auto second = builder.build(doc, 3, 11, QStringLiteral("t"));
        QVERIFY(first.has_value());
        QVERIFY(second.has_value());
        QVERIFY(*first == *second);
        QCOMPARE(first->chunkId, ie::computeChunkId(QStringLiteral("sample-1"), 3, 11));
    }

    void testChunkIdsDifferForDifferentRanges()
    {
        QVERIFY(ie::computeChunkId(QStringLiteral("d"), 0, 5)
                != ie::computeChunkId(QStringLiteral("d"), 0, 6));
        QVERIFY(ie::computeChunkId(QStringLiteral("d"), 0, 5)
                != ie::computeChunkId(QStringLiteral("e"), 0, 5));
        QCOMPARE(ie::computeChunkId(QStringLiteral("d"), 0, 5).size(), qsizetype(64));
    }

    // ── Errors ───────────────────────────────────────────────────
    void testRangePastEndIsInvalidRange()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        ie::Error error;
        QVERIFY(!builder.build(doc, 0, doc.tokenCount() + 1, QString(), &error).has_value());
        QCOMPARE(error.code, ie::ErrorCode::InvalidRange);
    }

    void testReversedRangeIsInvalidRange()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        ie::Error error;
        QVERIFY(!builder.build(doc, 5, 3, QString(), &error).has_value());
        QCOMPARE(error.code, ie::ErrorCode::InvalidRange);
    }

    void testNegativeOffsetIsInvalidRange()
    {
        ie::InMemoryEntityDirectory directory;
        const ie::Document doc = makeSampleDocument(directory);

        ie::ChunkBuilder builder(directory);
        ie::Error error;
        QVERIFY(!builder.build(doc, -1, 3, QString(), &error).has_value());
        QCOMPARE(error.code, ie::ErrorCode::InvalidRange);
    }

    void testUnknownEntityFailsBuild()
    {
        ie::InMemoryEntityDirectory directory;
        ie::Document doc = makeSampleDocument(directory);
        directory.remove(QStringLiteral("paris"));

        ie::ChunkBuilder builder(directory);
        ie::Error error;
        QVERIFY(!builder.build(doc, 0, 6, QString(), &error).has_value());
        QCOMPARE(error.code, ie::ErrorCode::UnknownEntity);
        QVERIFY(error.message.contains(QStringLiteral("paris")));

        // Ranges that do not touch the missing entity still build
        QVERIFY(builder.build(doc, 6, 10, QString()).has_value());
    }
};

QTEST_MAIN(TestChunkBuilder)
#include "test_chunk_builder.moc"
