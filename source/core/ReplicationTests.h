#ifndef REPLICATIONTESTS_H
#define REPLICATIONTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QRegularExpression>
#include <QJsonArray>
#include <variant>
#include "InkDocument.h"
#include "InkOperation.h"
#include "LocalSequencer.h"

/**
 * Tests for operation encoding and for replicas kept in sync through a
 * LocalSequencer.
 * Run with: speedyink --test-replication
 */
class ReplicationTests : public QObject {
    Q_OBJECT

    static InkSettings canvas() {
        InkSettings settings;
        settings.canvasWidth = 2000;
        settings.canvasHeight = 2000;
        settings.regionCapacity = 8;
        return settings;
    }

    static int totalPoints(const InkDocument& doc) {
        int total = 0;
        for (const InkStroke* stroke : doc.strokes()) {
            total += stroke->points.size();
        }
        return total;
    }

    // Replicas may list strokes in different creation order; content must match
    static bool sameContent(const InkDocument& x, const InkDocument& y) {
        if (x.strokeCount() != y.strokeCount()) {
            return false;
        }
        for (const InkStroke* stroke : x.strokes()) {
            const InkStroke* other = y.stroke(stroke->id);
            if (!other || !(*stroke == *other)) {
                return false;
            }
        }
        return x.strokeIndex().pointCount() == y.strokeIndex().pointCount();
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<ClearOperation>();
        qRegisterMetaType<CreateStrokeOperation>();
        qRegisterMetaType<StylusOperation>();
        qRegisterMetaType<EraseStrokesOperation>();
    }

    // ===== Operation encoding =====

    void testOperationJson() {
        CreateStrokeOperation create;
        create.time = 1700000000123;
        create.id = "6f1c2a9e-0000-4000-8000-000000000001";
        create.pen.color = QColor(10, 20, 30, 128);
        create.pen.thickness = 6;

        const QJsonObject json = operationToJson(create);
        QCOMPARE(json["type"].toString(), QString("createStroke"));

        const auto decoded = operationFromJson(json);
        QVERIFY(decoded.has_value());
        const auto* back = std::get_if<CreateStrokeOperation>(&*decoded);
        QVERIFY(back != nullptr);
        QCOMPARE(back->time, create.time);
        QCOMPARE(back->id, create.id);
        QCOMPARE(back->pen.thickness, 6.0);
        QCOMPARE(back->pen.color.rgb(), create.pen.color.rgb());

        StylusOperation stylus;
        stylus.id = create.id;
        stylus.point = InkPoint(12.5, 99, 42, 0.25);
        const auto stylusBack = operationFromJson(operationToJson(stylus));
        QVERIFY(stylusBack.has_value());
        QCOMPARE(operationType(*stylusBack), QString("stylus"));
        QVERIFY(std::get<StylusOperation>(*stylusBack).point == stylus.point);

        EraseStrokesOperation erase;
        erase.ids = QStringList({"a", "b"});
        QCOMPARE(std::get<EraseStrokesOperation>(*operationFromJson(operationToJson(erase))).ids, erase.ids);
    }

    void testMalformedOperationsAreRejected() {
        QJsonObject unknown;
        unknown["type"] = "rotate";
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("unknown operation type"));
        QVERIFY(!operationFromJson(unknown).has_value());

        QJsonObject noId;
        noId["type"] = "stylus";
        noId["point"] = InkPoint(1, 1).toJson();
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("stylus without stroke id"));
        QVERIFY(!operationFromJson(noId).has_value());
    }

    // ===== Sequencing =====

    void testLocalOperationsApplyImmediately() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        const QString id = a.createStroke(Pen())->id;
        a.appendPointToStroke(InkPoint(10, 10), id);
        a.appendPointToStroke(InkPoint(20, 15), id);

        // Visible on the issuing replica before anything is sequenced
        QCOMPARE(a.stroke(id)->points.size(), 2);
        QVERIFY(b.stroke(id) == nullptr);
        QCOMPARE(a.pendingLocalCount(), 3);
        QCOMPARE(sequencer.pendingCount(), 3);

        QCOMPARE(sequencer.deliverAll(), 3);

        // Delivered once to the remote replica, not re-applied locally
        QCOMPARE(a.stroke(id)->points.size(), 2);
        QCOMPARE(b.stroke(id)->points.size(), 2);
        QCOMPARE(a.pendingLocalCount(), 0);
        QCOMPARE(a.sequencedCount(), qint64(3));
        QCOMPARE(b.sequencedCount(), qint64(3));
        QCOMPARE(a.strokeIndex().pointCount(), 2);
        QCOMPARE(b.strokeIndex().pointCount(), 2);
    }

    void testOperationsIssuedFromSlotsKeepOrder() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        // Start every new local stroke with a point, from inside the signal
        connect(&a, &InkDocument::strokeCreated, this, [&a](const CreateStrokeOperation& op) {
            a.appendPointToStroke(InkPoint(40, 40), op.id);
        });

        const QString id = a.createStroke(Pen())->id;
        QCOMPARE(a.stroke(id)->points.size(), 1);
        QCOMPARE(sequencer.pendingCount(), 2);

        sequencer.deliverAll();

        QCOMPARE(sequencer.journal().size(), 2);
        QVERIFY(std::holds_alternative<CreateStrokeOperation>(sequencer.journal().at(0).op));
        QVERIFY(std::holds_alternative<StylusOperation>(sequencer.journal().at(1).op));
        QVERIFY(b.stroke(id) != nullptr);
        QCOMPARE(b.stroke(id)->points.size(), 1);
        QVERIFY(sameContent(a, b));
        QCOMPARE(a.pendingLocalCount(), 0);
    }

    void testRemoteOperationsEmitSignals() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        QSignalSpy created(&b, &InkDocument::strokeCreated);
        QSignalSpy stylus(&b, &InkDocument::stylus);
        QSignalSpy localStylus(&a, &InkDocument::stylus);

        const QString id = a.createStroke(Pen())->id;
        a.appendPointToStroke(InkPoint(5, 5), id);
        QCOMPARE(localStylus.count(), 1);
        QCOMPARE(stylus.count(), 0);

        sequencer.deliverAll();
        QCOMPARE(created.count(), 1);
        QCOMPARE(stylus.count(), 1);
        QCOMPARE(stylus.at(0).at(0).value<StylusOperation>().point.pos, QPointF(5, 5));
        QCOMPARE(localStylus.count(), 1);
    }

    void testInterleavedReplicasConverge() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        InkDocument c(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);
        sequencer.connectReplica(&c);

        const QString sa = a.createStroke(Pen())->id;
        const QString sb = b.createStroke(Pen())->id;
        for (int i = 0; i < 40; ++i) {
            a.appendPointToStroke(InkPoint(100 + i * 20, 100 + i * 3, i), sa);
            b.appendPointToStroke(InkPoint(1900 - i * 15, 400 + i * 30, i), sb);
            if (i % 10 == 5) {
                sequencer.deliverNext();
            }
        }
        b.eraseStrokes({sa});
        sequencer.deliverAll();

        // Same-origin order keeps every create ahead of its points
        QCOMPARE(totalPoints(a), 80);
        QCOMPARE(totalPoints(c), 80);
        QVERIFY(sameContent(a, b));
        QVERIFY(sameContent(b, c));
        QVERIFY(c.stroke(sa)->inactive);

        QVector<Rectangle> ra, rc;
        a.gatherViewportRects(Rectangle(0, 0, 2000, 2000), ra);
        c.gatherViewportRects(Rectangle(0, 0, 2000, 2000), rc);
        QCOMPARE(ra, rc);
    }

    void testClearWinsOverConcurrentAppend() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        const QString id = a.createStroke(Pen())->id;
        a.appendPointToStroke(InkPoint(50, 50), id);
        sequencer.deliverAll();

        // b's clear is sequenced before a's append
        b.clear();
        QVERIFY(a.appendPointToStroke(InkPoint(60, 60), id) != nullptr);
        sequencer.deliverAll();

        QCOMPARE(a.strokeCount(), 0);
        QCOMPARE(b.strokeCount(), 0);
        QCOMPARE(a.strokeIndex().pointCount(), 0);
        QCOMPARE(b.strokeIndex().pointCount(), 0);
        QCOMPARE(a.snapshot(), b.snapshot());
    }

    void testAppendAfterClearIsNoOpEverywhere() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        const QString id = a.createStroke(Pen())->id;
        sequencer.deliverAll();

        // a's append is sequenced first, then b's clear
        a.appendPointToStroke(InkPoint(70, 70), id);
        b.clear();
        sequencer.deliverAll();

        QCOMPARE(a.strokeCount(), 0);
        QCOMPARE(b.strokeCount(), 0);
        QCOMPARE(a.snapshot(), b.snapshot());
    }

    void testInjectedOperationsAreRemoteEverywhere() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        CreateStrokeOperation create;
        create.id = "injected";
        StylusOperation stylus;
        stylus.id = "injected";
        stylus.point = InkPoint(3, 4);
        sequencer.inject(create);
        sequencer.inject(stylus);

        QVERIFY(a.stroke("injected") == nullptr);
        QCOMPARE(sequencer.deliverAll(), 2);
        QCOMPARE(a.stroke("injected")->points.size(), 1);
        QCOMPARE(b.stroke("injected")->points.size(), 1);
        QCOMPARE(a.pendingLocalCount(), 0);
        QCOMPARE(sequencer.sequenceNumber(), qint64(2));
    }

    void testJournalReplayReproducesState() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        const QString s1 = a.createStroke(Pen())->id;
        const QString s2 = b.createStroke(Pen())->id;
        for (int i = 0; i < 25; ++i) {
            a.appendPointToStroke(InkPoint(i * 70.0, 500 + i), s1);
            b.appendPointToStroke(InkPoint(1000 + i, i * 70.0), s2);
        }
        a.eraseAt(QPointF(0, 495));
        sequencer.deliverAll();

        QCOMPARE(sequencer.journal().size(), 53);
        QCOMPARE(sequencer.journal().first().sequenceNumber, qint64(1));
        QVERIFY(sequencer.journal().first().origin == &a);

        // A late joiner replays the journal and lands in the same state
        InkDocument late(canvas());
        sequencer.replayJournal(late);
        QCOMPARE(late.snapshot(), a.snapshot());
        QVERIFY(sameContent(late, b));
        QVERIFY(late.stroke(s1)->inactive);
    }

    void testDisconnectedReplicaStopsReceiving() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);

        sequencer.disconnectReplica(&b);
        QVERIFY(b.channel() == nullptr);

        a.createStroke(Pen());
        sequencer.deliverAll();
        QCOMPARE(a.strokeCount(), 1);
        QCOMPARE(b.strokeCount(), 0);

        // Without a channel nothing is left pending
        b.createStroke(Pen());
        QCOMPARE(b.pendingLocalCount(), 0);
        QCOMPARE(sequencer.pendingCount(), 0);
    }

    void testDisconnectDuringDeliverySkipsReplica() {
        LocalSequencer sequencer;
        InkDocument a(canvas());
        InkDocument b(canvas());
        InkDocument c(canvas());
        sequencer.connectReplica(&a);
        sequencer.connectReplica(&b);
        sequencer.connectReplica(&c);

        // b is delivered to before c; its slot drops c mid-entry
        connect(&b, &InkDocument::strokeCreated, this, [&sequencer, &c](const CreateStrokeOperation&) {
            sequencer.disconnectReplica(&c);
        });

        a.createStroke(Pen());
        QCOMPARE(sequencer.deliverAll(), 1);

        QCOMPARE(a.strokeCount(), 1);
        QCOMPARE(b.strokeCount(), 1);
        QCOMPARE(c.strokeCount(), 0);
        QCOMPARE(c.sequencedCount(), qint64(0));
        QVERIFY(c.channel() == nullptr);
    }

    void testSequencerDetachesOnDestruction() {
        InkDocument a(canvas());
        {
            LocalSequencer sequencer;
            sequencer.connectReplica(&a);
            QVERIFY(a.channel() != nullptr);
        }
        QVERIFY(a.channel() == nullptr);
        a.createStroke(Pen());
        QCOMPARE(a.strokeCount(), 1);
    }
};

#endif // REPLICATIONTESTS_H
