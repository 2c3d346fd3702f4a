#include <QtTest/QtTest>

#include <QSemaphore>

#include "sysscope/scan_controller.hpp"

#include <memory>
#include <stdexcept>

using sysscope::ScanController;
using sysscope::Slot;
using sysscope::SlotText;

static std::vector<SlotText> fullScan()
{
    std::vector<SlotText> results;
    for (Slot slot : sysscope::kAllSlots) {
        results.push_back({slot, sysscope::slotLabel(slot) + " text"});
    }
    return results;
}

class ScanControllerTests : public QObject
{
    Q_OBJECT
private slots:
    void testInitialState();
    void testScanFillsEverySlot();
    void testSecondStartIsIgnoredWhileRunning();
    void testSlotsClearedWhenScanStarts();
    void testFailureReportsMessage();
    void testRescanAfterFailure();
};

void ScanControllerTests::testInitialState()
{
    ScanController controller(fullScan, QStringLiteral("."));
    QCOMPARE(controller.state(), ScanController::State::Idle);
    QCOMPARE(controller.statusText(), QStringLiteral("Ready to scan"));
    for (Slot slot : sysscope::kAllSlots) {
        QVERIFY(controller.slotText(slot).isEmpty());
    }
    QCOMPARE(int(controller.sections().size()), int(sysscope::kAllSlots.size()));
}

void ScanControllerTests::testScanFillsEverySlot()
{
    ScanController controller(fullScan, QStringLiteral("."));
    QSignalSpy slotSpy(&controller, &ScanController::slotChanged);
    QSignalSpy stateSpy(&controller, &ScanController::stateChanged);

    QVERIFY(controller.startScan());
    QCOMPARE(controller.state(), ScanController::State::Running);
    QCOMPARE(controller.statusText(), QStringLiteral("Scanning system..."));

    QTRY_COMPARE(controller.state(), ScanController::State::Done);
    QCOMPARE(controller.statusText(), QStringLiteral("Scan complete!"));
    QCOMPARE(slotSpy.count(), int(sysscope::kAllSlots.size()));
    QCOMPARE(stateSpy.count(), 2);

    for (Slot slot : sysscope::kAllSlots) {
        QCOMPARE(controller.slotText(slot), QString::fromStdString(sysscope::slotLabel(slot) + " text"));
    }

    const auto sections = controller.sections();
    QCOMPARE(sections.first().label, QStringLiteral("Summary"));
    QCOMPARE(sections.last().label, QStringLiteral("OS"));
}

void ScanControllerTests::testSecondStartIsIgnoredWhileRunning()
{
    auto gate = std::make_shared<QSemaphore>(0);
    auto runs = std::make_shared<QAtomicInt>(0);

    ScanController controller([gate, runs]() {
        runs->ref();
        gate->acquire();
        return fullScan();
    }, QStringLiteral("."));

    QVERIFY(controller.startScan());
    QVERIFY(!controller.startScan());
    QCOMPARE(controller.state(), ScanController::State::Running);

    gate->release();
    QTRY_COMPARE(controller.state(), ScanController::State::Done);
    QCOMPARE(runs->loadAcquire(), 1);
}

void ScanControllerTests::testSlotsClearedWhenScanStarts()
{
    auto gate = std::make_shared<QSemaphore>(1);
    ScanController controller([gate]() {
        gate->acquire();
        return fullScan();
    }, QStringLiteral("."));
    QSignalSpy clearedSpy(&controller, &ScanController::slotsCleared);

    QVERIFY(controller.startScan());
    QTRY_COMPARE(controller.state(), ScanController::State::Done);
    QVERIFY(!controller.slotText(Slot::Cpu).isEmpty());

    // Done accepts a new scan; the old text is gone before the worker runs.
    QVERIFY(controller.startScan());
    QCOMPARE(clearedSpy.count(), 2);
    for (Slot slot : sysscope::kAllSlots) {
        QVERIFY(controller.slotText(slot).isEmpty());
    }

    gate->release();
    QTRY_COMPARE(controller.state(), ScanController::State::Done);
    QVERIFY(!controller.slotText(Slot::Os).isEmpty());
}

void ScanControllerTests::testFailureReportsMessage()
{
    ScanController controller([]() -> std::vector<SlotText> {
        throw std::runtime_error("cannot enumerate devices");
    }, QStringLiteral("."));
    QSignalSpy slotSpy(&controller, &ScanController::slotChanged);

    QVERIFY(controller.startScan());
    QTRY_COMPARE(controller.state(), ScanController::State::Failed);
    QCOMPARE(controller.statusText(), QStringLiteral("Error during scan: cannot enumerate devices"));
    QCOMPARE(controller.statusTone(), QStringLiteral("error"));
    QCOMPARE(slotSpy.count(), 0);
    for (Slot slot : sysscope::kAllSlots) {
        QVERIFY(controller.slotText(slot).isEmpty());
    }
}

void ScanControllerTests::testRescanAfterFailure()
{
    auto attempts = std::make_shared<QAtomicInt>(0);
    ScanController controller([attempts]() -> std::vector<SlotText> {
        if (attempts->fetchAndAddOrdered(1) == 0) {
            throw std::runtime_error("transient");
        }
        return fullScan();
    }, QStringLiteral("."));

    QVERIFY(controller.startScan());
    QTRY_COMPARE(controller.state(), ScanController::State::Failed);

    QVERIFY(controller.startScan());
    QTRY_COMPARE(controller.state(), ScanController::State::Done);
    QCOMPARE(controller.statusText(), QStringLiteral("Scan complete!"));
    QVERIFY(!controller.slotText(Slot::Summary).isEmpty());
}

QTEST_MAIN(ScanControllerTests)
#include "test_scan_controller.moc"
