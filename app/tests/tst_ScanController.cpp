#include "ScanController.hpp"
#include "TestHelpers.hpp"

#include <QSemaphore>
#include <QThread>
#include <QTemporaryDir>
#include <QtTest>

#include <memory>
#include <vector>

using test_util::write_file;

namespace {

// Parks the scan thread after enumeration until the test lets it go.
class GateObserver : public ScanObserver {
public:
    QSemaphore reached;
    QSemaphore gate;

    void on_enumeration_finished(qint64, qint64) override {
        reached.release();
        gate.acquire();
    }
};

}

class TestScanController : public QObject {
    Q_OBJECT

    QTemporaryDir tmp_;

    ScanRequest request() const {
        ScanRequest request;
        request.root = tmp_.path();
        return request;
    }

private slots:
    void initTestCase() {
        test_util::quiet_logger();
        QVERIFY(tmp_.isValid());
        QDir root(tmp_.path());
        write_file(root, "x/1.txt", "duplicate");
        write_file(root, "y/2.txt", "duplicate");
        write_file(root, "z.txt", "something else");
    }

    void completes_and_returns_to_idle() {
        ScanController controller;
        QCOMPARE(controller.state(), ControllerState::Idle);
        QVERIFY(controller.wait(0));

        QCOMPARE(controller.start(request()), StartStatus::Started);
        QVERIFY(controller.wait(10000));
        QCOMPARE(controller.state(), ControllerState::Completed);
        QCOMPARE(controller.progress().phase, ScanPhase::Finished);
        QCOMPARE(controller.progress().fraction, 1.0);

        ScanResult result;
        QVERIFY(controller.take_result(result));
        QCOMPARE(result.status, ScanStatus::Completed);
        QCOMPARE(result.groups.size(), size_t(1));
        QCOMPARE(controller.state(), ControllerState::Idle);
        QVERIFY(!controller.take_result(result));
    }

    void rejects_second_start_while_scanning() {
        ScanController controller;
        GateObserver observer;
        controller.set_observer(&observer);

        QCOMPARE(controller.start(request()), StartStatus::Started);
        QVERIFY(observer.reached.tryAcquire(1, 10000));
        QVERIFY(controller.is_running());

        QString error;
        QCOMPARE(controller.start(request(), &error), StartStatus::Busy);
        QVERIFY(!error.isEmpty());
        QCOMPARE(controller.state(), ControllerState::Scanning);

        observer.gate.release();
        QVERIFY(controller.wait(10000));
        QCOMPARE(controller.state(), ControllerState::Completed);

        // A finished scan does not block the next one
        observer.gate.release();
        QCOMPARE(controller.start(request()), StartStatus::Started);
        QVERIFY(controller.wait(10000));
        QCOMPARE(controller.state(), ControllerState::Completed);
    }

    void concurrent_starts_admit_exactly_one() {
        ScanController controller;
        GateObserver observer;
        controller.set_observer(&observer);

        static constexpr int kCallers = 6;
        QSemaphore go;
        QAtomicInt started;
        QAtomicInt busy;
        const ScanRequest shared_request = request();
        std::vector<std::unique_ptr<QThread>> callers;
        for (int i = 0; i < kCallers; ++i) {
            callers.emplace_back(QThread::create([&]() {
                go.acquire();
                StartStatus status = controller.start(shared_request);
                if (status == StartStatus::Started) started.ref();
                if (status == StartStatus::Busy) busy.ref();
            }));
            callers.back()->start();
        }
        go.release(kCallers);
        for (auto& caller : callers) {
            QVERIFY(caller->wait(10000));
        }

        // The winner is parked after enumeration, so every other call saw it
        QCOMPARE(started.loadRelaxed(), 1);
        QCOMPARE(busy.loadRelaxed(), kCallers - 1);
        QCOMPARE(controller.state(), ControllerState::Scanning);

        observer.gate.release();
        QVERIFY(controller.wait(10000));
        QCOMPARE(controller.state(), ControllerState::Completed);
    }

    void invalid_request_is_rejected_without_state_change() {
        ScanController controller;
        ScanRequest bad;
        QString error;
        QCOMPARE(controller.start(bad, &error), StartStatus::InvalidConfiguration);
        QVERIFY(!error.isEmpty());
        QCOMPARE(controller.state(), ControllerState::Idle);

        bad.root = tmp_.filePath("no-such-dir");
        QCOMPARE(controller.start(bad), StartStatus::InvalidConfiguration);

        ScanRequest inverted = request();
        inverted.filter.min_size = 100;
        inverted.filter.max_size = 10;
        QCOMPARE(controller.start(inverted), StartStatus::InvalidConfiguration);
        QCOMPARE(controller.state(), ControllerState::Idle);
    }

    void cancel_during_scan_ends_cancelled() {
        ScanController controller;
        GateObserver observer;
        controller.set_observer(&observer);

        QCOMPARE(controller.start(request()), StartStatus::Started);
        QVERIFY(observer.reached.tryAcquire(1, 10000));
        controller.cancel();
        observer.gate.release();

        QVERIFY(controller.wait(10000));
        QCOMPARE(controller.state(), ControllerState::Cancelled);
        ScanResult result;
        QVERIFY(controller.take_result(result));
        QCOMPARE(result.status, ScanStatus::Cancelled);
        QVERIFY(result.groups.empty());
        QCOMPARE(controller.state(), ControllerState::Idle);
    }

    void progress_callback_runs_on_scan_thread() {
        ScanController controller;
        QAtomicInt calls;
        controller.set_progress_callback([&calls](const ScanProgress&) { calls.ref(); });

        QCOMPARE(controller.start(request()), StartStatus::Started);
        QVERIFY(controller.wait(10000));
        QVERIFY(calls.loadRelaxed() > 0);
        QVERIFY(controller.errors_so_far().empty());
    }

    void state_names() {
        QCOMPARE(ScanController::state_name(ControllerState::Idle), QString("idle"));
        QCOMPARE(ScanController::state_name(ControllerState::Cancelled), QString("cancelled"));
    }
};

QTEST_GUILESS_MAIN(TestScanController)
#include "tst_ScanController.moc"
