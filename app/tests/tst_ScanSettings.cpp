#include "ScanSettings.hpp"
#include "TestHelpers.hpp"

#include <QSettings>
#include <QTemporaryDir>
#include <QtTest>

class TestScanSettings : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() { test_util::quiet_logger(); }

    void defaults_when_nothing_stored() {
        QTemporaryDir tmp;
        ScanSettings settings(tmp.filePath("dupescout.ini"));
        ScanRequest request = settings.load_request();

        QCOMPARE(request.algorithm, HashAlgorithm::Md5);
        QCOMPARE(request.keep_policy, KeepPolicy::Oldest);
        QCOMPARE(request.filter.min_size, qint64(0));
        QCOMPARE(request.filter.max_size, qint64(0));
        QVERIFY(request.filter.extensions.isEmpty());
        QVERIFY(request.filter.excluded_patterns.isEmpty());
        QVERIFY(!request.filter.skip_hidden);
        QVERIFY(request.filter.skip_system);
        QVERIFY(!request.verify_contents);
        QVERIFY(request.root.isEmpty());
        QCOMPARE(settings.log_level(), LogSeverity::Info);
    }

    void saved_request_is_restored() {
        QTemporaryDir tmp;
        const QString ini = tmp.filePath("dupescout.ini");

        ScanRequest saved;
        saved.root = tmp.path();
        saved.algorithm = HashAlgorithm::Sha256;
        saved.keep_policy = KeepPolicy::Newest;
        saved.verify_contents = true;
        saved.filter.min_size = 10;
        saved.filter.max_size = 5000;
        saved.filter.extensions = {".jpg", ".png"};
        saved.filter.excluded_patterns = {"*.tmp", "*/cache/*"};
        saved.filter.skip_hidden = true;
        saved.filter.skip_system = false;
        {
            ScanSettings settings(ini);
            settings.save_request(saved);
            settings.set_log_level(LogSeverity::Debug);
        }

        ScanSettings settings(ini);
        ScanRequest loaded = settings.load_request();
        QCOMPARE(loaded.root, QDir::cleanPath(tmp.path()));
        QCOMPARE(loaded.algorithm, HashAlgorithm::Sha256);
        QCOMPARE(loaded.keep_policy, KeepPolicy::Newest);
        QVERIFY(loaded.verify_contents);
        QCOMPARE(loaded.filter.min_size, qint64(10));
        QCOMPARE(loaded.filter.max_size, qint64(5000));
        QCOMPARE(loaded.filter.extensions, QStringList({".jpg", ".png"}));
        QCOMPARE(loaded.filter.excluded_patterns, QStringList({"*.tmp", "*/cache/*"}));
        QVERIFY(loaded.filter.skip_hidden);
        QVERIFY(!loaded.filter.skip_system);
        QCOMPARE(settings.log_level(), LogSeverity::Debug);
        QCOMPARE(settings.file_name(), ini);
    }

    void malformed_values_fall_back() {
        QTemporaryDir tmp;
        const QString ini = tmp.filePath("broken.ini");
        {
            QSettings raw(ini, QSettings::IniFormat);
            raw.setValue("hash_algorithm", "whirlpool");
            raw.setValue("min_size", "lots");
            raw.setValue("max_size", -3);
            raw.setValue("included_extensions", QStringList({"TXT", "*.Md", "txt"}));
            raw.setValue("log_level", "chatty");
        }

        ScanSettings settings(ini);
        ScanRequest request = settings.load_request();
        QCOMPARE(request.algorithm, HashAlgorithm::Md5);
        QCOMPARE(request.filter.min_size, qint64(0));
        QCOMPARE(request.filter.max_size, qint64(0));
        QCOMPARE(request.filter.extensions, QStringList({".txt", ".md"}));
        QCOMPARE(settings.log_level(), LogSeverity::Info);
    }

    void inconsistent_bounds_are_reset() {
        QTemporaryDir tmp;
        const QString ini = tmp.filePath("bounds.ini");
        {
            QSettings raw(ini, QSettings::IniFormat);
            raw.setValue("min_size", 900);
            raw.setValue("max_size", 100);
        }
        ScanRequest request = ScanSettings(ini).load_request();
        QCOMPARE(request.filter.min_size, qint64(0));
        QCOMPARE(request.filter.max_size, qint64(0));
        QVERIFY(request.filter.validate());
    }

    void last_directory_round_trip() {
        QTemporaryDir tmp;
        ScanSettings settings(tmp.filePath("dirs.ini"));
        QVERIFY(settings.last_directory().isEmpty());
        settings.set_last_directory(tmp.path() + "/sub/../");
        QCOMPARE(settings.last_directory(), QDir::cleanPath(tmp.path()));
    }

    void request_validation() {
        QTemporaryDir tmp;
        ScanRequest request;
        QString error;
        QVERIFY(!request.validate(&error));

        request.root = tmp.filePath("missing");
        QVERIFY(!request.validate(&error));
        QVERIFY(error.contains("does not exist"));

        QFile file(tmp.filePath("plain"));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();
        request.root = file.fileName();
        QVERIFY(!request.validate(&error));

        request.root = tmp.path();
        QVERIFY(request.validate(&error));
    }
};

QTEST_GUILESS_MAIN(TestScanSettings)
#include "tst_ScanSettings.moc"
