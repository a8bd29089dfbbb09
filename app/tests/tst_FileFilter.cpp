#include "FileFilter.hpp"
#include "TestHelpers.hpp"

#include <QtTest>

using test_util::make_record;

class TestFileFilter : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() { test_util::quiet_logger(); }

    void accepts_everything_by_default() {
        FileFilter filter{FilterConfig()};
        QVERIFY(filter.accepts(make_record("/data/a.txt", 0)));
        QVERIFY(filter.accepts(make_record("/data/noext", 1 << 20)));
    }

    void extensions_are_case_insensitive() {
        FilterConfig config;
        config.extensions = {"JPG", ".png", "*.Gif"};
        FileFilter filter(config);

        QVERIFY(filter.accepts(make_record("/p/photo.jpg", 10)));
        QVERIFY(filter.accepts(make_record("/p/PHOTO.JPG", 10)));
        QVERIFY(filter.accepts(make_record("/p/icon.PNG", 10)));
        QVERIFY(filter.accepts(make_record("/p/anim.gif", 10)));
        QVERIFY(!filter.accepts(make_record("/p/notes.txt", 10)));
        QVERIFY(!filter.accepts(make_record("/p/jpg", 10)));
    }

    void size_bounds_are_inclusive() {
        FilterConfig config;
        config.min_size = 1024;
        config.max_size = 4096;
        FileFilter filter(config);

        QVERIFY(!filter.accepts_size(1023));
        QVERIFY(filter.accepts_size(1024));
        QVERIFY(filter.accepts_size(4096));
        QVERIFY(!filter.accepts_size(4097));
    }

    void zero_max_size_means_unbounded() {
        FilterConfig config;
        config.min_size = 1;
        FileFilter filter(config);

        QVERIFY(!filter.accepts_size(0));
        QVERIFY(filter.accepts_size(Q_INT64_C(50) * 1024 * 1024 * 1024));
    }

    void exclusion_patterns_match_name_or_path() {
        FilterConfig config;
        config.excluded_patterns = {"*.TMP", "*/cache/*", "Thumbs.db"};
        FileFilter filter(config);

        QVERIFY(!filter.accepts(make_record("/work/build.tmp", 5)));
        QVERIFY(!filter.accepts(make_record("/work/cache/blob.bin", 5)));
        QVERIFY(!filter.accepts(make_record("/work/photos/thumbs.db", 5)));
        QVERIFY(filter.accepts(make_record("/work/photos/holiday.jpg", 5)));
        QVERIFY(filter.accepts(make_record("/work/cachet.bin", 5)));
    }

    void hidden_and_system_flags() {
        FileRecord hidden = make_record("/d/.profile", 3);
        hidden.hidden = true;
        FileRecord system = make_record("/d/pagefile.sys", 3);
        system.system = true;

        FilterConfig config;
        config.skip_hidden = false;
        config.skip_system = false;
        QVERIFY(FileFilter(config).accepts(hidden));
        QVERIFY(FileFilter(config).accepts(system));

        config.skip_hidden = true;
        config.skip_system = true;
        QVERIFY(!FileFilter(config).accepts(hidden));
        QVERIFY(!FileFilter(config).accepts(system));
    }

    void inconsistent_bounds_fail_validation() {
        FilterConfig config;
        config.min_size = 2048;
        config.max_size = 1024;
        QString error;
        QVERIFY(!config.validate(&error));
        QVERIFY(error.contains("greater"));

        config.max_size = 0;
        QVERIFY(config.validate());

        config.min_size = -1;
        QVERIFY(!config.validate());
    }

    void normalize_extensions_deduplicates() {
        QStringList normalized = normalize_extensions({"jpg", ".JPG", "*.jpg", " ", "*", "Png"});
        QCOMPARE(normalized, QStringList({".jpg", ".png"}));
    }
};

QTEST_GUILESS_MAIN(TestFileFilter)
#include "tst_FileFilter.moc"
