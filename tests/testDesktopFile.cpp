#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <QtTest>

#include "DesktopFile.h"

class TestDesktopFile : public QObject {
    Q_OBJECT

private slots:
    void testReadsKeysOfGroup() {
        DesktopFile f;
        QVERIFY(f.parse("# A comment\n"
                        "\n"
                        "[Desktop Entry]\n"
                        "Type=Application\n"
                        "Name = Text Editor \n"
                        "[Desktop Action new-window]\n"
                        "Name=New Window\n"));
        bool ok = false;
        QCOMPARE(f.value("Desktop Entry", "Name", ok), QString("Text Editor"));
        QVERIFY(ok);
        QCOMPARE(f.value("Desktop Action new-window", "Name", ok), QString("New Window"));
        QVERIFY(ok);
        QVERIFY(f.contains("Desktop Entry", "Type"));
    }

    void testMissingKeyOrGroup() {
        DesktopFile f;
        QVERIFY(f.parse("[Desktop Entry]\nName=Foo\n"));
        bool ok = true;
        QCOMPARE(f.value("Desktop Entry", "Exec", ok), QString());
        QVERIFY(!ok);
        ok = true;
        f.value("Other", "Name", ok);
        QVERIFY(!ok);
    }

    void testValuesAreKeptVerbatim() {
        DesktopFile f;
        QVERIFY(f.parse("[Desktop Entry]\n"
                        "Exec=env LANG=C sh -c \"a; b\" %U\n"
                        "Name=Foo, Bar; Baz\n"
                        "Empty=\n"));
        bool ok = false;
        QCOMPARE(f.value("Desktop Entry", "Exec", ok), QString("env LANG=C sh -c \"a; b\" %U"));
        QCOMPARE(f.value("Desktop Entry", "Name", ok), QString("Foo, Bar; Baz"));
        QCOMPARE(f.value("Desktop Entry", "Empty", ok), QString(""));
        QVERIFY(ok);
    }

    void testRepeatedKeyLaterWins() {
        DesktopFile f;
        QVERIFY(f.parse("[Desktop Entry]\nName=First\n[Other]\nX=1\n[Desktop Entry]\nName=Second\n"));
        bool ok = false;
        QCOMPARE(f.value("Desktop Entry", "Name", ok), QString("Second"));
    }

    void testHandlesCarriageReturns() {
        DesktopFile f;
        QVERIFY(f.parse("[Desktop Entry]\r\nName=Foo\r\n"));
        bool ok = false;
        QCOMPARE(f.value("Desktop Entry", "Name", ok), QString("Foo"));
    }

    void testMalformed_data() {
        QTest::addColumn<QString>("text");
        QTest::newRow("key before group") << "Name=Foo\n[Desktop Entry]\n";
        QTest::newRow("line without separator") << "[Desktop Entry]\nName Foo\n";
        QTest::newRow("unterminated header") << "[Desktop Entry\nName=Foo\n";
        QTest::newRow("empty header") << "[]\nName=Foo\n";
        QTest::newRow("nested brackets") << "[Desktop [Entry]]\nName=Foo\n";
        QTest::newRow("empty key") << "[Desktop Entry]\n=Foo\n";
    }

    void testMalformed() {
        QFETCH(QString, text);
        DesktopFile f;
        QVERIFY(!f.parse(text));
        QVERIFY(!f.errorString().isEmpty());
        QVERIFY(!f.contains("Desktop Entry", "Name"));
    }

    void testLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("editor.desktop");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("[Desktop Entry]\nName=\xc3\x89" "diteur\n");
        file.close();

        DesktopFile f;
        QVERIFY(f.load(path));
        bool ok = false;
        QCOMPARE(f.value("Desktop Entry", "Name", ok), QString::fromUtf8("\xc3\x89" "diteur"));
    }

    void testLoadRejectsInvalidUtf8() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("broken.desktop");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("[Desktop Entry]\nName=\xff\xfe\n");
        file.close();

        DesktopFile f;
        QVERIFY(!f.load(path));
    }

    void testLoadRejectsTruncatedUtf8() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("truncated.desktop");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("[Desktop Entry]\nName=Caf\xc3");
        file.close();

        DesktopFile f;
        QVERIFY(!f.load(path));
        QVERIFY(!f.contains("Desktop Entry", "Name"));
    }

    void testLoadMissingFile() {
        DesktopFile f;
        QVERIFY(!f.load("/nonexistent/editor.desktop"));
        QVERIFY(!f.errorString().isEmpty());
    }
 };

QTEST_APPLESS_MAIN(TestDesktopFile)

#include "testDesktopFile.moc"
