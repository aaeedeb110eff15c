#include <QCoreApplication>
#include <QtTest>

#include "ApplicationRegistry.h"

class TestApplicationRegistry : public QObject {
    Q_OBJECT

private slots:
    void testEmpty() {
        ApplicationRegistry registry;
        QVERIFY(registry.isEmpty());
        QCOMPARE(registry.count(), 0);
        QVERIFY(registry.names().isEmpty());
        QVERIFY(!registry.contains("Editor"));
    }

    void testDistinctNames() {
        ApplicationRegistry registry;
        registry.insert(QList<Application>({
            Application("Editor", "/a/editor.desktop", {"gedit"}, false),
            Application("Htop", "/a/htop.desktop", {"htop"}, true),
            Application("Files", "/a/files.desktop", {"nautilus", "--new-window"}, false)
        }));
        QCOMPARE(registry.count(), 3);
        QStringList names = registry.names();
        names.sort();
        QCOMPARE(names, QStringList({"Editor", "Files", "Htop"}));
        QCOMPARE(registry.body("Htop"), ApplicationBody("/a/htop.desktop", {"htop"}, true));
    }

    void testLaterInsertWins() {
        ApplicationRegistry registry;
        registry.insert(Application("Editor", "/a/editor.desktop", {"gedit"}, false));
        registry.insert(Application("Editor", "/b/editor.desktop", {"vim"}, true));
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.body("Editor").path, QString("/b/editor.desktop"));
        QCOMPARE(registry.body("Editor").exec, QStringList({"vim"}));
        QVERIFY(registry.body("Editor").terminal);
    }

    void testNamesAreCaseSensitive() {
        ApplicationRegistry registry;
        registry.insert(Application("vim", "/a/vim.desktop", {"vim"}, true));
        registry.insert(Application("Vim", "/a/gvim.desktop", {"gvim"}, false));
        QCOMPARE(registry.count(), 2);
    }
 };

QTEST_APPLESS_MAIN(TestApplicationRegistry)

#include "testApplicationRegistry.moc"
