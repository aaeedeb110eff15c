#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>
#include <QTextStream>

#include "AppDiscovery.h"
#include "ApplicationRegistry.h"
#include "Chooser.h"
#include "Environment.h"
#include "Launcher.h"

/*
 * Searches .desktop files and lets the user launch an application
 * using a menu program of their choice, such as dmenu, rofi -dmenu or fzf.
 *
 * Usage:
 * menulaunch [-t <terminal emulator>] <menu program> [<search directories>...]
 *
 * The names of all applications are piped into the menu program, one per line.
 * Whatever line it prints is looked up and launched. Applications with
 * Terminal=true are run as '<terminal emulator> -e <command>'.
 *
 * Exit status is 0 if the user cancelled or the application could be started,
 * 1 if the menu or the application could not be started.
 */

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("menulaunch");
    QCoreApplication::setApplicationVersion(MENULAUNCH_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Searches desktop files and lets the user launch an\n"
                                     "application using a menu of their choice, such as dmenu.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption termOption(QStringList({"t", "term"}),
                                  "Sets the terminal emulator, defaults to $TERM.",
                                  "TERMINAL EMULATOR");
    parser.addOption(termOption);
    QCommandLineOption verboseOption("verbose", "Prints debug output to stderr.");
    parser.addOption(verboseOption);

    parser.addPositionalArgument("menu", "The menu program to be used, such as dmenu.", "<MENU PROGRAM>");
    parser.addPositionalArgument("searchdirs",
                                 "The directories to be searched, defaults to\n"
                                 "/usr/share/applications and ~/.local/share/applications.",
                                 "[searchdirs...]");
    parser.process(app);

    // Keep stderr quiet unless asked; QT_LOGGING_RULES still takes precedence
    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        qCritical("missing menu program");
        parser.showHelp(1);
    }

    const QString menu = args.takeFirst();
    Environment env;

    QStringList searchDirectories = args;
    if (searchDirectories.isEmpty()) {
        bool ok = false;
        searchDirectories = AppDiscovery::wellKnownApplicationLocations(env, ok);
        if (!ok) {
            qCritical("HOME is not set, cannot locate ~/.local/share/applications");
            return 1;
        }
    }
    qDebug() << "Searching" << searchDirectories;

    const ApplicationRegistry registry = AppDiscovery::buildRegistry(searchDirectories);

    Chooser chooser(Chooser::commandFromString(menu));
    QString selection;
    switch (chooser.choose(registry.names(), selection)) {
    case Chooser::Cancelled:
        return 0;
    case Chooser::FailedToStart:
    case Chooser::UndecodableOutput:
        qCritical().noquote() << chooser.errorString();
        return 1;
    case Chooser::Selected:
        break;
    }

    QTextStream out(stdout);
    out << "chosen program: " << selection << "\n";
    out.flush();

    // Menus like dmenu also accept free text that matches no entry
    if (!registry.contains(selection)) {
        qCritical().noquote() << QString("no application named '%1'").arg(selection);
        return 1;
    }

    Launcher launcher(env);
    if (parser.isSet(termOption)) {
        launcher.setTerminalOverride(parser.value(termOption));
    }
    return launcher.launch(registry.body(selection));
}
