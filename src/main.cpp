#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QGuiApplication>
#include <QTextStream>

#include <cstring>
#include <memory>

#include "Config.h"
#include "search/LocalSearchProvider.h"
#include "search/SearchSession.h"
#include "storage/LocalStorageProvider.h"
#include "transfer/FileOperationsController.h"
#include "transfer/TextClipboard.h"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QString absoluteDir(const QString& dir)
{
    return QDir(dir).absolutePath();
}

void printNotification(const NotificationCenter& notifications)
{
    if (auto n = notifications.current())
        out() << "[" << toString(n->status) << "] " << n->title << ": " << n->message << Qt::endl;
}

int runSearch(QCoreApplication& app, const Config& config, const QString& dir, const QString& query)
{
    LocalSearchProvider::Settings settings;
    settings.maxResults = config.searchMaxResults();
    settings.batchSize = config.searchBatchSize();
    settings.followSymlinks = config.searchFollowSymlinks();
    LocalSearchProvider provider(settings);

    SearchSession session(provider);
    session.setDebounceInterval(0);
    session.setPath(absoluteDir(dir));

    QObject::connect(&session, &SearchSession::stateChanged, &app, [&]() {
        const SearchSessionState& state = session.state();
        if (session.phase() != SearchSession::Phase::Idle || state.isSearching)
            return;

        for (const SearchResult& r : state.results) {
            out() << (r.isFile ? "f " : "d ") << r.path;
            if (r.isFile)
                out() << "  " << r.size;
            out() << Qt::endl;
        }
        out() << state.results.size() << " shown, " << state.totalMatches << " matched"
              << (state.hasMore ? " (more available)" : "") << Qt::endl;
        app.quit();
    });

    session.setQuery(query);
    return app.exec();
}

// The system clipboard needs a GUI application, everything else runs headless
bool wantsSystemClipboard(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--system-clipboard") == 0)
            return true;
    }
    return false;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    const bool systemClipboard = wantsSystemClipboard(argc, argv);
    std::unique_ptr<QCoreApplication> appHolder;
    if (systemClipboard)
        appHolder = std::make_unique<QGuiApplication>(argc, argv);
    else
        appHolder = std::make_unique<QCoreApplication>(argc, argv);
    QCoreApplication& app = *appHolder;
    QCoreApplication::setApplicationName("ferry");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "File transfer and search.\n\n"
        "Commands:\n"
        "  copy <dir> <name>...     put entries on the clipboard for copying\n"
        "  cut <dir> <name>...      put entries on the clipboard for moving\n"
        "  paste <dest>             paste the clipboard entry into dest\n"
        "  delete <dir> <name>...   delete entries\n"
        "  mkdir <dir> <name>       create a folder\n"
        "  touch <dir> <name>       create an empty file\n"
        "  rename <dir> <old> <new> rename an entry\n"
        "  search <dir> <query>     search entry names below dir");
    parser.addHelpOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "file");
    parser.addOption(configOption);
    QCommandLineOption systemClipboardOption("system-clipboard",
                                             "Use the desktop clipboard instead of the clipboard file.");
    parser.addOption(systemClipboardOption);
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    Config config;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                          : Config::defaultConfigPath();
    if (!config.load(configPath))
        out() << "Using default settings, " << configPath << " could not be parsed" << Qt::endl;

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);

    const QString command = args.first();
    const QStringList rest = args.mid(1);

    if (command == "search") {
        if (rest.size() != 2 || rest.at(1).isEmpty())
            parser.showHelp(1);
        return runSearch(app, config, rest.at(0), rest.at(1));
    }

    LocalStorageProvider::Options storageOptions;
    storageOptions.verifyCopies = config.verifyCopies();
    storageOptions.hashAlgorithm = config.hashAlgorithm().toStdString();
    storageOptions.preserveTimestamps = config.preserveTimestamps();
    LocalStorageProvider storage(storageOptions);

    std::unique_ptr<TextClipboard> textClipboard;
    if (systemClipboard)
        textClipboard = std::make_unique<QtTextClipboard>();
    else
        textClipboard = std::make_unique<FileTextClipboard>(FileTextClipboard::defaultPath());
    FileOperationsController::Settings settings;
    settings.maxConflictAttempts = config.maxConflictAttempts();
    settings.notificationDurationMs = config.notificationDurationMs();
    FileOperationsController controller(storage, textClipboard.get(), settings);

    bool ok = false;
    if ((command == "copy" || command == "cut") && rest.size() >= 2) {
        const QString dir = absoluteDir(rest.at(0));
        if (command == "copy")
            controller.copy(rest.mid(1), dir);
        else
            controller.cut(rest.mid(1), dir);
        out() << rest.size() - 1 << " item(s) on the clipboard" << Qt::endl;
        ok = true;
    } else if (command == "paste" && rest.size() == 1) {
        ok = controller.paste(absoluteDir(rest.at(0)));
        if (!ok && controller.tracker().operations().isEmpty())
            out() << "Clipboard is empty" << Qt::endl;
    } else if (command == "delete" && rest.size() >= 2) {
        ok = controller.deleteEntries(rest.mid(1), absoluteDir(rest.at(0)));
    } else if (command == "mkdir" && rest.size() == 2) {
        ok = controller.createFolder(absoluteDir(rest.at(0)), rest.at(1));
    } else if (command == "touch" && rest.size() == 2) {
        ok = controller.createFile(absoluteDir(rest.at(0)), rest.at(1));
    } else if (command == "rename" && rest.size() == 3) {
        ok = controller.renameEntry(absoluteDir(rest.at(0)), rest.at(1), rest.at(2));
    } else {
        parser.showHelp(1);
    }

    printNotification(controller.notifications());
    controller.acknowledge();
    return ok ? 0 : 1;
}
