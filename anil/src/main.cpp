#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QSqlDatabase>
#include "logger.h"
#include "applicationsettings.h"
#include "anilistapi.h"
#include "allanimeprovider.h"
#include "playbackcontroller.h"
#include "streamsession.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printMedia(const AniListPage &page)
{
    for (const AniListMedia &media : page.media) {
        out() << QString("%1\t%2\t%3 eps\t%4%\n")
            .arg(media.id)
            .arg(media.preferredTitle())
            .arg(media.episodes > 0 ? QString::number(media.episodes) : QString("?"))
            .arg(media.averageScore > 0 ? QString::number(media.averageScore) : QString("?"));
    }
    out().flush();
}

int listMedia(const QString &search, const QString &sort)
{
    AniListApi api;
    AniListPage page;
    QString error;
    if (!api.searchMedia(AniListApi::searchVariables(search, 20, sort), page, &error)) {
        err() << error << "\n";
        return 1;
    }
    printMedia(page);
    return 0;
}

int runPlay(ApplicationSettings &settings, const QString &title, int episode)
{
    AniListApi api;
    AniListPage page;
    QString error;
    if (!api.searchMedia(AniListApi::searchVariables(title, 20, "POPULARITY_DESC"), page, &error)) {
        err() << error << "\n";
        return 1;
    }
    if (page.media.isEmpty()) {
        err() << "No anime found for '" << title << "'\n";
        return 1;
    }

    AllAnimeProvider provider(settings.getTranslationType(), settings.getQuality());

    PlaybackController controller;
    controller.setPlayerProgram(settings.getPlayer());
    controller.setConnectAttempts(settings.playerIpc().connectAttempts);
    controller.setConnectIntervalMs(settings.playerIpc().connectIntervalMs);
    controller.setPollIntervalMs(settings.playerIpc().pollIntervalMs);

    StreamSession session(&provider, &controller, &api, settings);
    QObject::connect(&session, &StreamSession::sessionLog, [](const QString &message) {
        out() << message << "\n";
        out().flush();
    });

    SessionResult result = session.run(page.media.first(), episode);
    return result.played ? 0 : 1;
}

int runAuth(ApplicationSettings &settings, const QString &token, bool logout)
{
    if (logout) {
        settings.clearAuth();
        out() << "Logged out.\n";
        return 0;
    }
    if (token.isEmpty()) {
        err() << "Paste a token from https://anilist.co/api/v2/oauth/authorize?client_id=<id>&response_type=token\n";
        return 1;
    }

    AniListApi api;
    AniListUser user;
    QString error;
    if (!api.viewer(token, user, &error)) {
        err() << "Token verification failed: " << error << "\n";
        return 1;
    }
    settings.setAnilistToken(token);
    settings.setUsername(user.name);
    out() << "Logged in as " << user.name << "\n";
    return 0;
}

void printSettings(const ApplicationSettings &settings)
{
    out() << "player:      " << settings.getPlayer() << "\n";
    out() << "quality:     " << settings.getQuality() << "\n";
    out() << "translation: " << settings.getTranslationType() << "\n";
    out() << "complete-at: " << settings.getEpisodeCompleteAt() << "%\n";
    out() << "anilist:     " << (settings.auth().isLoggedIn() ? settings.getUsername() : QString("not logged in")) << "\n";
    out().flush();
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("anil");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Browse anime on AniList and stream episodes in mpv");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "play | search | trending | popular | auth | config");
    parser.addPositionalArgument("args", "Title to search or play, or token for auth", "[args...]");

    QCommandLineOption episodeOption(QStringList() << "e" << "episode", "Episode to start from.", "number", "1");
    QCommandLineOption logoutOption("logout", "Forget the stored AniList token.");
    QCommandLineOption playerOption("player", "Player program.", "program");
    QCommandLineOption qualityOption("quality", "Preferred quality (1080, 720, 480).", "quality");
    QCommandLineOption translationOption("translation", "sub or dub.", "type");
    QCommandLineOption completeOption("complete-at", "Watched percentage that completes an episode.", "percent");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Print log messages.");
    parser.addOptions({ episodeOption, logoutOption, playerOption, qualityOption,
                        translationOption, completeOption, verboseOption });

    parser.process(app);
    Logger::setConsoleEcho(parser.isSet(verboseOption));

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first();
    const QString rest = positional.mid(1).join(' ');

    QSqlDatabase db = ApplicationSettings::openDefaultDatabase();
    ApplicationSettings settings(db);
    settings.ensureSchema();
    settings.load();

    LOG(QString("anil %1 starting: %2").arg(app.applicationVersion(), command));

    if (command == "play") {
        if (rest.isEmpty()) {
            err() << "play needs a title\n";
            return 1;
        }
        bool ok = false;
        int episode = parser.value(episodeOption).toInt(&ok);
        if (!ok || episode < 1) {
            err() << "Invalid episode number\n";
            return 1;
        }
        return runPlay(settings, rest, episode);
    }
    if (command == "search") {
        if (rest.isEmpty()) {
            err() << "search needs a title\n";
            return 1;
        }
        return listMedia(rest, "POPULARITY_DESC");
    }
    if (command == "trending") {
        return listMedia(QString(), "TRENDING_DESC");
    }
    if (command == "popular") {
        return listMedia(QString(), "POPULARITY_DESC");
    }
    if (command == "auth") {
        return runAuth(settings, rest, parser.isSet(logoutOption));
    }
    if (command == "config") {
        if (parser.isSet(playerOption)) {
            settings.setPlayer(parser.value(playerOption));
        }
        if (parser.isSet(qualityOption)) {
            settings.setQuality(parser.value(qualityOption));
        }
        if (parser.isSet(translationOption)) {
            const QString type = parser.value(translationOption);
            if (type != "sub" && type != "dub") {
                err() << "Translation must be sub or dub\n";
                return 1;
            }
            settings.setTranslationType(type);
        }
        if (parser.isSet(completeOption)) {
            bool ok = false;
            int percent = parser.value(completeOption).toInt(&ok);
            if (!ok || percent < 0 || percent > 100) {
                err() << "complete-at must be 0-100\n";
                return 1;
            }
            settings.setEpisodeCompleteAt(percent);
        }
        printSettings(settings);
        return 0;
    }

    err() << "Unknown command: " << command << "\n";
    parser.showHelp(1);
}
