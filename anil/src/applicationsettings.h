#ifndef APPLICATIONSETTINGS_H
#define APPLICATIONSETTINGS_H

#include <QString>
#include <QSqlDatabase>

/**
 * @brief Manages all application settings
 *
 * Settings live in a `settings(name, value)` table of the application's
 * SQLite database. Every setter persists immediately; load() reads the whole
 * table. Without an open database the defaults are used and nothing is
 * saved.
 */
class ApplicationSettings
{
public:
    /**
     * @brief Playback and source preferences
     */
    struct StreamSettings {
        QString player;            // Player program, resolved on PATH
        QString quality;           // Preferred vertical resolution ("1080", "720", "480")
        QString translationType;   // "sub" or "dub"
        int episodeCompleteAt;     // Watched percentage that counts as finished

        StreamSettings()
            : player("mpv")
            , quality("1080")
            , translationType("sub")
            , episodeCompleteAt(85) {}
    };

    /**
     * @brief AniList credentials
     */
    struct AuthSettings {
        QString anilistToken;
        QString username;

        AuthSettings() = default;

        bool isLoggedIn() const { return !anilistToken.isEmpty() && !username.isEmpty(); }
    };

    /**
     * @brief Player control channel timing
     */
    struct PlayerIpcSettings {
        int connectAttempts;
        int connectIntervalMs;
        int pollIntervalMs;

        PlayerIpcSettings() : connectAttempts(20), connectIntervalMs(100), pollIntervalMs(100) {}
    };

    /**
     * @brief Construct settings manager with database connection
     * @param database Database to use for persistence (if invalid, settings won't persist)
     */
    explicit ApplicationSettings(QSqlDatabase database = QSqlDatabase());

    ~ApplicationSettings() = default;

    ApplicationSettings(const ApplicationSettings&) = delete;
    ApplicationSettings& operator=(const ApplicationSettings&) = delete;

    /**
     * @brief Open (creating if needed) the default settings database
     *
     * Located at <AppConfigLocation>/anil.sqlite. Returns an invalid database
     * and logs when it cannot be opened.
     */
    static QSqlDatabase openDefaultDatabase();

    /**
     * @brief Create the settings table when missing
     */
    bool ensureSchema();

    // === Load/Save ===

    void load();
    void save();

    // === Stream ===

    const StreamSettings& stream() const { return m_stream; }

    QString getPlayer() const { return m_stream.player; }
    void setPlayer(const QString& player);

    QString getQuality() const { return m_stream.quality; }
    void setQuality(const QString& quality);

    QString getTranslationType() const { return m_stream.translationType; }
    void setTranslationType(const QString& translationType);

    int getEpisodeCompleteAt() const { return m_stream.episodeCompleteAt; }
    void setEpisodeCompleteAt(int percent);

    // === Authentication ===

    const AuthSettings& auth() const { return m_auth; }

    QString getAnilistToken() const { return m_auth.anilistToken; }
    void setAnilistToken(const QString& token);

    QString getUsername() const { return m_auth.username; }
    void setUsername(const QString& username);

    void clearAuth();

    // === Player IPC ===

    const PlayerIpcSettings& playerIpc() const { return m_playerIpc; }

    void setConnectAttempts(int attempts);
    void setConnectIntervalMs(int ms);
    void setPollIntervalMs(int ms);

private:
    void saveSetting(const QString& name, const QString& value);
    void removeSetting(const QString& name);

    QSqlDatabase m_database;

    StreamSettings m_stream;
    AuthSettings m_auth;
    PlayerIpcSettings m_playerIpc;
};

#endif // APPLICATIONSETTINGS_H
