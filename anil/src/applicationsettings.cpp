#include "applicationsettings.h"
#include "logger.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QStandardPaths>
#include <QDir>

ApplicationSettings::ApplicationSettings(QSqlDatabase database)
    : m_database(database)
{
    // Defaults come from the group constructors, call load() to read the database
}

QSqlDatabase ApplicationSettings::openDefaultDatabase()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty() || !QDir().mkpath(dir)) {
        LOG(QString("[Settings] Cannot create config directory '%1'").arg(dir));
        return QSqlDatabase();
    }

    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE");
    db.setDatabaseName(QDir(dir).filePath("anil.sqlite"));
    if (!db.open()) {
        LOG(QString("[Settings] Cannot open settings database: %1").arg(db.lastError().text()));
        return QSqlDatabase();
    }
    return db;
}

bool ApplicationSettings::ensureSchema()
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        return false;
    }

    QSqlQuery query(m_database);
    if (!query.exec("CREATE TABLE IF NOT EXISTS `settings`(`id` INTEGER PRIMARY KEY, `name` TEXT UNIQUE, `value` TEXT)")) {
        LOG(QString("[Settings] Error creating settings table: %1").arg(query.lastError().text()));
        return false;
    }
    return true;
}

void ApplicationSettings::load()
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        LOG("[Settings] Database not available, using defaults");
        return;
    }

    QSqlQuery query(m_database);
    if (!query.exec("SELECT `name`, `value` FROM `settings`")) {
        LOG(QString("[Settings] Error reading settings: %1").arg(query.lastError().text()));
        return;
    }

    while (query.next()) {
        QString name = query.value(0).toString();
        QString value = query.value(1).toString();
        bool ok = false;

        // Stream
        if (name == "player") {
            if (!value.isEmpty()) {
                m_stream.player = value;
            }
        }
        else if (name == "quality") {
            m_stream.quality = value;
        }
        else if (name == "translationType") {
            m_stream.translationType = value;
        }
        else if (name == "episodeCompleteAt") {
            int percent = value.toInt(&ok);
            if (ok && percent >= 0 && percent <= 100) {
                m_stream.episodeCompleteAt = percent;
            }
        }
        // Authentication
        else if (name == "anilistToken") {
            m_auth.anilistToken = value;
        }
        else if (name == "username") {
            m_auth.username = value;
        }
        // Player IPC
        else if (name == "ipcConnectAttempts") {
            int attempts = value.toInt(&ok);
            if (ok && attempts > 0) {
                m_playerIpc.connectAttempts = attempts;
            }
        }
        else if (name == "ipcConnectIntervalMs") {
            int ms = value.toInt(&ok);
            if (ok && ms > 0) {
                m_playerIpc.connectIntervalMs = ms;
            }
        }
        else if (name == "ipcPollIntervalMs") {
            int ms = value.toInt(&ok);
            if (ok && ms > 0) {
                m_playerIpc.pollIntervalMs = ms;
            }
        }
    }
}

void ApplicationSettings::save()
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        LOG("[Settings] Database not available, cannot save settings");
        return;
    }

    LOG("[Settings] Saving application settings to database");

    saveSetting("player", m_stream.player);
    saveSetting("quality", m_stream.quality);
    saveSetting("translationType", m_stream.translationType);
    saveSetting("episodeCompleteAt", QString::number(m_stream.episodeCompleteAt));

    saveSetting("anilistToken", m_auth.anilistToken);
    saveSetting("username", m_auth.username);

    saveSetting("ipcConnectAttempts", QString::number(m_playerIpc.connectAttempts));
    saveSetting("ipcConnectIntervalMs", QString::number(m_playerIpc.connectIntervalMs));
    saveSetting("ipcPollIntervalMs", QString::number(m_playerIpc.pollIntervalMs));
}

void ApplicationSettings::saveSetting(const QString& name, const QString& value)
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        return;
    }

    QSqlQuery query(m_database);
    query.prepare("INSERT OR REPLACE INTO `settings`(`name`, `value`) VALUES (?, ?)");
    query.addBindValue(name);
    query.addBindValue(value);

    if (!query.exec()) {
        LOG(QString("[Settings] Error saving setting %1: %2").arg(name, query.lastError().text()));
    }
}

void ApplicationSettings::removeSetting(const QString& name)
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        return;
    }

    QSqlQuery query(m_database);
    query.prepare("DELETE FROM `settings` WHERE `name` = ?");
    query.addBindValue(name);

    if (!query.exec()) {
        LOG(QString("[Settings] Error removing setting %1: %2").arg(name, query.lastError().text()));
    }
}

void ApplicationSettings::setPlayer(const QString& player)
{
    m_stream.player = player;
    saveSetting("player", player);
}

void ApplicationSettings::setQuality(const QString& quality)
{
    m_stream.quality = quality;
    saveSetting("quality", quality);
}

void ApplicationSettings::setTranslationType(const QString& translationType)
{
    m_stream.translationType = translationType;
    saveSetting("translationType", translationType);
}

void ApplicationSettings::setEpisodeCompleteAt(int percent)
{
    m_stream.episodeCompleteAt = qBound(0, percent, 100);
    saveSetting("episodeCompleteAt", QString::number(m_stream.episodeCompleteAt));
}

void ApplicationSettings::setAnilistToken(const QString& token)
{
    m_auth.anilistToken = token;
    saveSetting("anilistToken", token);
}

void ApplicationSettings::setUsername(const QString& username)
{
    m_auth.username = username;
    saveSetting("username", username);
}

void ApplicationSettings::clearAuth()
{
    m_auth = AuthSettings();
    removeSetting("anilistToken");
    removeSetting("username");
}

void ApplicationSettings::setConnectAttempts(int attempts)
{
    m_playerIpc.connectAttempts = qMax(1, attempts);
    saveSetting("ipcConnectAttempts", QString::number(m_playerIpc.connectAttempts));
}

void ApplicationSettings::setConnectIntervalMs(int ms)
{
    m_playerIpc.connectIntervalMs = qMax(1, ms);
    saveSetting("ipcConnectIntervalMs", QString::number(m_playerIpc.connectIntervalMs));
}

void ApplicationSettings::setPollIntervalMs(int ms)
{
    m_playerIpc.pollIntervalMs = qMax(1, ms);
    saveSetting("ipcPollIntervalMs", QString::number(m_playerIpc.pollIntervalMs));
}
