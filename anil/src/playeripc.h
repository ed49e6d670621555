#ifndef PLAYERIPC_H
#define PLAYERIPC_H

#include <QByteArray>
#include <QJsonArray>
#include <QString>
#include <QStringList>
#include "episodenavigator.h"

/**
 * @brief One inbound message from the player's JSON IPC channel
 *
 * Parsed once at the channel boundary so the controller never inspects raw
 * JSON when deciding what to do.
 */
struct PlayerEvent
{
    enum Kind {
        Invalid,          // Not a JSON object
        PropertyChange,   // "property-change" event
        ClientMessage,    // "client-message" event (script-message)
        Other             // Any other event, or a command reply
    };

    Kind kind;
    QString name;        // Property name for PropertyChange, event name for Other
    double value;        // Numeric property value
    bool hasValue;       // False when the property is unavailable (data null)
    QStringList args;    // ClientMessage arguments

    PlayerEvent() : kind(Invalid), value(0.0), hasValue(false) {}
};

/**
 * PlayerIpc - codec for mpv's newline-delimited JSON IPC protocol
 *
 * Outbound commands are {"command": [...]} objects, one per line.
 */
class PlayerIpc
{
public:
    static const char *const NextEpisodeSignal;
    static const char *const PreviousEpisodeSignal;
    static const char *const PositionProperty;
    static const int PositionObserverId = 1;
    static const int OverlayDurationMs = 2000;

    /**
     * @brief Serialize a command array to one wire line (with trailing \n)
     */
    static QByteArray encodeCommand(const QJsonArray &command);

    static QByteArray keybind(const QString &key, const QString &signal);
    static QByteArray observeProperty(int id, const QString &property);
    static QByteArray loadFile(const QString &url);
    static QByteArray setProperty(const QString &property, const QString &value);
    static QByteArray changeList(const QString &property, const QString &operation, const QString &value);
    static QByteArray showText(const QString &text, int durationMs = OverlayDurationMs);

    /**
     * @brief Parse one inbound line (with or without trailing newline)
     */
    static PlayerEvent parseEvent(const QByteArray &line);

    /**
     * @brief Map a client-message to a navigation action
     * @return false when the event is not a navigation signal
     */
    static bool actionForEvent(const PlayerEvent &event, NavigationAction *action);
};

#endif // PLAYERIPC_H
