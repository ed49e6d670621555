#include "playeripc.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

const char *const PlayerIpc::NextEpisodeSignal = "next-episode";
const char *const PlayerIpc::PreviousEpisodeSignal = "previous-episode";
const char *const PlayerIpc::PositionProperty = "percent-pos";

QByteArray PlayerIpc::encodeCommand(const QJsonArray &command)
{
    QJsonObject object;
    object.insert("command", command);
    QByteArray line = QJsonDocument(object).toJson(QJsonDocument::Compact);
    line.append('\n');
    return line;
}

QByteArray PlayerIpc::keybind(const QString &key, const QString &signal)
{
    // mpv takes the bound command as a single string
    return encodeCommand(QJsonArray{"keybind", key, QString("script-message %1").arg(signal)});
}

QByteArray PlayerIpc::observeProperty(int id, const QString &property)
{
    return encodeCommand(QJsonArray{"observe_property", id, property});
}

QByteArray PlayerIpc::loadFile(const QString &url)
{
    return encodeCommand(QJsonArray{"loadfile", url, "replace"});
}

QByteArray PlayerIpc::setProperty(const QString &property, const QString &value)
{
    return encodeCommand(QJsonArray{"set_property", property, value});
}

QByteArray PlayerIpc::changeList(const QString &property, const QString &operation, const QString &value)
{
    return encodeCommand(QJsonArray{"change-list", property, operation, value});
}

QByteArray PlayerIpc::showText(const QString &text, int durationMs)
{
    return encodeCommand(QJsonArray{"show-text", text, durationMs});
}

PlayerEvent PlayerIpc::parseEvent(const QByteArray &line)
{
    PlayerEvent event;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return event;
    }

    QJsonObject object = doc.object();
    QString eventName = object.value("event").toString();

    if (eventName == "property-change") {
        event.kind = PlayerEvent::PropertyChange;
        event.name = object.value("name").toString();
        QJsonValue data = object.value("data");
        if (data.isDouble()) {
            event.value = data.toDouble();
            event.hasValue = true;
        }
    } else if (eventName == "client-message") {
        event.kind = PlayerEvent::ClientMessage;
        event.name = eventName;
        const QJsonArray args = object.value("args").toArray();
        for (const QJsonValue &arg : args) {
            event.args << arg.toString();
        }
    } else {
        // Command replies ({"error": ...}) and events we do not act on
        event.kind = PlayerEvent::Other;
        event.name = eventName;
    }

    return event;
}

bool PlayerIpc::actionForEvent(const PlayerEvent &event, NavigationAction *action)
{
    if (event.kind != PlayerEvent::ClientMessage || event.args.isEmpty()) {
        return false;
    }

    const QString &signal = event.args.first();
    if (signal == QLatin1String(NextEpisodeSignal)) {
        if (action) {
            *action = NavigationAction::Next;
        }
        return true;
    }
    if (signal == QLatin1String(PreviousEpisodeSignal)) {
        if (action) {
            *action = NavigationAction::Previous;
        }
        return true;
    }
    return false;
}
