#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include "../anil/src/playeripc.h"

class TestPlayerIpc : public QObject
{
    Q_OBJECT

private slots:
    void testEncodeCommand();
    void testKeybind();
    void testObserveProperty();
    void testLoadFile();
    void testChangeList();
    void testShowText();
    void testParsePropertyChange();
    void testParseUnavailableProperty();
    void testParseClientMessage();
    void testParseReplyAndGarbage();
    void testActionForEvent();

private:
    static QJsonArray commandOf(const QByteArray &line)
    {
        return QJsonDocument::fromJson(line).object().value("command").toArray();
    }
};

void TestPlayerIpc::testEncodeCommand()
{
    QByteArray line = PlayerIpc::encodeCommand(QJsonArray{"stop"});
    QCOMPARE(line, QByteArray("{\"command\":[\"stop\"]}\n"));
    // Exactly one line per command
    QCOMPARE(line.count('\n'), 1);
}

void TestPlayerIpc::testKeybind()
{
    QJsonArray command = commandOf(PlayerIpc::keybind("N", PlayerIpc::NextEpisodeSignal));
    QCOMPARE(command.size(), 3);
    QCOMPARE(command[0].toString(), QString("keybind"));
    QCOMPARE(command[1].toString(), QString("N"));
    QCOMPARE(command[2].toString(), QString("script-message next-episode"));
}

void TestPlayerIpc::testObserveProperty()
{
    QJsonArray command = commandOf(PlayerIpc::observeProperty(PlayerIpc::PositionObserverId,
                                                              PlayerIpc::PositionProperty));
    QCOMPARE(command[0].toString(), QString("observe_property"));
    QCOMPARE(command[1].toInt(), 1);
    QCOMPARE(command[2].toString(), QString("percent-pos"));
}

void TestPlayerIpc::testLoadFile()
{
    QJsonArray command = commandOf(PlayerIpc::loadFile("https://cdn.test/a \"b\".m3u8"));
    QCOMPARE(command[0].toString(), QString("loadfile"));
    QCOMPARE(command[1].toString(), QString("https://cdn.test/a \"b\".m3u8"));
    QCOMPARE(command[2].toString(), QString("replace"));
}

void TestPlayerIpc::testChangeList()
{
    QJsonArray command = commandOf(PlayerIpc::changeList("http-header-fields", "append",
                                                         "User-Agent: Mozilla/5.0 (X11, Linux)"));
    QCOMPARE(command.size(), 4);
    QCOMPARE(command[0].toString(), QString("change-list"));
    QCOMPARE(command[2].toString(), QString("append"));
    QCOMPARE(command[3].toString(), QString("User-Agent: Mozilla/5.0 (X11, Linux)"));
}

void TestPlayerIpc::testShowText()
{
    QJsonArray command = commandOf(PlayerIpc::showText("No next episode found"));
    QCOMPARE(command[0].toString(), QString("show-text"));
    QCOMPARE(command[1].toString(), QString("No next episode found"));
    QCOMPARE(command[2].toInt(), 2000);
}

void TestPlayerIpc::testParsePropertyChange()
{
    PlayerEvent event = PlayerIpc::parseEvent(
        "{\"event\":\"property-change\",\"id\":1,\"name\":\"percent-pos\",\"data\":42.5}\n");
    QCOMPARE(event.kind, PlayerEvent::PropertyChange);
    QCOMPARE(event.name, QString("percent-pos"));
    QVERIFY(event.hasValue);
    QCOMPARE(event.value, 42.5);
}

void TestPlayerIpc::testParseUnavailableProperty()
{
    // mpv reports null while nothing is loaded
    PlayerEvent event = PlayerIpc::parseEvent(
        "{\"event\":\"property-change\",\"id\":1,\"name\":\"percent-pos\",\"data\":null}");
    QCOMPARE(event.kind, PlayerEvent::PropertyChange);
    QVERIFY(!event.hasValue);
}

void TestPlayerIpc::testParseClientMessage()
{
    PlayerEvent event = PlayerIpc::parseEvent("{\"event\":\"client-message\",\"args\":[\"previous-episode\"]}");
    QCOMPARE(event.kind, PlayerEvent::ClientMessage);
    QCOMPARE(event.args, QStringList() << "previous-episode");
}

void TestPlayerIpc::testParseReplyAndGarbage()
{
    PlayerEvent reply = PlayerIpc::parseEvent("{\"data\":null,\"error\":\"success\"}");
    QCOMPARE(reply.kind, PlayerEvent::Other);

    PlayerEvent pause = PlayerIpc::parseEvent("{\"event\":\"pause\"}");
    QCOMPARE(pause.kind, PlayerEvent::Other);
    QCOMPARE(pause.name, QString("pause"));

    QCOMPARE(PlayerIpc::parseEvent("not json").kind, PlayerEvent::Invalid);
    QCOMPARE(PlayerIpc::parseEvent("[1,2]").kind, PlayerEvent::Invalid);
    QCOMPARE(PlayerIpc::parseEvent("").kind, PlayerEvent::Invalid);
}

void TestPlayerIpc::testActionForEvent()
{
    NavigationAction action = NavigationAction::Previous;
    QVERIFY(PlayerIpc::actionForEvent(
        PlayerIpc::parseEvent("{\"event\":\"client-message\",\"args\":[\"next-episode\"]}"), &action));
    QVERIFY(action == NavigationAction::Next);

    QVERIFY(PlayerIpc::actionForEvent(
        PlayerIpc::parseEvent("{\"event\":\"client-message\",\"args\":[\"previous-episode\"]}"), &action));
    QVERIFY(action == NavigationAction::Previous);

    QVERIFY(!PlayerIpc::actionForEvent(
        PlayerIpc::parseEvent("{\"event\":\"client-message\",\"args\":[\"something-else\"]}"), &action));
    QVERIFY(!PlayerIpc::actionForEvent(
        PlayerIpc::parseEvent("{\"event\":\"client-message\",\"args\":[]}"), &action));
    QVERIFY(!PlayerIpc::actionForEvent(
        PlayerIpc::parseEvent("{\"event\":\"property-change\",\"name\":\"percent-pos\",\"data\":1}"), &action));
}

QTEST_GUILESS_MAIN(TestPlayerIpc)
#include "test_playeripc.moc"
