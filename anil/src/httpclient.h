#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkRequest;
class QNetworkReply;

/**
 * @brief Result of one blocking HTTP exchange
 */
struct HttpResponse
{
    bool ok;              // Transport succeeded and status is 2xx
    int status;           // HTTP status, 0 when no response arrived
    QByteArray body;
    QString errorString;

    HttpResponse() : ok(false), status(0) {}
};

/**
 * @brief Blocking HTTP helper over QNetworkAccessManager
 *
 * Each call spins a local event loop until the reply finishes or the
 * timeout aborts it. Default headers are added to every request and can be
 * overridden per call.
 */
class HttpClient : public QObject
{
    Q_OBJECT

public:
    typedef QList<QPair<QByteArray, QByteArray>> HeaderList;

    explicit HttpClient(QObject *parent = nullptr);

    void setDefaultHeaders(const HeaderList &headers) { m_defaultHeaders = headers; }
    HeaderList defaultHeaders() const { return m_defaultHeaders; }

    void setTimeoutMs(int ms) { m_timeoutMs = ms; }
    int timeoutMs() const { return m_timeoutMs; }

    HttpResponse get(const QUrl &url, const HeaderList &headers = HeaderList());
    HttpResponse postJson(const QUrl &url, const QByteArray &body, const HeaderList &headers = HeaderList());

    static const int DefaultTimeoutMs = 15000;

private:
    QNetworkRequest buildRequest(const QUrl &url, const HeaderList &headers) const;
    HttpResponse waitForReply(QNetworkReply *reply);

    QNetworkAccessManager *m_networkManager;
    HeaderList m_defaultHeaders;
    int m_timeoutMs;
};

#endif // HTTPCLIENT_H
