#include "httpclient.h"
#include "logger.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QTimer>

HttpClient::HttpClient(QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_timeoutMs(DefaultTimeoutMs)
{
}

QNetworkRequest HttpClient::buildRequest(const QUrl &url, const HeaderList &headers) const
{
    QNetworkRequest request(url);
    for (const auto &header : m_defaultHeaders) {
        request.setRawHeader(header.first, header.second);
    }
    for (const auto &header : headers) {
        request.setRawHeader(header.first, header.second);
    }
    return request;
}

HttpResponse HttpClient::get(const QUrl &url, const HeaderList &headers)
{
    QNetworkReply *reply = m_networkManager->get(buildRequest(url, headers));
    return waitForReply(reply);
}

HttpResponse HttpClient::postJson(const QUrl &url, const QByteArray &body, const HeaderList &headers)
{
    QNetworkRequest request = buildRequest(url, headers);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Accept", "application/json");
    QNetworkReply *reply = m_networkManager->post(request, body);
    return waitForReply(reply);
}

HttpResponse HttpClient::waitForReply(QNetworkReply *reply)
{
    HttpResponse response;

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    bool timedOut = false;

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timeout, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });

    timeout.start(m_timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    timeout.stop();

    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();

    if (timedOut) {
        response.errorString = QString("Request to %1 timed out after %2 ms")
            .arg(reply->url().host()).arg(m_timeoutMs);
    } else if (reply->error() != QNetworkReply::NoError) {
        // Keep the server's explanation when there is one
        response.errorString = response.body.isEmpty()
            ? reply->errorString()
            : QString("%1: %2").arg(reply->errorString(), QString::fromUtf8(response.body));
    } else if (response.status < 200 || response.status >= 300) {
        response.errorString = QString("HTTP %1: %2").arg(response.status).arg(QString::fromUtf8(response.body));
    } else {
        response.ok = true;
    }

    if (!response.ok) {
        LOG(QString("HTTP request failed: %1").arg(response.errorString));
    }

    reply->deleteLater();
    return response;
}
