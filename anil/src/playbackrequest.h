#ifndef PLAYBACKREQUEST_H
#define PLAYBACKREQUEST_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QPair>

/**
 * @brief Everything the player needs to open one episode
 *
 * Built fresh for the first episode of a session and for every episode
 * loaded through in-player navigation.
 */
struct PlaybackRequest
{
    QString url;                               ///< Stream URL or local path
    QString title;                             ///< Display title, empty for none
    QString startTime;                         ///< Start offset passed verbatim to the player
    QList<QPair<QString, QString>> headers;    ///< HTTP headers in send order
    QStringList subtitles;                     ///< Subtitle file paths

    bool isValid() const { return !url.isEmpty(); }

    /**
     * @brief Headers formatted as "Key: Value" lines
     */
    QStringList headerLines() const
    {
        QStringList lines;
        for (const auto &header : headers) {
            lines << QString("%1: %2").arg(header.first, header.second);
        }
        return lines;
    }
};

#endif // PLAYBACKREQUEST_H
