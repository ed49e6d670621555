#ifndef EPISODECURSOR_H
#define EPISODECURSOR_H

#include <QMutex>

/**
 * @brief 1-based index of the episode currently loaded in the player
 *
 * Shared (QSharedPointer) between the session that created it and the
 * navigator that moves it. The navigator holds mutex() for the whole of one
 * navigation, including the network resolution, and calls setEpisode() while
 * holding it. Everybody else reads through current().
 */
class EpisodeCursor
{
public:
    explicit EpisodeCursor(int episode = 1);

    /**
     * @brief Current episode, takes the lock
     */
    int current() const;

    QMutex *mutex() const { return &m_mutex; }

    /**
     * @brief Episode value without locking, caller must hold mutex()
     */
    int episodeLocked() const { return m_episode; }

    /**
     * @brief Move the cursor, caller must hold mutex()
     *
     * Values below 1 are clamped to 1.
     */
    void setEpisode(int episode);

private:
    mutable QMutex m_mutex;
    int m_episode;
};

#endif // EPISODECURSOR_H
