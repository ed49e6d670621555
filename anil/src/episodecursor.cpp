#include "episodecursor.h"

EpisodeCursor::EpisodeCursor(int episode)
    : m_episode(episode < 1 ? 1 : episode)
{
}

int EpisodeCursor::current() const
{
    QMutexLocker locker(&m_mutex);
    return m_episode;
}

void EpisodeCursor::setEpisode(int episode)
{
    m_episode = episode < 1 ? 1 : episode;
}
