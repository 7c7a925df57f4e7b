#include "playlist.h"
#include <QDebug>
#include <QStringList>
#include <limits>
#include <utility>

static int clampMaxSize(int maxSize)
{
    if (maxSize < 0) {
        qWarning() << "[Playlist] Negative capacity" << maxSize << "- using 0";
        return 0;
    }
    return maxSize;
}

Playlist::Playlist(int maxSize, QObject *parent)
    : QObject(parent)
    , m_maxSize(clampMaxSize(maxSize))
    , m_tracks(m_maxSize)
{
}

std::shared_ptr<Track> Playlist::getTrack(int index) const
{
    if (index >= 0 && index < m_size) {
        return m_tracks[index];
    }
    return nullptr;
}

bool Playlist::add(std::shared_ptr<Track> track)
{
    if (!track) {
        qDebug() << "[Playlist] Ignoring null track";
        return false;
    }
    if (isFull()) {
        qDebug() << "[Playlist] Full (" << m_maxSize << "tracks), cannot add" << track->title();
        return false;
    }

    const int index = m_size;
    m_tracks[index] = track;
    m_size++;
    emit trackAdded(track, index);
    return true;
}

bool Playlist::insertAt(int index, std::shared_ptr<Track> track)
{
    if (!track) {
        qDebug() << "[Playlist] Ignoring null track";
        return false;
    }
    if (index < 0 || isFull()) {
        qDebug() << "[Playlist] Cannot insert" << track->title() << "at" << index
                 << "size=" << m_size << "max=" << m_maxSize;
        return false;
    }
    // Past the end degrades to an append
    if (m_size == 0 || index >= m_size) {
        return add(track);
    }

    for (int i = m_size - 1; i >= index; i--) {
        m_tracks[i + 1] = std::move(m_tracks[i]);
    }
    m_tracks[index] = track;
    m_size++;
    emit trackAdded(track, index);
    return true;
}

void Playlist::removeLast()
{
    if (m_size == 0) {
        qDebug() << "[Playlist] Empty, nothing to remove";
        return;
    }
    m_size--;
    m_tracks[m_size].reset();
    emit trackRemoved(m_size);
}

void Playlist::removeAt(int index)
{
    if (m_size == 0 || index < 0 || index >= m_size) {
        qDebug() << "[Playlist] Cannot remove at" << index << "size=" << m_size;
        return;
    }

    for (int i = index; i < m_size - 1; i++) {
        m_tracks[i] = std::move(m_tracks[i + 1]);
    }
    m_size--;
    m_tracks[m_size].reset();
    emit trackRemoved(index);
}

void Playlist::removeByTitle(const QString& title)
{
    // removeAt() ignores -1
    removeAt(indexOf(title));
}

void Playlist::removeFirst()
{
    removeAt(0);
}

void Playlist::extend(const Playlist& other)
{
    if (m_size + other.m_size > m_maxSize) {
        qDebug() << "[Playlist] Cannot extend by" << other.m_size << "tracks, size=" << m_size
                 << "max=" << m_maxSize;
        return;
    }

    // Snapshot the count so extending a playlist with itself terminates
    const int count = other.m_size;
    for (int i = 0; i < count; i++) {
        add(other.m_tracks[i]);
    }
}

void Playlist::clear()
{
    for (int i = 0; i < m_size; i++) {
        m_tracks[i].reset();
    }
    m_size = 0;
    emit playlistCleared();
}

int Playlist::indexOf(const QString& title) const
{
    for (int i = 0; i < m_size; i++) {
        if (m_tracks[i]->hasTitle(title)) {
            return i;
        }
    }
    return -1;
}

int Playlist::totalDuration() const
{
    qint64 total = 0;
    for (int i = 0; i < m_size; i++) {
        total += m_tracks[i]->duration();
    }
    if (total > std::numeric_limits<int>::max()) {
        qDebug() << "[Playlist] Total duration" << total << "exceeds int range, clamping";
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(total);
}

std::optional<QString> Playlist::titleOfShortestTrack() const
{
    if (m_size == 0) {
        return std::nullopt;
    }
    return m_tracks[minIndexFrom(0)]->title();
}

int Playlist::minIndexFrom(int start) const
{
    if (start < 0 || start > m_size - 1) {
        return -1;
    }

    int shortest = start;
    for (int i = start + 1; i < m_size; i++) {
        if (m_tracks[i]->isShorterThan(*m_tracks[shortest])) {
            shortest = i;
        }
    }
    return shortest;
}

void Playlist::sortInPlace()
{
    if (m_size == 0) {
        return;
    }

    // Equal durations are not kept in input order
    for (int i = 0; i < m_size; i++) {
        const int min = minIndexFrom(i);
        if (min != i) {
            std::swap(m_tracks[i], m_tracks[min]);
        }
    }
    emit playlistSorted();
}

QString Playlist::toString() const
{
    QStringList lines;
    for (int i = 0; i < m_size; i++) {
        lines.append(m_tracks[i]->toString());
    }
    return lines.join('\n');
}
