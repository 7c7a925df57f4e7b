#ifndef PLAYLIST_H
#define PLAYLIST_H

#include <QObject>
#include <QList>
#include <memory>
#include <optional>
#include "track.h"

// Fixed capacity; slots at or beyond size() are empty
class Playlist : public QObject
{
    Q_OBJECT

public:
    explicit Playlist(int maxSize, QObject *parent = nullptr);

    // Getters
    int maxSize() const { return m_maxSize; }
    int size() const { return m_size; }
    bool isEmpty() const { return m_size == 0; }
    bool isFull() const { return m_size == m_maxSize; }

    // Returns nullptr when index is outside [0, size())
    std::shared_ptr<Track> getTrack(int index) const;

    // Track management
    bool add(std::shared_ptr<Track> track);
    bool insertAt(int index, std::shared_ptr<Track> track);
    void removeLast();
    void removeAt(int index);
    void removeByTitle(const QString& title);
    void removeFirst();
    void extend(const Playlist& other);
    void clear();

    // Search
    int indexOf(const QString& title) const;
    // Clamped to INT_MAX
    int totalDuration() const;
    std::optional<QString> titleOfShortestTrack() const;

    // Index of the shortest track in [start, size()), -1 if start is out of range.
    // Ties go to the lowest index.
    int minIndexFrom(int start) const;

    // Selection sort by increasing duration
    void sortInPlace();

    QString toString() const;

signals:
    void trackAdded(std::shared_ptr<Track> track, int index);
    void trackRemoved(int index);
    void playlistCleared();
    void playlistSorted();

private:
    int m_maxSize;
    int m_size = 0;
    QList<std::shared_ptr<Track>> m_tracks;
};

#endif // PLAYLIST_H
