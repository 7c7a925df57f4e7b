#ifndef TRACK_H
#define TRACK_H

#include <QString>
#include <QObject>

class Track : public QObject
{
    Q_OBJECT

public:
    Track(const QString& title, int duration, QObject *parent = nullptr);

    // Getters
    QString title() const { return m_title; }
    int duration() const { return m_duration; }

    bool isShorterThan(const Track& other) const { return m_duration < other.m_duration; }
    bool hasTitle(const QString& title) const;

    // Helper methods
    QString durationString() const;
    QString toString() const;

private:
    const QString m_title;
    const int m_duration; // in seconds
};

#endif // TRACK_H
