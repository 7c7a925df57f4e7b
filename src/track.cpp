#include "track.h"
#include <QDebug>

static int clampDuration(const QString& title, int duration)
{
    if (duration < 0) {
        qWarning() << "[Track] Negative duration" << duration << "for" << title << "- using 0";
        return 0;
    }
    return duration;
}

Track::Track(const QString& title, int duration, QObject *parent)
    : QObject(parent)
    , m_title(title)
    , m_duration(clampDuration(title, duration))
{
}

bool Track::hasTitle(const QString& title) const
{
    return m_title.compare(title, Qt::CaseInsensitive) == 0;
}

QString Track::durationString() const
{
    int minutes = m_duration / 60;
    int seconds = m_duration % 60;
    return QString("%1:%2").arg(minutes).arg(seconds, 2, 10, QChar('0'));
}

QString Track::toString() const
{
    return QString("%1, %2").arg(m_title, durationString());
}
