#include "playlistsettings.h"
#include <QSettings>
#include <QDebug>

PlaylistSettings loadPlaylistSettings(QSettings& settings)
{
    PlaylistSettings result;

    bool ok = false;
    int maxSize = settings.value("Playlist/maxSize", PlaylistSettings::DEFAULT_MAX_SIZE).toInt(&ok);
    if (!ok || maxSize < 0 || maxSize > PlaylistSettings::MAX_ALLOWED_SIZE) {
        qWarning() << "[Settings] Invalid Playlist/maxSize" << settings.value("Playlist/maxSize")
                   << "- using" << PlaylistSettings::DEFAULT_MAX_SIZE;
        maxSize = PlaylistSettings::DEFAULT_MAX_SIZE;
    }
    result.maxSize = maxSize;

    return result;
}

void savePlaylistSettings(QSettings& settings, const PlaylistSettings& playlistSettings)
{
    settings.setValue("Playlist/maxSize", playlistSettings.maxSize);
    settings.sync();
    qDebug() << "[Settings] Saved Playlist/maxSize =" << playlistSettings.maxSize;
}
