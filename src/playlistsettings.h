#ifndef PLAYLISTSETTINGS_H
#define PLAYLISTSETTINGS_H

class QSettings;

/**
 * Playlist options persisted under the "Playlist/" group of QSettings.
 */
struct PlaylistSettings {
    static constexpr int DEFAULT_MAX_SIZE = 10;
    static constexpr int MAX_ALLOWED_SIZE = 10000;

    int maxSize = DEFAULT_MAX_SIZE;
};

PlaylistSettings loadPlaylistSettings(QSettings& settings);
void savePlaylistSettings(QSettings& settings, const PlaylistSettings& playlistSettings);

#endif // PLAYLISTSETTINGS_H
