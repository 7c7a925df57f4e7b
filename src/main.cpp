#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QDebug>
#include <QList>
#include <QPair>
#include <memory>
#include "playlist.h"
#include "playlistsettings.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    QCoreApplication::setApplicationName("Playlist Demo");
    QCoreApplication::setApplicationVersion("1.0.0");
    QCoreApplication::setOrganizationName("PlaylistCore");

    QCommandLineParser parser;
    parser.setApplicationDescription("Builds a sample playlist and prints it");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption settingsOption("settings", "Read settings from an INI <file>.", "file");
    parser.addOption(settingsOption);
    parser.process(app);

    // Without --settings the platform's default QSettings location is used
    std::unique_ptr<QSettings> settings;
    if (parser.isSet(settingsOption)) {
        settings = std::make_unique<QSettings>(parser.value(settingsOption), QSettings::IniFormat);
    } else {
        settings = std::make_unique<QSettings>();
    }
    const PlaylistSettings playlistSettings = loadPlaylistSettings(*settings);

    Playlist playlist(playlistSettings.maxSize);
    QObject::connect(&playlist, &Playlist::trackAdded, [](std::shared_ptr<Track> track, int index) {
        qDebug() << "[Demo] Added" << track->title() << "at" << index;
    });

    const QList<QPair<QString, int>> samples = {
        {"Yesterday", 125},
        {"Imagine", 183},
        {"Hey Jude", 431},
        {"Let It Be", 243},
        {"Something", 182},
    };
    for (const auto& sample : samples) {
        if (!playlist.add(std::make_shared<Track>(sample.first, sample.second))) {
            qWarning() << "[Demo] Playlist full, skipped" << sample.first;
        }
    }

    qInfo().noquote() << "Playlist (" << playlist.size() << "/" << playlist.maxSize() << "):";
    qInfo().noquote() << playlist.toString();
    qInfo() << "Total duration:" << playlist.totalDuration() << "seconds";

    std::optional<QString> shortest = playlist.titleOfShortestTrack();
    qInfo() << "Shortest track:" << (shortest ? *shortest : QString("(none)"));

    playlist.sortInPlace();
    qInfo().noquote() << "Sorted by duration:";
    qInfo().noquote() << playlist.toString();

    return 0;
}
