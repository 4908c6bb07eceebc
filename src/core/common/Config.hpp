#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Episodic {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Episodic",
                    const QString& applicationName = "EpisodicDownloader");

    // Loads settings from an explicit INI file instead of the platform store.
    void initializeFromFile(const QString& iniPath);

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct NetworkSettings {
        QString baseUrl = "https://rongyok.com/watch/";
        QString userAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
                            "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
        QString referer = "https://rongyok.com/";
        QString acceptLanguage = "th,en-US;q=0.9,en;q=0.8";
        int requestTimeoutSeconds = 30;
        int inactivityTimeoutSeconds = 60;
    };

    struct TransferSettings {
        qint64 chunkSize = 1024 * 1024;
        int parallelism = 1;
        int retryAttempts = 3;
        int retryDelayMs = 1000;
        bool restartWhenRangeIgnored = true;
    };

    struct MergeSettings {
        QString ffmpegPath;             // empty = discover
        bool keepEpisodesAfterMerge = true;
        int mergeTimeoutSeconds = 3600;
    };

    NetworkSettings getNetworkSettings() const;
    TransferSettings getTransferSettings() const;
    MergeSettings getMergeSettings() const;

    void setNetworkSettings(const NetworkSettings& settings);
    void setTransferSettings(const TransferSettings& settings);
    void setMergeSettings(const MergeSettings& settings);

    QString getOutputDirectory() const;
    QString getStateFileName() const;
    QString getLogPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Episodic
