#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace Episodic {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    EPISODIC_INFO("Config initialized for {}/{}",
                  organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    ensureDirectoriesExist();
    EPISODIC_INFO("Config loaded from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    return getValue(key, defaultValue).toLongLong();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::NetworkSettings Config::getNetworkSettings() const {
    NetworkSettings defaults;
    NetworkSettings settings;
    settings.baseUrl = getString("network/baseUrl", defaults.baseUrl);
    settings.userAgent = getString("network/userAgent", defaults.userAgent);
    settings.referer = getString("network/referer", defaults.referer);
    settings.acceptLanguage = getString("network/acceptLanguage", defaults.acceptLanguage);
    settings.requestTimeoutSeconds = getInt("network/requestTimeoutSeconds", defaults.requestTimeoutSeconds);
    settings.inactivityTimeoutSeconds = getInt("network/inactivityTimeoutSeconds", defaults.inactivityTimeoutSeconds);
    return settings;
}

Config::TransferSettings Config::getTransferSettings() const {
    TransferSettings defaults;
    TransferSettings settings;
    settings.chunkSize = getInt64("transfer/chunkSize", defaults.chunkSize);
    settings.parallelism = qMax(1, getInt("transfer/parallelism", defaults.parallelism));
    settings.retryAttempts = qMax(1, getInt("transfer/retryAttempts", defaults.retryAttempts));
    settings.retryDelayMs = getInt("transfer/retryDelayMs", defaults.retryDelayMs);
    settings.restartWhenRangeIgnored = getBool("transfer/restartWhenRangeIgnored",
                                               defaults.restartWhenRangeIgnored);
    if (settings.chunkSize <= 0) {
        EPISODIC_WARN("Ignoring invalid transfer/chunkSize {}", settings.chunkSize);
        settings.chunkSize = defaults.chunkSize;
    }
    return settings;
}

Config::MergeSettings Config::getMergeSettings() const {
    MergeSettings defaults;
    MergeSettings settings;
    settings.ffmpegPath = getString("merge/ffmpegPath");
    settings.keepEpisodesAfterMerge = getBool("merge/keepEpisodesAfterMerge", defaults.keepEpisodesAfterMerge);
    settings.mergeTimeoutSeconds = getInt("merge/timeoutSeconds", defaults.mergeTimeoutSeconds);
    return settings;
}

void Config::setNetworkSettings(const NetworkSettings& settings) {
    setValue("network/baseUrl", settings.baseUrl);
    setValue("network/userAgent", settings.userAgent);
    setValue("network/referer", settings.referer);
    setValue("network/acceptLanguage", settings.acceptLanguage);
    setValue("network/requestTimeoutSeconds", settings.requestTimeoutSeconds);
    setValue("network/inactivityTimeoutSeconds", settings.inactivityTimeoutSeconds);
}

void Config::setTransferSettings(const TransferSettings& settings) {
    setValue("transfer/chunkSize", settings.chunkSize);
    setValue("transfer/parallelism", settings.parallelism);
    setValue("transfer/retryAttempts", settings.retryAttempts);
    setValue("transfer/retryDelayMs", settings.retryDelayMs);
    setValue("transfer/restartWhenRangeIgnored", settings.restartWhenRangeIgnored);
}

void Config::setMergeSettings(const MergeSettings& settings) {
    setValue("merge/ffmpegPath", settings.ffmpegPath);
    setValue("merge/keepEpisodesAfterMerge", settings.keepEpisodesAfterMerge);
    setValue("merge/timeoutSeconds", settings.mergeTimeoutSeconds);
}

QString Config::getOutputDirectory() const {
    return getString("output/directory", "./output");
}

QString Config::getStateFileName() const {
    return getString("output/stateFileName", "download_state.json");
}

QString Config::getLogPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/episodic.log";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QString logDir = QFileInfo(getLogPath()).absolutePath();
    QDir dir;
    if (!dir.mkpath(logDir)) {
        EPISODIC_WARN("Failed to create directory: {}", logDir.toStdString());
    }
}

} // namespace Episodic
