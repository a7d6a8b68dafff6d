#include "settingsstore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>
#include <QDebug>


JsonSettingsStore::JsonSettingsStore(const QString &filePath)
    : m_filePath(filePath)
{
}

QString JsonSettingsStore::defaultFilePath()
{
    const QByteArray env = qgetenv("CYBERBROWSER_SETTINGS");
    if (!env.isEmpty())
        return QString::fromLocal8Bit(env);

    QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (base.isEmpty()) {
        qWarning() << "[SettingsStore] AppConfigLocation is empty; falling back to home directory";
        base = QDir::homePath() + QStringLiteral("/.cyberbrowser");
    }
    return base + QStringLiteral("/settings.json");
}

// ──────────────────────────────────────────────────────────────────────────────
Settings JsonSettingsStore::load()
{
    QFile f(m_filePath);
    if (!f.exists()) {
        qInfo() << "[SettingsStore] no settings file at" << m_filePath << "- writing defaults";
        const Settings d = Settings::defaults();
        QString err;
        if (!save(d, &err))
            qWarning() << "[SettingsStore] could not create settings file:" << err;
        return d;
    }

    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "[SettingsStore] cannot read" << m_filePath << ":" << f.errorString();
        return Settings::defaults();
    }

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError) {
        qWarning() << "[SettingsStore] malformed settings file" << m_filePath
                   << "at offset" << perr.offset << ":" << perr.errorString();
        return Settings::defaults();
    }
    if (!doc.isObject()) {
        qWarning() << "[SettingsStore] settings file is not a JSON object; using defaults";
        return Settings::defaults();
    }

    return Settings::fromJson(doc.object());
}

bool JsonSettingsStore::save(const Settings &settings, QString *err)
{
    const QString dir = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (err) *err = QObject::tr("Cannot create directory %1").arg(dir);
        return false;
    }

    // validation applies on the way out as well as on the way in
    Settings clean = settings;
    clean.zoom         = Settings::clampZoom(clean.zoom);
    clean.searchEngine = Settings::normalizeSearchEngine(clean.searchEngine);

    QSaveFile out(m_filePath);
    if (!out.open(QIODevice::WriteOnly)) {
        if (err) *err = QObject::tr("Cannot write %1: %2").arg(m_filePath, out.errorString());
        return false;
    }

    const QByteArray payload = QJsonDocument(clean.toJson()).toJson(QJsonDocument::Indented);
    if (out.write(payload) != payload.size()) {
        if (err) *err = QObject::tr("Cannot write %1: %2").arg(m_filePath, out.errorString());
        out.cancelWriting();
        return false;
    }

    if (!out.commit()) {
        if (err) *err = QObject::tr("Cannot save %1: %2").arg(m_filePath, out.errorString());
        return false;
    }
    return true;
}
