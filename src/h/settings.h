#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QVariantMap>


struct Settings
{
    QString searchEngine;
    QString homepage;
    QString downloadDir;
    int     zoom = 100;

    bool javascriptEnabled    = true;
    bool imagesEnabled        = true;
    bool cookiesEnabled       = true;
    bool popupsBlocked        = true;
    bool notificationsEnabled = false;
    bool spellcheckEnabled    = false;
    bool clearOnExit          = false;

    QString userAgent;
    QString torDir;

    static constexpr int MinZoom = 50;
    static constexpr int MaxZoom = 200;

    static Settings     defaults();
    static QStringList  searchEngines();
    static QString      defaultSearchEngine();

    // Canonical spelling of a recognized engine, or the default engine.
    static QString normalizeSearchEngine(const QString &name);
    static int     clampZoom(int zoom);
    static QString searchUrlTemplate(const QString &engine);

    QJsonObject     toJson() const;
    static Settings fromJson(const QJsonObject &obj);

    QVariantMap     toVariantMap() const;
    // Fields absent from |values| keep their current value.
    Settings        merged(const QVariantMap &values) const;

    bool operator==(const Settings &o) const;
    bool operator!=(const Settings &o) const { return !(*this == o); }
};

#endif // SETTINGS_H
