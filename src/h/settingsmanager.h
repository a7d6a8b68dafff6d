#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include "browsererror.h"
#include "settings.h"
#include "settingsstore.h"

#include <QObject>
#include <QUrl>
#include <QVariantMap>
#include <memory>


class BrowserProfile;
class TorController;

class SettingsManager : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString search_engine         READ searchEngine         NOTIFY settingsChanged)
    Q_PROPERTY(QString homepage              READ homepage             NOTIFY settingsChanged)
    Q_PROPERTY(QString download_dir          READ downloadDir          NOTIFY settingsChanged)
    Q_PROPERTY(int     zoom                  READ zoom                 NOTIFY settingsChanged)
    Q_PROPERTY(bool    javascript_enabled    READ javascriptEnabled    NOTIFY settingsChanged)
    Q_PROPERTY(bool    images_enabled        READ imagesEnabled        NOTIFY settingsChanged)
    Q_PROPERTY(bool    cookies_enabled       READ cookiesEnabled       NOTIFY settingsChanged)
    Q_PROPERTY(bool    popups_blocked        READ popupsBlocked        NOTIFY settingsChanged)
    Q_PROPERTY(bool    notifications_enabled READ notificationsEnabled NOTIFY settingsChanged)
    Q_PROPERTY(bool    spellcheck_enabled    READ spellcheckEnabled    NOTIFY settingsChanged)
    Q_PROPERTY(bool    clear_on_exit         READ clearOnExit          NOTIFY settingsChanged)
    Q_PROPERTY(QString user_agent            READ userAgent            NOTIFY settingsChanged)
    Q_PROPERTY(QString tor_dir               READ torDir               NOTIFY settingsChanged)
    Q_PROPERTY(QStringList search_engines    READ searchEngines        CONSTANT)

public:
    SettingsManager(std::unique_ptr<SettingsStore> store,
                    BrowserProfile *profile,
                    TorController  *tor,
                    QObject *parent = nullptr);
    ~SettingsManager() override;

    const Settings &settings() const { return m_settings; }

    QString searchEngine()         const { return m_settings.searchEngine; }
    QString homepage()             const { return m_settings.homepage; }
    QString downloadDir()          const { return m_settings.downloadDir; }
    int     zoom()                 const { return m_settings.zoom; }
    bool    javascriptEnabled()    const { return m_settings.javascriptEnabled; }
    bool    imagesEnabled()        const { return m_settings.imagesEnabled; }
    bool    cookiesEnabled()       const { return m_settings.cookiesEnabled; }
    bool    popupsBlocked()        const { return m_settings.popupsBlocked; }
    bool    notificationsEnabled() const { return m_settings.notificationsEnabled; }
    bool    spellcheckEnabled()    const { return m_settings.spellcheckEnabled; }
    bool    clearOnExit()          const { return m_settings.clearOnExit; }
    QString userAgent()            const { return m_settings.userAgent; }
    QString torDir()               const { return m_settings.torDir; }
    QStringList searchEngines()    const { return Settings::searchEngines(); }

    Q_INVOKABLE QVariantMap toVariantMap() const { return m_settings.toVariantMap(); }
    Q_INVOKABLE QString     searchUrl(const QString &query) const;
    Q_INVOKABLE QUrl        urlFromInput(const QString &input) const;
    Q_INVOKABLE QUrl        homepageUrl() const;

public slots:
    void load();
    bool updateSettings(const QVariantMap &values);
    bool resetToDefaults();

signals:
    void settingsChanged();
    void saved();
    void errorOccurred(BrowserError kind, const QString &message);

private:
    bool commit(const Settings &next);
    void pushToProfile();
    void pushTorDir();

    std::unique_ptr<SettingsStore> m_store;
    BrowserProfile *m_profile = nullptr;
    TorController  *m_tor     = nullptr;
    Settings        m_settings;
    QString         m_appliedTorDir;
    bool            m_pushingTorDir = false;
};

#endif // SETTINGSMANAGER_H
