#ifndef BROWSERPROFILE_H
#define BROWSERPROFILE_H

#include "settings.h"

#include <QObject>
#include <QString>


struct ProfileConfiguration
{
    enum class Proxy { Direct, Socks5 };

    bool    javascriptEnabled        = true;
    bool    autoLoadImages           = true;
    bool    javascriptCanOpenWindows = false;
    bool    cookiesAccepted          = true;
    bool    notificationsAllowed     = false;
    bool    spellCheckEnabled        = false;
    QString httpUserAgent;
    qreal   zoomFactor               = 1.0;
    QString downloadPath;

    Proxy   proxy                    = Proxy::Direct;
    QString proxyHost;
    quint16 proxyPort                = 0;
    bool    persistentCookies        = true;

    bool operator==(const ProfileConfiguration &o) const;
    bool operator!=(const ProfileConfiguration &o) const { return !(*this == o); }
};


// What the browsing profile should look like. Settings and the Tor
// controller write here; the engine binder and the QML views read from it.
class BrowserProfile : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool    javascriptEnabled        READ javascriptEnabled        NOTIFY configurationChanged)
    Q_PROPERTY(bool    autoLoadImages           READ autoLoadImages           NOTIFY configurationChanged)
    Q_PROPERTY(bool    javascriptCanOpenWindows READ javascriptCanOpenWindows NOTIFY configurationChanged)
    Q_PROPERTY(bool    cookiesAccepted          READ cookiesAccepted          NOTIFY configurationChanged)
    Q_PROPERTY(bool    notificationsAllowed     READ notificationsAllowed     NOTIFY configurationChanged)
    Q_PROPERTY(bool    spellCheckEnabled        READ spellCheckEnabled        NOTIFY configurationChanged)
    Q_PROPERTY(QString httpUserAgent            READ httpUserAgent            NOTIFY configurationChanged)
    Q_PROPERTY(qreal   zoomFactor               READ zoomFactor               NOTIFY configurationChanged)
    Q_PROPERTY(QString downloadPath             READ downloadPath             NOTIFY configurationChanged)
    Q_PROPERTY(bool    proxied                  READ isProxied                NOTIFY configurationChanged)
    Q_PROPERTY(bool    persistentCookies        READ persistentCookies        NOTIFY configurationChanged)

public:
    explicit BrowserProfile(QObject *parent = nullptr);

    void apply(const Settings &settings);

    void routeThroughSocks(const QString &host, quint16 port);
    void useDirectConnection();

    ProfileConfiguration configuration() const { return m_config; }

    bool    javascriptEnabled()        const { return m_config.javascriptEnabled; }
    bool    autoLoadImages()           const { return m_config.autoLoadImages; }
    bool    javascriptCanOpenWindows() const { return m_config.javascriptCanOpenWindows; }
    bool    cookiesAccepted()          const { return m_config.cookiesAccepted; }
    bool    notificationsAllowed()     const { return m_config.notificationsAllowed; }
    bool    spellCheckEnabled()        const { return m_config.spellCheckEnabled; }
    QString httpUserAgent()            const { return m_config.httpUserAgent; }
    qreal   zoomFactor()               const { return m_config.zoomFactor; }
    QString downloadPath()             const { return m_config.downloadPath; }
    bool    isProxied()                const { return m_config.proxy != ProfileConfiguration::Proxy::Direct; }
    bool    persistentCookies()        const { return m_config.persistentCookies; }

signals:
    void configurationChanged();
    void proxyChanged();

private:
    void commit(const ProfileConfiguration &next);
    void applyApplicationProxy() const;

    ProfileConfiguration m_config;
};

#endif // BROWSERPROFILE_H
