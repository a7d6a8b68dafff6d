#include "browserprofile.h"

#include <QNetworkProxy>
#include <QDebug>


bool ProfileConfiguration::operator==(const ProfileConfiguration &o) const
{
    return javascriptEnabled        == o.javascriptEnabled
        && autoLoadImages           == o.autoLoadImages
        && javascriptCanOpenWindows == o.javascriptCanOpenWindows
        && cookiesAccepted          == o.cookiesAccepted
        && notificationsAllowed     == o.notificationsAllowed
        && spellCheckEnabled        == o.spellCheckEnabled
        && httpUserAgent            == o.httpUserAgent
        && qFuzzyCompare(zoomFactor, o.zoomFactor)
        && downloadPath             == o.downloadPath
        && proxy                    == o.proxy
        && proxyHost                == o.proxyHost
        && proxyPort                == o.proxyPort
        && persistentCookies        == o.persistentCookies;
}

BrowserProfile::BrowserProfile(QObject *parent) : QObject(parent) {}

void BrowserProfile::apply(const Settings &settings)
{
    ProfileConfiguration next = m_config;

    next.javascriptEnabled        = settings.javascriptEnabled;
    next.autoLoadImages           = settings.imagesEnabled;
    next.javascriptCanOpenWindows = !settings.popupsBlocked;
    next.cookiesAccepted          = settings.cookiesEnabled;
    next.notificationsAllowed     = settings.notificationsEnabled;
    next.spellCheckEnabled        = settings.spellcheckEnabled;
    next.httpUserAgent            = settings.userAgent.trimmed();
    next.zoomFactor               = Settings::clampZoom(settings.zoom) / 100.0;
    next.downloadPath             = settings.downloadDir;

    // Tor sessions never write cookies to disk, whatever the settings say
    next.persistentCookies = next.cookiesAccepted
                             && next.proxy == ProfileConfiguration::Proxy::Direct;

    commit(next);
}

void BrowserProfile::routeThroughSocks(const QString &host, quint16 port)
{
    ProfileConfiguration next = m_config;
    next.proxy             = ProfileConfiguration::Proxy::Socks5;
    next.proxyHost         = host;
    next.proxyPort         = port;
    next.persistentCookies = false;

    const bool proxyDiffers = next.proxy != m_config.proxy
                              || next.proxyHost != m_config.proxyHost
                              || next.proxyPort != m_config.proxyPort;
    commit(next);
    if (proxyDiffers) {
        applyApplicationProxy();
        qInfo() << "[BrowserProfile] routing through SOCKS5" << host << port;
        emit proxyChanged();
    }
}

void BrowserProfile::useDirectConnection()
{
    ProfileConfiguration next = m_config;
    const bool wasProxied = isProxied();
    next.proxy             = ProfileConfiguration::Proxy::Direct;
    next.proxyHost.clear();
    next.proxyPort         = 0;
    next.persistentCookies = next.cookiesAccepted;

    commit(next);
    if (wasProxied) {
        applyApplicationProxy();
        qInfo() << "[BrowserProfile] direct connection restored";
        emit proxyChanged();
    }
}

// ──────────────────────────────────────────────────────────────────────────────
void BrowserProfile::commit(const ProfileConfiguration &next)
{
    if (next == m_config)
        return;
    m_config = next;
    emit configurationChanged();
}

void BrowserProfile::applyApplicationProxy() const
{
    // Qt WebEngine follows the application proxy for every profile
    if (m_config.proxy == ProfileConfiguration::Proxy::Socks5) {
        QNetworkProxy::setApplicationProxy(
            QNetworkProxy(QNetworkProxy::Socks5Proxy, m_config.proxyHost, m_config.proxyPort));
    } else {
        QNetworkProxy::setApplicationProxy(QNetworkProxy(QNetworkProxy::NoProxy));
    }
}
