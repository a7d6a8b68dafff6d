#include "profilebinder.h"
#include "browserprofile.h"

#include <QWebEngineCookieStore>
#include <QLocale>
#include <QDir>
#include <QDebug>


ProfileBinder::ProfileBinder(BrowserProfile *profile, QObject *parent)
    : QObject(parent),
    m_profile(profile)
{
    if (m_profile)
        connect(m_profile, &BrowserProfile::configurationChanged, this, &ProfileBinder::sync);
}

void ProfileBinder::attach(QObject *engineProfile)
{
    auto *p = qobject_cast<QQuickWebEngineProfile*>(engineProfile);
    if (!p) {
        qWarning() << "[ProfileBinder] attach: not a WebEngineProfile" << engineProfile;
        return;
    }

    m_engineProfile    = p;
    m_defaultUserAgent = p->httpUserAgent();
    m_cookieFilter     = -1;
    qInfo() << "[ProfileBinder] attached to profile" << p->storageName();
    sync();
}

void ProfileBinder::clearBrowsingData()
{
    if (!m_engineProfile) return;

    qInfo() << "[ProfileBinder] clearing cookies and HTTP cache";
    if (QWebEngineCookieStore *store = m_engineProfile->cookieStore())
        store->deleteAllCookies();
    m_engineProfile->clearHttpCache();
}

// ──────────────────────────────────────────────────────────────────────────────
void ProfileBinder::sync()
{
    if (!m_engineProfile || !m_profile) return;

    const QString ua = m_profile->httpUserAgent().isEmpty() ? m_defaultUserAgent
                                                            : m_profile->httpUserAgent();
    if (m_engineProfile->httpUserAgent() != ua)
        m_engineProfile->setHttpUserAgent(ua);

    const auto policy = m_profile->persistentCookies() ? QQuickWebEngineProfile::AllowPersistentCookies
                                                       : QQuickWebEngineProfile::NoPersistentCookies;
    if (m_engineProfile->persistentCookiesPolicy() != policy)
        m_engineProfile->setPersistentCookiesPolicy(policy);

    if (m_profile->spellCheckEnabled() && m_engineProfile->spellCheckLanguages().isEmpty())
        m_engineProfile->setSpellCheckLanguages({ QLocale::system().bcp47Name() });
    if (m_engineProfile->isSpellCheckEnabled() != m_profile->spellCheckEnabled())
        m_engineProfile->setSpellCheckEnabled(m_profile->spellCheckEnabled());

    const QString dl = m_profile->downloadPath();
    if (!dl.isEmpty() && m_engineProfile->downloadPath() != dl) {
        if (!QDir().mkpath(dl))
            qWarning() << "[ProfileBinder] cannot create download directory" << dl;
        m_engineProfile->setDownloadPath(dl);
    }

    installCookieFilter(m_profile->cookiesAccepted());
}

void ProfileBinder::installCookieFilter(bool accept)
{
    if (m_cookieFilter == int(accept)) return;

    QWebEngineCookieStore *store = m_engineProfile->cookieStore();
    if (!store) return;

    // the filter runs on the engine's IO thread; capture by value only
    store->setCookieFilter([accept](const QWebEngineCookieStore::FilterRequest &) {
        return accept;
    });
    m_cookieFilter = int(accept);
}
