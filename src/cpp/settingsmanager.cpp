#include "settingsmanager.h"
#include "browserprofile.h"
#include "torcontroller.h"

#include <QRegularExpression>
#include <QScopedValueRollback>
#include <QDebug>


SettingsManager::SettingsManager(std::unique_ptr<SettingsStore> store,
                                 BrowserProfile *profile,
                                 TorController  *tor,
                                 QObject *parent)
    : QObject(parent),
    m_store(std::move(store)),
    m_profile(profile),
    m_tor(tor),
    m_settings(Settings::defaults())
{
    // a directory saved while Tor was active is applied once it stops
    if (m_tor)
        connect(m_tor, &TorController::statusChanged, this, &SettingsManager::pushTorDir);
}

SettingsManager::~SettingsManager() = default;

// ──────────────────────────────────────────────────────────────────────────────
void SettingsManager::load()
{
    m_settings = m_store ? m_store->load() : Settings::defaults();
    qInfo() << "[SettingsManager] loaded; engine" << m_settings.searchEngine
            << "zoom" << m_settings.zoom;

    pushToProfile();
    pushTorDir();
    emit settingsChanged();
}

bool SettingsManager::updateSettings(const QVariantMap &values)
{
    return commit(m_settings.merged(values));
}

bool SettingsManager::resetToDefaults()
{
    Settings d = Settings::defaults();
    // the Tor location is machine specific and survives a reset
    d.torDir = m_settings.torDir;
    return commit(d);
}

bool SettingsManager::commit(const Settings &next)
{
    Settings clean = next;
    clean.zoom         = Settings::clampZoom(clean.zoom);
    clean.searchEngine = Settings::normalizeSearchEngine(clean.searchEngine);

    const bool changed = clean != m_settings;
    m_settings = clean;

    if (changed) {
        pushToProfile();
        pushTorDir();
        emit settingsChanged();
    }

    QString err;
    if (m_store && !m_store->save(m_settings, &err)) {
        qWarning() << "[SettingsManager] save failed:" << err;
        emit errorOccurred(BrowserError::Io, tr("Settings could not be saved: %1").arg(err));
        return false;
    }

    emit saved();
    return true;
}

void SettingsManager::pushToProfile()
{
    if (m_profile)
        m_profile->apply(m_settings);
}

void SettingsManager::pushTorDir()
{
    if (!m_tor || m_pushingTorDir) return;

    const TorController::Status st = m_tor->status();
    const QString dir = m_settings.torDir.trimmed();
    if (dir == m_appliedTorDir && st != TorController::Status::NotConfigured)
        return;

    if (st == TorController::Status::Starting || st == TorController::Status::Running) {
        qInfo() << "[SettingsManager] Tor directory" << dir << "applies once Tor stops";
        return;
    }

    QScopedValueRollback<bool> guard(m_pushingTorDir, true);
    m_appliedTorDir = dir;

    if (dir.isEmpty()) {
        if (st != TorController::Status::NotConfigured)
            m_tor->clearTorPath();
        return;
    }

    // a rejected directory must not leave the previous executable in use;
    // the controller reports the reason through its own errorOccurred
    if (!m_tor->configureTorPath(dir))
        m_tor->clearTorPath();
}

// ──────────────────────────────────────────────────────────────────────────────
QString SettingsManager::searchUrl(const QString &query) const
{
    const QString tmpl = Settings::searchUrlTemplate(m_settings.searchEngine);
    return tmpl.arg(QString::fromLatin1(QUrl::toPercentEncoding(query.trimmed())));
}

QUrl SettingsManager::urlFromInput(const QString &input) const
{
    const QString text = input.trimmed();
    if (text.isEmpty()) return {};

    static const QRegularExpression whitespace(QStringLiteral("\\s"));
    if (text.contains(whitespace))
        return QUrl(searchUrl(text));

    static const QRegularExpression knownScheme(
        QStringLiteral("^(https?|file|about|ftp|data|view-source):"),
        QRegularExpression::CaseInsensitiveOption);
    if (knownScheme.match(text).hasMatch())
        return QUrl(text);

    static const QRegularExpression hostLike(
        QStringLiteral("^(localhost|[^/?#:]+\\.[^/?#:]+|\\[[0-9a-fA-F:]+\\])(:\\d+)?([/?#].*)?$"),
        QRegularExpression::CaseInsensitiveOption);
    if (hostLike.match(text).hasMatch()) {
        const QUrl url(QStringLiteral("http://") + text, QUrl::StrictMode);
        if (url.isValid() && !url.host().isEmpty())
            return url;
    }

    return QUrl(searchUrl(text));
}

QUrl SettingsManager::homepageUrl() const
{
    const QUrl url = urlFromInput(m_settings.homepage);
    return url.isValid() && !url.isEmpty() ? url : QUrl(QStringLiteral("about:blank"));
}
