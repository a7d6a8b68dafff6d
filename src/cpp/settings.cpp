#include "settings.h"

#include <QStandardPaths>
#include <QJsonValue>
#include <QtGlobal>


namespace {

struct EngineEntry {
    const char *name;
    const char *queryUrl;
};

const EngineEntry kEngines[] = {
    { "Google",     "https://www.google.com/search?q=%1"       },
    { "DuckDuckGo", "https://duckduckgo.com/?q=%1"             },
    { "Bing",       "https://www.bing.com/search?q=%1"         },
    { "Yahoo",      "https://search.yahoo.com/search?p=%1"     },
    { "Yandex",     "https://yandex.com/search/?text=%1"       },
    { "Searx",      "https://searx.be/search?q=%1"             },
    { "Startpage",  "https://www.startpage.com/do/search?query=%1" },
};

int zoomFromJson(const QJsonValue &v, int def)
{
    if (!v.isDouble()) return def;
    // bound before rounding so absurd values cannot overflow int
    const double d = qBound<double>(Settings::MinZoom, v.toDouble(), Settings::MaxZoom);
    return qRound(d);
}

} // namespace


Settings Settings::defaults()
{
    Settings s;
    s.searchEngine = defaultSearchEngine();
    s.homepage     = QStringLiteral("about:blank");
    s.downloadDir  = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    return s;
}

QStringList Settings::searchEngines()
{
    QStringList out;
    for (const EngineEntry &e : kEngines)
        out << QString::fromLatin1(e.name);
    return out;
}

QString Settings::defaultSearchEngine()
{
    return QStringLiteral("DuckDuckGo");
}

QString Settings::normalizeSearchEngine(const QString &name)
{
    const QString clean = name.trimmed();
    for (const EngineEntry &e : kEngines) {
        if (clean.compare(QLatin1String(e.name), Qt::CaseInsensitive) == 0)
            return QString::fromLatin1(e.name);
    }
    return defaultSearchEngine();
}

int Settings::clampZoom(int zoom)
{
    return qBound(MinZoom, zoom, MaxZoom);
}

QString Settings::searchUrlTemplate(const QString &engine)
{
    const QString canonical = normalizeSearchEngine(engine);
    for (const EngineEntry &e : kEngines) {
        if (canonical == QLatin1String(e.name))
            return QString::fromLatin1(e.queryUrl);
    }
    return {};
}

// ──────────────────────────────────────────────────────────────────────────────
QJsonObject Settings::toJson() const
{
    QJsonObject o;
    o["search_engine"]         = searchEngine;
    o["homepage"]              = homepage;
    o["download_dir"]          = downloadDir;
    o["zoom"]                  = zoom;
    o["javascript_enabled"]    = javascriptEnabled;
    o["images_enabled"]        = imagesEnabled;
    o["cookies_enabled"]       = cookiesEnabled;
    o["popups_blocked"]        = popupsBlocked;
    o["notifications_enabled"] = notificationsEnabled;
    o["spellcheck_enabled"]    = spellcheckEnabled;
    o["clear_on_exit"]         = clearOnExit;
    o["user_agent"]            = userAgent;
    o["tor_dir"]               = torDir;
    return o;
}

Settings Settings::fromJson(const QJsonObject &obj)
{
    const Settings d = defaults();
    Settings s;

    s.searchEngine = normalizeSearchEngine(obj.value("search_engine").toString(d.searchEngine));
    s.homepage     = obj.value("homepage").toString(d.homepage);
    s.downloadDir  = obj.value("download_dir").toString(d.downloadDir);
    s.zoom         = zoomFromJson(obj.value("zoom"), d.zoom);

    s.javascriptEnabled    = obj.value("javascript_enabled").toBool(d.javascriptEnabled);
    s.imagesEnabled        = obj.value("images_enabled").toBool(d.imagesEnabled);
    s.cookiesEnabled       = obj.value("cookies_enabled").toBool(d.cookiesEnabled);
    s.popupsBlocked        = obj.value("popups_blocked").toBool(d.popupsBlocked);
    s.notificationsEnabled = obj.value("notifications_enabled").toBool(d.notificationsEnabled);
    s.spellcheckEnabled    = obj.value("spellcheck_enabled").toBool(d.spellcheckEnabled);
    s.clearOnExit          = obj.value("clear_on_exit").toBool(d.clearOnExit);

    s.userAgent = obj.value("user_agent").toString(d.userAgent);
    s.torDir    = obj.value("tor_dir").toString(d.torDir);
    return s;
}

QVariantMap Settings::toVariantMap() const
{
    return toJson().toVariantMap();
}

Settings Settings::merged(const QVariantMap &values) const
{
    QJsonObject o = toJson();
    const QJsonObject incoming = QJsonObject::fromVariantMap(values);
    for (auto it = incoming.constBegin(); it != incoming.constEnd(); ++it) {
        // mistyped values keep the current field rather than the default
        if (o.contains(it.key()) && o.value(it.key()).type() == it.value().type())
            o[it.key()] = it.value();
    }
    return fromJson(o);
}

bool Settings::operator==(const Settings &o) const
{
    return searchEngine         == o.searchEngine
        && homepage             == o.homepage
        && downloadDir          == o.downloadDir
        && zoom                 == o.zoom
        && javascriptEnabled    == o.javascriptEnabled
        && imagesEnabled        == o.imagesEnabled
        && cookiesEnabled       == o.cookiesEnabled
        && popupsBlocked        == o.popupsBlocked
        && notificationsEnabled == o.notificationsEnabled
        && spellcheckEnabled    == o.spellcheckEnabled
        && clearOnExit          == o.clearOnExit
        && userAgent            == o.userAgent
        && torDir               == o.torDir;
}
