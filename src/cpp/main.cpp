#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QtWebEngineQuick/qtwebenginequickglobal.h>
#include <QQmlEngine>
#include "bootstrap.h"
#include "browserprofile.h"
#include "profilebinder.h"
#include "settingsmanager.h"
#include "thememanager.h"
#include "torcontroller.h"
#include <QCoreApplication>


int main(int argc, char *argv[])
{
    qputenv("QT_QUICK_CONTROLS_STYLE", "Fusion");
    QCoreApplication::setOrganizationName("CyberBrowser");
    QCoreApplication::setApplicationName("CyberBrowser");

    #ifdef APP_VERSION
        QCoreApplication::setApplicationVersion(APP_VERSION);
    #endif

    // must run before the application object exists
    QtWebEngineQuick::initialize();
    QGuiApplication app(argc, argv);

    qRegisterMetaType<BrowserError>("BrowserError");
    qmlRegisterUncreatableType<TorController>("CyberBrowser.Tor", 1, 0, "TorController",
                                              "TorController is provided by the application");

    const QVariantMap core = Bootstrap::buildCore(&app);
    if (core.isEmpty())
        return -1;

    auto *themeManager    = core["theme_manager"].value<ThemeManager*>();
    auto *browserProfile  = core["browser_profile"].value<BrowserProfile*>();
    auto *torController   = core["tor_controller"].value<TorController*>();
    auto *settingsManager = core["settings_manager"].value<SettingsManager*>();
    auto *profileBinder   = core["profile_binder"].value<ProfileBinder*>();

    QQmlApplicationEngine engine;

    QQmlContext *ctx = engine.rootContext();
    ctx->setContextProperty("themeManager",    themeManager);
    ctx->setContextProperty("browserProfile",  browserProfile);
    ctx->setContextProperty("torController",   torController);
    ctx->setContextProperty("settingsManager", settingsManager);
    ctx->setContextProperty("profileBinder",   profileBinder);

    engine.loadFromModule("CyberBrowser", "Main");
    if (engine.rootObjects().isEmpty())
        return -1;

    return app.exec();
}
