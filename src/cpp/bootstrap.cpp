#include "bootstrap.h"
#include "browserprofile.h"
#include "profilebinder.h"
#include "settingsmanager.h"
#include "settingsstore.h"
#include "thememanager.h"
#include "torcontroller.h"
#include <QCoreApplication>
#include <QVariantMap>
#include <QDebug>

Bootstrap::Bootstrap(QObject *parent) : QObject(parent) {}

QVariantMap Bootstrap::buildCore(QCoreApplication *app)
{
    if (!app) {
        app = QCoreApplication::instance();
        if (!app) {
            qWarning() << "[Bootstrap] no application instance; nothing built";
            return {};
        }
    }

    /* ---- application-lifetime objects ---------------------------------- */
    auto *themeManager    = new ThemeManager(app);
    auto *browserProfile  = new BrowserProfile(app);
    auto *torController   = new TorController(browserProfile, app);
    auto *settingsManager = new SettingsManager(std::make_unique<JsonSettingsStore>(),
                                                browserProfile, torController, app);
    auto *profileBinder   = new ProfileBinder(browserProfile, app);


    QObject::connect(app, &QCoreApplication::aboutToQuit,
                     torController, [torController]() {
                         if (torController->status() == TorController::Status::Starting
                             || torController->status() == TorController::Status::Running)
                             torController->disable();
                     });

    QObject::connect(app, &QCoreApplication::aboutToQuit,
                     profileBinder, [settingsManager, profileBinder]() {
                         if (settingsManager->clearOnExit())
                             profileBinder->clearBrowsingData();
                     });

    settingsManager->load();


    QVariantMap core;
    core["theme_manager"]    = QVariant::fromValue(themeManager);
    core["browser_profile"]  = QVariant::fromValue(browserProfile);
    core["tor_controller"]   = QVariant::fromValue(torController);
    core["settings_manager"] = QVariant::fromValue(settingsManager);
    core["profile_binder"]   = QVariant::fromValue(profileBinder);
    return core;
}
