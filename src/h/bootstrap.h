#ifndef BOOTSTRAP_H
#define BOOTSTRAP_H

#include <QObject>
#include <QVariantMap>
#include <QCoreApplication>


// Builds the application-lifetime objects, parented to |app|, and loads the
// persisted settings. Keys: theme_manager, browser_profile, tor_controller,
// settings_manager, profile_binder. Empty when no application exists.
class Bootstrap : public QObject
{
    Q_OBJECT
public:
    explicit Bootstrap(QObject *parent = nullptr);
    static QVariantMap buildCore(QCoreApplication *app = nullptr);
};

#endif // BOOTSTRAP_H
