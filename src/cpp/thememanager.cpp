#include "thememanager.h"

#include <QFontDatabase>

ThemeManager::ThemeManager(QObject *parent) : QObject(parent) {}

QString ThemeManager::fontFamily() const
{
    static const QString family = [] {
        const QStringList families = QFontDatabase::families();
        if (families.contains(QStringLiteral("Segoe UI")))
            return QStringLiteral("Segoe UI");
        return QFontDatabase::systemFont(QFontDatabase::GeneralFont).family();
    }();
    return family;
}
