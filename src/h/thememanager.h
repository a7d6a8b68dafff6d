#ifndef THEMEMANAGER_H
#define THEMEMANAGER_H

#include <QObject>

class ThemeManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString backgroundColor    READ backgroundColor    CONSTANT)
    Q_PROPERTY(QString surfaceColor       READ surfaceColor       CONSTANT)
    Q_PROPERTY(QString selectedColor      READ selectedColor      CONSTANT)
    Q_PROPERTY(QString borderColor        READ borderColor        CONSTANT)
    Q_PROPERTY(QString textColor          READ textColor          CONSTANT)
    Q_PROPERTY(QString titleColor         READ titleColor         CONSTANT)
    Q_PROPERTY(QString textSecondaryColor READ textSecondaryColor CONSTANT)
    Q_PROPERTY(QString inputTextColor     READ inputTextColor     CONSTANT)
    Q_PROPERTY(QString accentColor        READ accentColor        CONSTANT)
    Q_PROPERTY(QString successColor       READ successColor       CONSTANT)
    Q_PROPERTY(QString warningColor       READ warningColor       CONSTANT)
    Q_PROPERTY(QString errorColor         READ errorColor         CONSTANT)
    Q_PROPERTY(QString fontFamily         READ fontFamily         CONSTANT)

public:
    explicit ThemeManager(QObject *parent = nullptr);

    QString backgroundColor()    const { return "#0f172a"; }
    QString surfaceColor()       const { return "#1e293b"; }
    QString selectedColor()      const { return "#334155"; }
    QString borderColor()        const { return "#334155"; }
    QString textColor()          const { return "#e2e8f0"; }
    QString titleColor()         const { return "#f8fafc"; }
    QString textSecondaryColor() const { return "#94a3b8"; }
    QString inputTextColor()     const { return "#f1f5f9"; }
    QString accentColor()        const { return "#3b82f6"; }
    QString successColor()       const { return "#22c55e"; }
    QString warningColor()       const { return "#f59e0b"; }
    QString errorColor()         const { return "#ef4444"; }
    QString fontFamily()         const;
};

#endif
