#ifndef PROFILEBINDER_H
#define PROFILEBINDER_H

#include <QObject>
#include <QPointer>
#include <QQuickWebEngineProfile>


class BrowserProfile;

// Pushes BrowserProfile onto the QML WebEngineProfile the views share.
class ProfileBinder : public QObject
{
    Q_OBJECT
public:
    explicit ProfileBinder(BrowserProfile *profile, QObject *parent = nullptr);

    Q_INVOKABLE void attach(QObject *engineProfile);
    Q_INVOKABLE void clearBrowsingData();

private slots:
    void sync();

private:
    void installCookieFilter(bool accept);

    QPointer<BrowserProfile>         m_profile;
    QPointer<QQuickWebEngineProfile> m_engineProfile;
    QString                          m_defaultUserAgent;
    int                              m_cookieFilter = -1;   // -1: none installed yet
};

#endif // PROFILEBINDER_H
