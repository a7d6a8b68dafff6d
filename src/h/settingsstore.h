#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include "settings.h"

#include <QString>


class SettingsStore
{
public:
    virtual ~SettingsStore() = default;

    // Never fails: a missing or unreadable source yields Settings::defaults().
    virtual Settings load() = 0;
    virtual bool     save(const Settings &settings, QString *err = nullptr) = 0;
};


class JsonSettingsStore : public SettingsStore
{
public:
    explicit JsonSettingsStore(const QString &filePath = defaultFilePath());

    static QString defaultFilePath();
    QString        filePath() const { return m_filePath; }

    Settings load() override;
    bool     save(const Settings &settings, QString *err = nullptr) override;

private:
    QString m_filePath;
};

#endif // SETTINGSSTORE_H
