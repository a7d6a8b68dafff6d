#ifndef TORCONTROLLER_H
#define TORCONTROLLER_H

#include "browsererror.h"
#include "portprobe.h"

#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QTemporaryDir>
#include <memory>


class BrowserProfile;

class TorController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(Status  status            READ status            NOTIFY statusChanged)
    Q_PROPERTY(bool    running           READ isRunning         NOTIFY statusChanged)
    Q_PROPERTY(bool    busy              READ isBusy            NOTIFY statusChanged)
    Q_PROPERTY(QString statusText        READ statusText        NOTIFY statusChanged)
    Q_PROPERTY(int     bootstrapProgress READ bootstrapProgress NOTIFY bootstrapProgressChanged)
    Q_PROPERTY(QString lastError         READ lastError         NOTIFY lastErrorChanged)
    Q_PROPERTY(QString torExecutable     READ torExecutable     NOTIFY torExecutableChanged)
    Q_PROPERTY(int     socksPort         READ socksPort         NOTIFY portsChanged)
    Q_PROPERTY(int     controlPort       READ controlPort       NOTIFY portsChanged)

public:
    enum class Status { NotConfigured, Stopped, Starting, Running, Failed };
    Q_ENUM(Status)

    static constexpr quint16 DefaultSocksPort   = 9050;
    static constexpr quint16 DefaultControlPort = 9051;

    explicit TorController(BrowserProfile *profile, QObject *parent = nullptr);
    ~TorController() override;

    Q_INVOKABLE bool configureTorPath(const QString &path);
    Q_INVOKABLE bool clearTorPath();
    Q_INVOKABLE bool setPorts(int socksPort, int controlPort);

    Q_INVOKABLE bool enable();
    Q_INVOKABLE bool disable();
    Q_INVOKABLE bool toggle();
    Q_INVOKABLE void acknowledgeFailure();

    void setReadinessPolicy(int intervalMs, int timeoutMs);
    void setTerminateGracePeriod(int ms) { m_graceMs = ms; }

    // Accepts the executable itself or a directory holding one somewhere below.
    static QString locateTorExecutable(const QString &path);

    Status  status()            const { return m_status; }
    bool    isRunning()         const { return m_status == Status::Running; }
    bool    isBusy()            const { return m_status == Status::Starting; }
    QString statusText()        const { return m_statusText; }
    int     bootstrapProgress() const { return m_bootstrapProgress; }
    QString lastError()         const { return m_lastError; }
    QString torExecutable()     const { return m_torBin; }
    int     socksPort()         const { return m_socksPort; }
    int     controlPort()       const { return m_controlPort; }
    QString dataDirectory()     const { return m_dataDir; }
    qint64  processId()         const { return m_proc.processId(); }

signals:
    void statusChanged();
    void bootstrapProgressChanged();
    void lastErrorChanged();
    void torExecutableChanged();
    void portsChanged();

    void started();
    void stopped();
    void logMessage(const QString &line);
    void errorOccurred(BrowserError kind, const QString &message);

private slots:
    void onStdOut();
    void onStdErr();
    void onProcessError(QProcess::ProcessError err);
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onPortsReady();
    void onPortTimedOut(quint16 port);

private:
    void setStatus(Status s, const QString &text);
    bool reject(BrowserError kind, const QString &message);
    void enterFailed(const QString &message);
    void writeTorrc(const QString &torrcPath) const;
    void stopProcess();
    void resetBootstrap();

    QPointer<BrowserProfile>       m_profile;
    QProcess                       m_proc;
    PortProbe                      m_probe;
    std::unique_ptr<QTemporaryDir> m_tmpDir;

    QString m_dataDir;
    QString m_torBin;
    quint16 m_socksPort   = DefaultSocksPort;
    quint16 m_controlPort = DefaultControlPort;

    Status  m_status = Status::NotConfigured;
    QString m_statusText;
    QString m_lastError;
    int     m_bootstrapProgress = 0;

    int  m_probeIntervalMs = 250;
    int  m_probeTimeoutMs  = 60000;
    int  m_graceMs         = 3000;
    bool m_stopping        = false;
};

#endif // TORCONTROLLER_H
