#include "torcontroller.h"
#include "browserprofile.h"

#include <QStandardPaths>
#include <QCoreApplication>
#include <QTextStream>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QDirIterator>
#include <QMetaEnum>
#include <QRegularExpression>
#include <QDebug>
#include <stdexcept>


static const char *statusName(TorController::Status s)
{
    return QMetaEnum::fromType<TorController::Status>().valueToKey(static_cast<int>(s));
}

// ──────────────────────────────────────────────────────────────────────────────
TorController::TorController(BrowserProfile *profile, QObject *parent)
    : QObject(parent),
    m_profile(profile)
{
    connect(&m_proc, &QProcess::readyReadStandardOutput,
            this,      &TorController::onStdOut);
    connect(&m_proc, &QProcess::readyReadStandardError,
            this,      &TorController::onStdErr);
    connect(&m_proc, &QProcess::errorOccurred,
            this,      &TorController::onProcessError);
    connect(&m_proc, qOverload<int,QProcess::ExitStatus>(&QProcess::finished),
            this,      &TorController::onProcessFinished);

    connect(&m_probe, &PortProbe::ready,    this, &TorController::onPortsReady);
    connect(&m_probe, &PortProbe::timedOut, this, &TorController::onPortTimedOut);
    connect(&m_probe, &PortProbe::portReachable, this, [this](quint16 port) {
        emit logMessage(tr("Port %1 is accepting connections").arg(port));
    });


    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);

    if (base.isEmpty()) {
        qWarning() << "[TorController] AppDataLocation is empty; falling back to QDir::tempPath()";
        base = QDir::tempPath();
    }

    // QTemporaryDir will not create the parent
    if (!QDir().mkpath(base)) {
        qWarning() << "[TorController] Could not create base dir" << base
                   << "; falling back to QDir::tempPath()";
        base = QDir::tempPath();
    }

    m_tmpDir = std::make_unique<QTemporaryDir>(base + "/tor-XXXXXX");

    if (!m_tmpDir->isValid()) {
        qWarning() << "[TorController] Failed to create tor data dir under" << base
                   << "; retrying in system temp";
        m_tmpDir = std::make_unique<QTemporaryDir>(QDir::tempPath() + "/tor-XXXXXX");
    }

    if (m_tmpDir->isValid())
        m_dataDir = m_tmpDir->path();
    else
        qWarning() << "[TorController] no usable data directory; enabling Tor will fail";

    m_statusText = tr("Tor not configured");
}

TorController::~TorController()
{
    m_probe.cancel();
    if (m_proc.state() != QProcess::NotRunning) {
        qInfo() << "[TorController] shutting down Tor child" << m_proc.processId();
        if (m_profile)
            m_profile->useDirectConnection();
        stopProcess();
    }
    m_stopping = true;
}

// ──────────────────────────────────────────────────────────────────────────────
QString TorController::locateTorExecutable(const QString &path)
{
#if defined(Q_OS_WIN)
    const QString exeName = "tor.exe";
#else
    const QString exeName = "tor";
#endif

    const QString clean = path.trimmed();
    if (clean.isEmpty()) return {};

    auto usable = [](const QFileInfo &fi) -> bool {
#if defined(Q_OS_WIN)
        return fi.isFile();
#else
        return fi.isFile() && fi.isExecutable();
#endif
    };

    const QFileInfo given(clean);
    if (given.isFile()) {
        if (given.fileName().compare(exeName, Qt::CaseInsensitive) != 0) return {};
        return usable(given) ? given.absoluteFilePath() : QString();
    }
    if (!given.isDir()) return {};

    const QFileInfo direct(QDir(clean).filePath(exeName));
    if (usable(direct)) return direct.absoluteFilePath();

    // bundle layouts: <dir>/bin/tor, Browser/TorBrowser/Tor/tor, ...
    QString best;
    QDirIterator it(clean, QStringList() << exeName, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QFileInfo cand(it.next());
        if (!usable(cand)) continue;

        const QString p = cand.absoluteFilePath();
        if (p.contains("/bin/") || p.contains("/Tor/")) return p;
        if (best.isEmpty()) best = p;
    }
    return best;
}

bool TorController::configureTorPath(const QString &path)
{
    if (m_status == Status::Starting || m_status == Status::Running)
        return reject(BrowserError::State,
                      tr("Cannot change the Tor location while Tor is active"));

    if (path.trimmed().isEmpty())
        return reject(BrowserError::Validation, tr("No Tor location given"));

    const QString bin = locateTorExecutable(path);
    if (bin.isEmpty())
        return reject(BrowserError::Validation,
                      tr("No Tor executable found at %1").arg(QDir::toNativeSeparators(path.trimmed())));

    qInfo() << "[TorController] using Tor executable" << bin;
    if (bin != m_torBin) {
        m_torBin = bin;
        emit torExecutableChanged();
    }

    if (m_status == Status::NotConfigured)
        setStatus(Status::Stopped, tr("Tor off"));
    return true;
}

bool TorController::clearTorPath()
{
    if (m_status == Status::Starting || m_status == Status::Running)
        return reject(BrowserError::State,
                      tr("Cannot change the Tor location while Tor is active"));

    if (!m_torBin.isEmpty()) {
        m_torBin.clear();
        emit torExecutableChanged();
    }
    setStatus(Status::NotConfigured, tr("Tor not configured"));
    return true;
}

bool TorController::setPorts(int socksPort, int controlPort)
{
    if (m_status == Status::Starting || m_status == Status::Running)
        return reject(BrowserError::State, tr("Cannot change Tor ports while Tor is active"));

    auto valid = [](int p) { return p >= 1 && p <= 65535; };
    if (!valid(socksPort) || !valid(controlPort))
        return reject(BrowserError::Validation, tr("Tor ports must be between 1 and 65535"));
    if (socksPort == controlPort)
        return reject(BrowserError::Validation, tr("SOCKS and control ports must differ"));

    if (m_socksPort != socksPort || m_controlPort != controlPort) {
        m_socksPort   = static_cast<quint16>(socksPort);
        m_controlPort = static_cast<quint16>(controlPort);
        emit portsChanged();
    }
    return true;
}

void TorController::setReadinessPolicy(int intervalMs, int timeoutMs)
{
    m_probeIntervalMs = intervalMs;
    m_probeTimeoutMs  = timeoutMs;
}

// ──────────────────────────────────────────────────────────────────────────────
void TorController::writeTorrc(const QString &torrcPath) const
{
    QFile f(torrcPath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text))
        throw std::runtime_error("Cannot write torrc");
    QTextStream ts(&f);
    ts << "SOCKSPort "        << m_socksPort    << "\n"
       << "ControlPort "      << m_controlPort  << "\n"
       << "DataDirectory \""  << m_dataDir      << "/data\"\n"
       << "Log notice stdout\n";
    ts.flush();
    if (ts.status() != QTextStream::Ok)
        throw std::runtime_error("Cannot write torrc");
}

bool TorController::enable()
{
    if (m_status != Status::Stopped)
        return reject(BrowserError::State,
                      tr("Tor can only be enabled when stopped (currently %1)")
                          .arg(QString::fromLatin1(statusName(m_status))));

    if (m_dataDir.isEmpty()) {
        enterFailed(tr("No data directory available for Tor"));
        return false;
    }

    const QString torrcPath = m_dataDir + "/torrc";
    QDir().mkpath(m_dataDir + "/data");

    try { writeTorrc(torrcPath); }
    catch (const std::exception &e) { enterFailed(QString::fromLatin1(e.what())); return false; }


    const QString binDir = QFileInfo(m_torBin).dir().absolutePath();
    QString bundleRoot   = binDir;

    if (QDir(binDir + "/../lib").exists())
        bundleRoot = QFileInfo(binDir + "/..").absoluteFilePath();

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();

#if defined(Q_OS_LINUX)
    const QString libDir = bundleRoot + "/lib";
    if (QDir(libDir).exists()) {
        const QString cur = env.value("LD_LIBRARY_PATH");
        env.insert("LD_LIBRARY_PATH", libDir + (cur.isEmpty() ? "" : ":" + cur));
    }
#elif defined(Q_OS_MACOS)
    const QString libDir = bundleRoot + "/lib";
    if (QDir(libDir).exists()) {
        const QString cur = env.value("DYLD_LIBRARY_PATH");
        env.insert("DYLD_LIBRARY_PATH", libDir + (cur.isEmpty() ? "" : ":" + cur));
    }
#elif defined(Q_OS_WIN)
    // bundled DLLs sit next to tor.exe or under lib
    const QString libDir = bundleRoot + "\\lib";
    const QString cur = env.value("PATH");
    env.insert("PATH", bundleRoot + ";" + libDir + (cur.isEmpty() ? "" : ";" + cur));
#endif

    m_proc.setProcessEnvironment(env);
    m_proc.setWorkingDirectory(bundleRoot);

    resetBootstrap();
    m_stopping = false;
    setStatus(Status::Starting, tr("Launching Tor…"));

    qInfo() << "[TorController] launching" << m_torBin << "socks" << m_socksPort
            << "control" << m_controlPort;
    m_proc.start(m_torBin, { "-f", torrcPath });

    // a launch failure may already have been reported from inside start()
    if (m_status != Status::Starting)
        return false;

    m_probe.start({ m_socksPort, m_controlPort }, m_probeIntervalMs, m_probeTimeoutMs);
    return true;
}

bool TorController::disable()
{
    if (m_status != Status::Starting && m_status != Status::Running && m_status != Status::Failed)
        return reject(BrowserError::State,
                      tr("Tor is not active (currently %1)")
                          .arg(QString::fromLatin1(statusName(m_status))));

    const bool wasStarting = m_status == Status::Starting;

    m_probe.cancel();
    if (m_profile)
        m_profile->useDirectConnection();
    stopProcess();

    resetBootstrap();
    setStatus(Status::Stopped, wasStarting ? tr("Tor start cancelled") : tr("Tor off"));
    emit stopped();
    return true;
}

bool TorController::toggle()
{
    switch (m_status) {
    case Status::NotConfigured:
        return reject(BrowserError::Validation, tr("Set the Tor directory in Settings first"));
    case Status::Stopped:
        return enable();
    case Status::Starting:
    case Status::Running:
    case Status::Failed:
        return disable();
    }
    return false;
}

void TorController::acknowledgeFailure()
{
    if (m_status != Status::Failed) return;
    resetBootstrap();
    setStatus(Status::Stopped, tr("Tor off"));
}

// ──────────────────────────────────────────────────────────────────────────────
void TorController::stopProcess()
{
    if (m_proc.state() == QProcess::NotRunning)
        return;

    m_stopping = true;
    m_proc.terminate();
    if (!m_proc.waitForFinished(m_graceMs)) {
        qWarning() << "[TorController] Tor ignored terminate for" << m_graceMs << "ms; killing";
        m_proc.kill();
        m_proc.waitForFinished(1000);
    }
    m_stopping = false;
}

void TorController::resetBootstrap()
{
    if (m_bootstrapProgress != 0) {
        m_bootstrapProgress = 0;
        emit bootstrapProgressChanged();
    }
}

void TorController::setStatus(Status s, const QString &text)
{
    if (m_status == s && m_statusText == text)
        return;
    if (m_status != s)
        qDebug() << "[TorController]" << statusName(m_status) << "->" << statusName(s);
    m_status     = s;
    m_statusText = text;
    emit statusChanged();
}

bool TorController::reject(BrowserError kind, const QString &message)
{
    qWarning() << "[TorController]" << message;
    m_lastError = message;
    emit lastErrorChanged();
    emit errorOccurred(kind, message);
    return false;
}

void TorController::enterFailed(const QString &message)
{
    m_probe.cancel();
    stopProcess();
    if (m_profile && m_profile->isProxied())
        m_profile->useDirectConnection();

    qWarning() << "[TorController]" << message;
    m_lastError = message;
    emit lastErrorChanged();
    setStatus(Status::Failed, message);
    emit errorOccurred(BrowserError::Tor, message);
}

// ──────────────────────────────────────────────────────────────────────────────
void TorController::onPortsReady()
{
    if (m_status != Status::Starting) return;

    if (m_profile)
        m_profile->routeThroughSocks(QStringLiteral("127.0.0.1"), m_socksPort);

    setStatus(Status::Running,
              tr("Connected through Tor (SOCKS5 127.0.0.1:%1)").arg(m_socksPort));
    emit started();
}

void TorController::onPortTimedOut(quint16 port)
{
    if (m_status != Status::Starting) return;
    enterFailed(tr("Tor did not open port %1 within %2 s")
                    .arg(port)
                    .arg(m_probeTimeoutMs / 1000.0, 0, 'g', 3));
}

void TorController::onStdOut()
{
    const QString chunk = QString::fromLocal8Bit(m_proc.readAllStandardOutput());

    for (const QString &line : chunk.split('\n', Qt::SkipEmptyParts)) {
        qDebug() << "[TorController][stdout]" << line.trimmed();
        emit logMessage(line.trimmed());
    }

    static const QRegularExpression re("Bootstrapped\\s+(\\d+)%");
    QRegularExpressionMatchIterator it = re.globalMatch(chunk);
    int newProgress = m_bootstrapProgress;
    while (it.hasNext())
        newProgress = it.next().captured(1).toInt();

    if (newProgress != m_bootstrapProgress) {
        m_bootstrapProgress = newProgress;
        emit bootstrapProgressChanged();

        if (m_status == Status::Starting)
            setStatus(Status::Starting, tr("Bootstrapping Tor (%1%)").arg(m_bootstrapProgress));
    }
}

void TorController::onStdErr()
{
    const QString chunk = QString::fromLocal8Bit(m_proc.readAllStandardError());
    for (const QString &line : chunk.split('\n', Qt::SkipEmptyParts)) {
        qDebug() << "[TorController][stderr]" << line.trimmed();
        emit logMessage(line.trimmed());
    }
}

void TorController::onProcessError(QProcess::ProcessError err)
{
    if (m_stopping) return;

    qWarning() << "[TorController] QProcess error" << err << m_proc.errorString()
               << "bin=" << m_torBin
               << "cwd=" << m_proc.workingDirectory();

    // crashes are handled by onProcessFinished
    if (err == QProcess::FailedToStart && m_status == Status::Starting)
        enterFailed(tr("Failed to launch Tor: %1").arg(m_proc.errorString()));
}

void TorController::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    if (m_stopping) return;

    qInfo() << "[TorController] Tor exited, code" << exitCode
            << (status == QProcess::CrashExit ? "(crashed)" : "");

    switch (m_status) {
    case Status::Starting:
        enterFailed(tr("Tor exited during startup (exit code %1)").arg(exitCode));
        break;

    case Status::Running: {
        if (m_profile)
            m_profile->useDirectConnection();
        resetBootstrap();

        const QString msg = tr("Tor exited unexpectedly (exit code %1); direct connection restored")
                                .arg(exitCode);
        setStatus(Status::Stopped, tr("Tor off"));
        m_lastError = msg;
        emit lastErrorChanged();
        emit errorOccurred(BrowserError::Tor, msg);
        emit stopped();
        break;
    }

    case Status::NotConfigured:
    case Status::Stopped:
    case Status::Failed:
        break;
    }
}
