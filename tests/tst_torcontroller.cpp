#include <QtTest>
#include <QTemporaryDir>
#include <QTcpServer>
#include <QNetworkProxy>
#include <QFile>
#include <QDir>
#include <memory>

#if !defined(Q_OS_WIN)
#include <signal.h>
#include <sys/types.h>
#endif

#include "torcontroller.h"
#include "browserprofile.h"


class TestTorController : public QObject
{
    Q_OBJECT

private:
    // Writes an executable shell script named tor under |dir|/|subPath|.
    static QString writeFakeTor(const QString &dir, const QByteArray &body,
                                const QString &subPath = QString())
    {
        const QString target = subPath.isEmpty() ? dir : dir + "/" + subPath;
        if (!QDir().mkpath(target))
            return {};

        const QString bin = target + "/tor";
        QFile f(bin);
        if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
            return {};
        f.write("#!/bin/sh\n" + body + "\n");
        f.close();
        f.setPermissions(f.permissions() | QFileDevice::ExeOwner | QFileDevice::ExeUser);
        return bin;
    }

    static quint16 freePort()
    {
        QTcpServer s;
        if (!s.listen(QHostAddress::LocalHost, 0))
            return 0;
        return s.serverPort();
    }

    static bool processAlive(qint64 pid)
    {
#if defined(Q_OS_WIN)
        Q_UNUSED(pid);
        return false;
#else
        return pid > 0 && ::kill(static_cast<pid_t>(pid), 0) == 0;
#endif
    }

    // Configures |tor| against a fresh sleeping fake and two unused ports.
    bool configureIdle(TorController &tor)
    {
        if (writeFakeTor(m_dir->path(), "exec sleep 30").isEmpty())
            return false;
        const quint16 socks = freePort();
        quint16 control = freePort();
        if (control == socks)
            control = socks + 1;
        return tor.configureTorPath(m_dir->path()) && tor.setPorts(socks, control);
    }

    std::unique_ptr<QTemporaryDir> m_dir;

private slots:
    void initTestCase()
    {
#if defined(Q_OS_WIN)
        QSKIP("fake Tor executables are shell scripts");
#endif
        QStandardPaths::setTestModeEnabled(true);
        qRegisterMetaType<BrowserError>();
    }

    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
    }

    void cleanup()
    {
        QNetworkProxy::setApplicationProxy(QNetworkProxy(QNetworkProxy::NoProxy));
    }

    void startsUnconfigured()
    {
        TorController tor(nullptr);
        QCOMPARE(tor.status(), TorController::Status::NotConfigured);
        QVERIFY(!tor.isRunning());
        QCOMPARE(tor.socksPort(), int(TorController::DefaultSocksPort));
        QCOMPARE(tor.controlPort(), int(TorController::DefaultControlPort));
        QVERIFY(!tor.dataDirectory().isEmpty());
    }

    void nonexistentPathIsRejected()
    {
        TorController tor(nullptr);
        QSignalSpy errors(&tor, &TorController::errorOccurred);

        QVERIFY(!tor.configureTorPath("/definitely/not/here"));
        QCOMPARE(tor.status(), TorController::Status::NotConfigured);
        QCOMPARE(errors.count(), 1);
        QVERIFY(errors.first().at(0).value<BrowserError>() == BrowserError::Validation);
        QVERIFY(!tor.lastError().isEmpty());
    }

    void directoryWithoutTorIsRejected()
    {
        QFile other(m_dir->filePath("torsocks"));
        QVERIFY(other.open(QIODevice::WriteOnly));
        other.close();

        TorController tor(nullptr);
        QVERIFY(!tor.configureTorPath(m_dir->path()));
        QCOMPARE(tor.status(), TorController::Status::NotConfigured);
    }

    void wrongFileNameIsRejected()
    {
        QFile other(m_dir->filePath("firefox"));
        QVERIFY(other.open(QIODevice::WriteOnly));
        other.close();
        other.setPermissions(other.permissions() | QFileDevice::ExeOwner);

        QVERIFY(TorController::locateTorExecutable(other.fileName()).isEmpty());
    }

    void flatDirectoryConfigures()
    {
        const QString bin = writeFakeTor(m_dir->path(), "exec sleep 30");
        QVERIFY(!bin.isEmpty());

        TorController tor(nullptr);
        QSignalSpy status(&tor, &TorController::statusChanged);
        QVERIFY(tor.configureTorPath(m_dir->path()));

        QCOMPARE(tor.status(), TorController::Status::Stopped);
        QCOMPARE(tor.torExecutable(), QFileInfo(bin).absoluteFilePath());
        QCOMPARE(status.count(), 1);
    }

    void bundleLayoutIsSearched()
    {
        const QString bin = writeFakeTor(m_dir->path(), "exec sleep 30",
                                         "Browser/TorBrowser/Tor");
        QVERIFY(!bin.isEmpty());

        QCOMPARE(TorController::locateTorExecutable(m_dir->path()),
                 QFileInfo(bin).absoluteFilePath());
    }

    void executableFileIsAccepted()
    {
        const QString bin = writeFakeTor(m_dir->path(), "exec sleep 30", "bin");
        QVERIFY(!bin.isEmpty());

        TorController tor(nullptr);
        QVERIFY(tor.configureTorPath(bin));
        QCOMPARE(tor.status(), TorController::Status::Stopped);
    }

    void enableRequiresStopped()
    {
        TorController tor(nullptr);
        QSignalSpy errors(&tor, &TorController::errorOccurred);

        QVERIFY(!tor.enable());
        QCOMPARE(tor.status(), TorController::Status::NotConfigured);
        QCOMPARE(tor.processId(), qint64(0));
        QCOMPARE(errors.count(), 1);
        QVERIFY(errors.first().at(0).value<BrowserError>() == BrowserError::State);

        QVERIFY(!tor.disable());
        QVERIFY(!tor.toggle());
    }

    void setPortsValidates()
    {
        TorController tor(nullptr);
        QSignalSpy ports(&tor, &TorController::portsChanged);

        QVERIFY(!tor.setPorts(0, 9051));
        QVERIFY(!tor.setPorts(9050, 70000));
        QVERIFY(!tor.setPorts(9150, 9150));
        QCOMPARE(ports.count(), 0);

        QVERIFY(tor.setPorts(9150, 9151));
        QCOMPARE(tor.socksPort(), 9150);
        QCOMPARE(tor.controlPort(), 9151);
        QCOMPARE(ports.count(), 1);
    }

    void torrcCarriesConfiguredPorts()
    {
        TorController tor(nullptr);
        QVERIFY(configureIdle(tor));
        QVERIFY(tor.enable());

        QFile torrc(tor.dataDirectory() + "/torrc");
        QVERIFY(torrc.open(QIODevice::ReadOnly | QIODevice::Text));
        const QString text = QString::fromUtf8(torrc.readAll());
        QVERIFY(text.contains(QStringLiteral("SOCKSPort %1").arg(tor.socksPort())));
        QVERIFY(text.contains(QStringLiteral("ControlPort %1").arg(tor.controlPort())));
        QVERIFY(text.contains("DataDirectory"));

        QVERIFY(tor.disable());
    }

    void disableWhileStartingLeavesNoChild()
    {
        BrowserProfile profile;
        TorController tor(&profile);
        QVERIFY(configureIdle(tor));

        QVERIFY(tor.enable());
        QCOMPARE(tor.status(), TorController::Status::Starting);
        QVERIFY(tor.isBusy());
        QTRY_VERIFY(tor.processId() > 0);
        const qint64 pid = tor.processId();

        QSignalSpy errors(&tor, &TorController::errorOccurred);
        QVERIFY(!tor.enable());
        QCOMPARE(tor.status(), TorController::Status::Starting);
        QCOMPARE(tor.processId(), pid);
        QCOMPARE(errors.count(), 1);
        QVERIFY(errors.first().at(0).value<BrowserError>() == BrowserError::State);

        QSignalSpy stopped(&tor, &TorController::stopped);
        QVERIFY(tor.disable());

        QCOMPARE(tor.status(), TorController::Status::Stopped);
        QCOMPARE(stopped.count(), 1);
        QVERIFY(!processAlive(pid));
        QVERIFY(!profile.isProxied());
    }

    void reachesRunningWhenBothPortsListen()
    {
        QTcpServer socks, control;
        QVERIFY(socks.listen(QHostAddress::LocalHost, 0));
        QVERIFY(control.listen(QHostAddress::LocalHost, 0));
        QVERIFY(!writeFakeTor(m_dir->path(), "exec sleep 30").isEmpty());

        BrowserProfile profile;
        profile.apply(Settings::defaults());
        TorController tor(&profile);
        tor.setReadinessPolicy(20, 5000);
        QVERIFY(tor.configureTorPath(m_dir->path()));
        QVERIFY(tor.setPorts(socks.serverPort(), control.serverPort()));

        QSignalSpy started(&tor, &TorController::started);
        QVERIFY(tor.enable());
        QTRY_COMPARE(tor.status(), TorController::Status::Running);

        QCOMPARE(started.count(), 1);
        QVERIFY(tor.isRunning());
        QVERIFY(profile.isProxied());
        QCOMPARE(profile.persistentCookies(), false);

        const QNetworkProxy app = QNetworkProxy::applicationProxy();
        QCOMPARE(app.type(), QNetworkProxy::Socks5Proxy);
        QCOMPARE(app.hostName(), QStringLiteral("127.0.0.1"));
        QCOMPARE(int(app.port()), int(socks.serverPort()));

        // a second launch, settings and port changes are refused while active
        const qint64 pid = tor.processId();
        QVERIFY(!tor.enable());
        QCOMPARE(tor.status(), TorController::Status::Running);
        QCOMPARE(tor.processId(), pid);
        QVERIFY(!tor.configureTorPath(m_dir->path()));
        QVERIFY(!tor.setPorts(9150, 9151));

        QVERIFY(tor.toggle());
        QCOMPARE(tor.status(), TorController::Status::Stopped);
        QVERIFY(!profile.isProxied());
        QCOMPARE(profile.persistentCookies(), true);
        QCOMPARE(QNetworkProxy::applicationProxy().type(), QNetworkProxy::NoProxy);
    }

    void readinessProbeBypassesApplicationProxy()
    {
        QTcpServer socks, control;
        QVERIFY(socks.listen(QHostAddress::LocalHost, 0));
        QVERIFY(control.listen(QHostAddress::LocalHost, 0));
        QVERIFY(!writeFakeTor(m_dir->path(), "exec sleep 30").isEmpty());

        // a stale SOCKS proxy left behind by an earlier session, pointing nowhere
        QNetworkProxy::setApplicationProxy(
            QNetworkProxy(QNetworkProxy::Socks5Proxy, QStringLiteral("127.0.0.1"), freePort()));

        TorController tor(nullptr);
        tor.setReadinessPolicy(20, 3000);
        QVERIFY(tor.configureTorPath(m_dir->path()));
        QVERIFY(tor.setPorts(socks.serverPort(), control.serverPort()));

        QVERIFY(tor.enable());
        QTRY_COMPARE(tor.status(), TorController::Status::Running);
        QVERIFY(tor.disable());
    }

    void readinessTimeoutFails()
    {
        BrowserProfile profile;
        TorController tor(&profile);
        tor.setReadinessPolicy(20, 300);
        QVERIFY(configureIdle(tor));

        QSignalSpy errors(&tor, &TorController::errorOccurred);
        QVERIFY(tor.enable());
        QTRY_COMPARE(tor.status(), TorController::Status::Failed);

        QCOMPARE(errors.count(), 1);
        QVERIFY(errors.first().at(0).value<BrowserError>() == BrowserError::Tor);
        QVERIFY(!tor.statusText().isEmpty());
        QVERIFY(!profile.isProxied());
        QCOMPARE(tor.processId(), qint64(0));

        QVERIFY(!tor.enable());
        QCOMPARE(tor.status(), TorController::Status::Failed);

        tor.acknowledgeFailure();
        QCOMPARE(tor.status(), TorController::Status::Stopped);
    }

    void earlyExitFails()
    {
        QVERIFY(!writeFakeTor(m_dir->path(), "exit 1").isEmpty());

        TorController tor(nullptr);
        QVERIFY(tor.configureTorPath(m_dir->path()));
        QVERIFY(tor.setPorts(freePort(), freePort() + 1));

        QVERIFY(tor.enable());
        QTRY_COMPARE(tor.status(), TorController::Status::Failed);
        QVERIFY(tor.lastError().contains("1"));

        QVERIFY(tor.disable());
        QCOMPARE(tor.status(), TorController::Status::Stopped);
    }

    void crashWhileRunningFallsBackToDirect()
    {
        QTcpServer socks, control;
        QVERIFY(socks.listen(QHostAddress::LocalHost, 0));
        QVERIFY(control.listen(QHostAddress::LocalHost, 0));
        QVERIFY(!writeFakeTor(m_dir->path(), "exec sleep 30").isEmpty());

        BrowserProfile profile;
        TorController tor(&profile);
        tor.setReadinessPolicy(20, 5000);
        QVERIFY(tor.configureTorPath(m_dir->path()));
        QVERIFY(tor.setPorts(socks.serverPort(), control.serverPort()));
        QVERIFY(tor.enable());
        QTRY_COMPARE(tor.status(), TorController::Status::Running);

        QSignalSpy errors(&tor, &TorController::errorOccurred);
        QSignalSpy stopped(&tor, &TorController::stopped);
#if !defined(Q_OS_WIN)
        QVERIFY(::kill(static_cast<pid_t>(tor.processId()), SIGKILL) == 0);
#endif

        QTRY_COMPARE(tor.status(), TorController::Status::Stopped);
        QCOMPARE(stopped.count(), 1);
        QCOMPARE(errors.count(), 1);
        QVERIFY(errors.first().at(0).value<BrowserError>() == BrowserError::Tor);
        QVERIFY(!profile.isProxied());
        QCOMPARE(QNetworkProxy::applicationProxy().type(), QNetworkProxy::NoProxy);
    }

    void bootstrapProgressIsParsed()
    {
        QVERIFY(!writeFakeTor(m_dir->path(),
                              "echo \"[notice] Bootstrapped 10% (conn): Connecting\"\n"
                              "echo \"[notice] Bootstrapped 45% (loading_descriptors)\"\n"
                              "exec sleep 30").isEmpty());

        TorController tor(nullptr);
        QVERIFY(tor.configureTorPath(m_dir->path()));
        QVERIFY(tor.setPorts(freePort(), freePort() + 1));

        QVERIFY(tor.enable());
        QTRY_COMPARE(tor.bootstrapProgress(), 45);
        QCOMPARE(tor.status(), TorController::Status::Starting);
        QVERIFY(tor.statusText().contains("45"));

        QVERIFY(tor.disable());
        QCOMPARE(tor.bootstrapProgress(), 0);
    }

    void clearingPathUnconfigures()
    {
        TorController tor(nullptr);
        QVERIFY(configureIdle(tor));
        QVERIFY(tor.clearTorPath());
        QCOMPARE(tor.status(), TorController::Status::NotConfigured);
        QVERIFY(tor.torExecutable().isEmpty());
    }

    void destructorStopsChild()
    {
        BrowserProfile profile;
        auto tor = std::make_unique<TorController>(&profile);
        QVERIFY(configureIdle(*tor));
        QVERIFY(tor->enable());
        QTRY_VERIFY(tor->processId() > 0);
        const qint64 pid = tor->processId();

        tor.reset();
        QVERIFY(!processAlive(pid));
    }
};

QTEST_GUILESS_MAIN(TestTorController)
#include "tst_torcontroller.moc"
