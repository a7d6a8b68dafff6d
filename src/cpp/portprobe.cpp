#include "portprobe.h"

#include <QHostAddress>
#include <QNetworkProxy>
#include <QDebug>


PortProbe::PortProbe(QObject *parent)
    : QObject(parent)
{
    // probes go straight to localhost, never through the browser's proxy
    m_socket.setProxy(QNetworkProxy::NoProxy);

    m_retryTimer.setSingleShot(true);
    m_attemptTimer.setSingleShot(true);

    connect(&m_retryTimer,   &QTimer::timeout,           this, &PortProbe::attempt);
    connect(&m_attemptTimer, &QTimer::timeout,           this, &PortProbe::onAttemptTimeout);
    connect(&m_socket,       &QTcpSocket::connected,     this, &PortProbe::onConnected);
    connect(&m_socket,       &QTcpSocket::errorOccurred, this, &PortProbe::onSocketError);
}

void PortProbe::start(const QList<quint16> &ports, int intervalMs, int timeoutMs)
{
    cancel();

    m_pending    = ports;
    m_intervalMs = qMax(10, intervalMs);
    m_timeoutMs  = qMax(m_intervalMs, timeoutMs);
    m_active     = true;
    m_clock.start();

    scheduleRetry(0);
}

void PortProbe::cancel()
{
    if (!m_active) return;
    m_active = false;
    m_retryTimer.stop();
    m_attemptTimer.stop();
    m_socket.abort();
    m_pending.clear();
}

// ──────────────────────────────────────────────────────────────────────────────
void PortProbe::attempt()
{
    if (!m_active) return;

    if (m_pending.isEmpty()) {
        finish();
        emit ready();
        return;
    }

    if (m_clock.hasExpired(m_timeoutMs)) {
        const quint16 port = m_pending.first();
        qWarning() << "[PortProbe] port" << port << "not reachable after" << m_timeoutMs << "ms";
        finish();
        emit timedOut(port);
        return;
    }

    m_socket.abort();
    m_socket.connectToHost(QHostAddress::LocalHost, m_pending.first());
    m_attemptTimer.start(m_intervalMs);
}

void PortProbe::onConnected()
{
    if (!m_active || m_pending.isEmpty()) return;

    m_attemptTimer.stop();
    const quint16 port = m_pending.takeFirst();
    m_socket.abort();

    qDebug() << "[PortProbe] port" << port << "is accepting connections";
    emit portReachable(port);

    // remaining ports are probed right away, from a fresh event loop pass
    scheduleRetry(0);
}

void PortProbe::onSocketError(QAbstractSocket::SocketError)
{
    if (!m_active || m_retryTimer.isActive()) return;

    m_attemptTimer.stop();
    m_socket.abort();
    scheduleRetry(m_intervalMs);
}

void PortProbe::onAttemptTimeout()
{
    if (!m_active) return;

    m_socket.abort();
    scheduleRetry(0);
}

void PortProbe::scheduleRetry(int delayMs)
{
    m_retryTimer.start(delayMs);
}

void PortProbe::finish()
{
    m_active = false;
    m_retryTimer.stop();
    m_attemptTimer.stop();
    m_socket.abort();
    m_pending.clear();
}
