#ifndef PORTPROBE_H
#define PORTPROBE_H

#include <QObject>
#include <QTcpSocket>
#include <QTimer>
#include <QElapsedTimer>
#include <QList>


// Polls a set of localhost ports until each accepts a TCP connection or the
// deadline passes. Runs on the event loop; nothing here blocks.
class PortProbe : public QObject
{
    Q_OBJECT
public:
    explicit PortProbe(QObject *parent = nullptr);

    void start(const QList<quint16> &ports, int intervalMs, int timeoutMs);
    void cancel();

    bool isActive() const { return m_active; }

signals:
    void portReachable(quint16 port);
    void ready();
    void timedOut(quint16 port);

private slots:
    void attempt();
    void onConnected();
    void onSocketError(QAbstractSocket::SocketError err);
    void onAttemptTimeout();

private:
    void scheduleRetry(int delayMs);
    void finish();

    QTcpSocket     m_socket;
    QTimer         m_retryTimer;
    QTimer         m_attemptTimer;
    QElapsedTimer  m_clock;
    QList<quint16> m_pending;
    int            m_intervalMs = 250;
    int            m_timeoutMs  = 60000;
    bool           m_active     = false;
};

#endif // PORTPROBE_H
