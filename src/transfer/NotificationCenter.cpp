#include "transfer/NotificationCenter.h"

#include <QDebug>
#include <QThread>

QString toString(NotificationStatus status)
{
    switch (status) {
        case NotificationStatus::Success: return QStringLiteral("success");
        case NotificationStatus::Error:   return QStringLiteral("error");
        case NotificationStatus::Info:    return QStringLiteral("info");
        case NotificationStatus::Warning: return QStringLiteral("warning");
    }
    return QString();
}

NotificationCenter::NotificationCenter(int durationMs, QObject* parent)
    : QObject(parent)
    , m_durationMs(durationMs > 0 ? durationMs : DefaultDurationMs)
{
    m_dismissTimer.setSingleShot(true);
    connect(&m_dismissTimer, &QTimer::timeout, this, &NotificationCenter::clear);
}

void NotificationCenter::post(const Notification& notification)
{
    if (QThread::currentThread() == thread()) {
        show(notification);
        return;
    }
    QMetaObject::invokeMethod(this, [this, notification]() { show(notification); },
                              Qt::QueuedConnection);
}

void NotificationCenter::post(NotificationStatus status, const QString& title, const QString& message)
{
    post(Notification{status, title, message});
}

void NotificationCenter::show(const Notification& notification)
{
    qDebug() << "Notification:" << toString(notification.status) << notification.title
             << "-" << notification.message;

    m_current = notification;
    m_dismissTimer.start(m_durationMs);
    emit posted(notification);
}

void NotificationCenter::clear()
{
    m_dismissTimer.stop();
    if (!m_current)
        return;
    m_current.reset();
    emit dismissed();
}
