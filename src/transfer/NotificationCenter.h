#ifndef NOTIFICATIONCENTER_H
#define NOTIFICATIONCENTER_H

#include <QObject>
#include <QString>
#include <QTimer>

#include <optional>

enum class NotificationStatus { Success, Error, Info, Warning };

struct Notification {
    NotificationStatus status = NotificationStatus::Info;
    QString title;
    QString message;
};

Q_DECLARE_METATYPE(Notification)

QString toString(NotificationStatus status);

// Holds the single transient notification shown to the user.
// A new post replaces the current one and restarts the dismiss timer.
// post() may be called from any thread; state changes happen on the
// thread owning this object.
class NotificationCenter : public QObject {
    Q_OBJECT

public:
    static constexpr int DefaultDurationMs = 3000;

    explicit NotificationCenter(int durationMs = DefaultDurationMs, QObject* parent = nullptr);

    void post(const Notification& notification);
    void post(NotificationStatus status, const QString& title, const QString& message);
    void clear();

    std::optional<Notification> current() const { return m_current; }
    int durationMs() const { return m_durationMs; }

signals:
    void posted(const Notification& notification);
    void dismissed();

private:
    void show(const Notification& notification);

    int m_durationMs;
    QTimer m_dismissTimer;
    std::optional<Notification> m_current;
};

#endif // NOTIFICATIONCENTER_H
