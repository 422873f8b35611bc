#pragma once

#include <QMetaType>
#include <QObject>
#include <QString>
#include <QVector>

#include <memory>

class QThread;
class QTimer;

struct SerialPortInfo final {
  QString deviceId;
  QString description;

  // "<device> - <description>", the form shown in port pickers.
  QString displayName() const;
  static QString deviceIdFromDisplayName(const QString& displayName);

  bool operator==(const SerialPortInfo& other) const {
    return deviceId == other.deviceId && description == other.description;
  }
  bool operator!=(const SerialPortInfo& other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(SerialPortInfo)
Q_DECLARE_METATYPE(QVector<SerialPortInfo>)

class PortEnumerator {
 public:
  virtual ~PortEnumerator() = default;

  // Fills |out| with the ports the OS currently reports. Returns false and
  // sets |error| when the query itself failed.
  virtual bool enumerate(QVector<SerialPortInfo>* out, QString* error) = 0;
};

class SystemPortEnumerator final : public PortEnumerator {
 public:
  bool enumerate(QVector<SerialPortInfo>* out, QString* error) override;
};

// Polls a PortEnumerator and reports when the port set changes. Lives on the
// registry thread and is the only owner of its baseline snapshot.
class PortMonitor final : public QObject {
  Q_OBJECT

 public:
  static constexpr int kPollIntervalMs = 1000;

  explicit PortMonitor(std::unique_ptr<PortEnumerator> enumerator,
                       QObject* parent = nullptr);
  ~PortMonitor() override;

  // Current port set sorted by device id. A failed query counts as no ports.
  QVector<SerialPortInfo> poll();
  static bool changedSince(const QVector<SerialPortInfo>& previous,
                           const QVector<SerialPortInfo>& current);

  QVector<SerialPortInfo> baseline() const;

 public slots:
  void start(int intervalMs = kPollIntervalMs);
  void stop();
  void pollOnce();

 signals:
  void portsChanged(QVector<SerialPortInfo> ports);

 private:
  std::unique_ptr<PortEnumerator> enumerator_;
  QVector<SerialPortInfo> previous_;
  QTimer* timer_ = nullptr;

  bool query(QVector<SerialPortInfo>* ports);
};

// Control-side handle: runs a PortMonitor on a dedicated thread and keeps the
// last snapshot it delivered.
class PortRegistry final : public QObject {
  Q_OBJECT

 public:
  explicit PortRegistry(std::unique_ptr<PortEnumerator> enumerator,
                        QObject* parent = nullptr);
  ~PortRegistry() override;

  void start(int intervalMs = PortMonitor::kPollIntervalMs);
  void stop();
  bool isRunning() const;

  // Asks the monitor for an immediate poll; the result arrives through
  // portsChanged() like any other cycle.
  void refresh();

  QVector<SerialPortInfo> ports() const;
  bool contains(const QString& deviceId) const;

 signals:
  void portsChanged(QVector<SerialPortInfo> ports);

 private:
  QThread* thread_ = nullptr;
  PortMonitor* monitor_ = nullptr;
  QVector<SerialPortInfo> ports_;
};
