#include "port_registry.h"

#include "logging.h"

#include <QSerialPortInfo>
#include <QThread>
#include <QTimer>

#include <algorithm>

namespace {
constexpr auto kDisplaySeparator = " - ";

void sortByDeviceId(QVector<SerialPortInfo>* ports) {
  std::sort(ports->begin(), ports->end(), [](const SerialPortInfo& a, const SerialPortInfo& b) {
    if (a.deviceId != b.deviceId) {
      return a.deviceId < b.deviceId;
    }
    return a.description < b.description;
  });
}
}  // namespace

QString SerialPortInfo::displayName() const {
  return deviceId + QLatin1String(kDisplaySeparator) + description;
}

QString SerialPortInfo::deviceIdFromDisplayName(const QString& displayName) {
  const int idx = displayName.indexOf(QLatin1String(kDisplaySeparator));
  if (idx < 0) {
    return displayName.trimmed();
  }
  return displayName.left(idx).trimmed();
}

bool SystemPortEnumerator::enumerate(QVector<SerialPortInfo>* out, QString* error) {
  if (!out) {
    if (error) {
      *error = QStringLiteral("No output buffer for port enumeration.");
    }
    return false;
  }
  out->clear();
  const QList<QSerialPortInfo> infos = QSerialPortInfo::availablePorts();
  for (const QSerialPortInfo& info : infos) {
    SerialPortInfo port;
#if defined(Q_OS_WIN)
    port.deviceId = info.portName();
#else
    port.deviceId = info.systemLocation();
#endif
    port.description = info.description().trimmed();
    if (port.description.isEmpty()) {
      port.description = QStringLiteral("n/a");
    }
    out->push_back(std::move(port));
  }
  return true;
}

PortMonitor::PortMonitor(std::unique_ptr<PortEnumerator> enumerator, QObject* parent)
    : QObject(parent), enumerator_(std::move(enumerator)) {}

PortMonitor::~PortMonitor() = default;

bool PortMonitor::query(QVector<SerialPortInfo>* ports) {
  if (!enumerator_) {
    return false;
  }
  QString error;
  if (!enumerator_->enumerate(ports, &error)) {
    qCWarning(log_ports) << "Port enumeration failed:" << error;
    ports->clear();
    return false;
  }
  sortByDeviceId(ports);
  return true;
}

QVector<SerialPortInfo> PortMonitor::poll() {
  QVector<SerialPortInfo> ports;
  query(&ports);
  return ports;
}

bool PortMonitor::changedSince(const QVector<SerialPortInfo>& previous,
                               const QVector<SerialPortInfo>& current) {
  if (previous.size() != current.size()) {
    return true;
  }
  QVector<SerialPortInfo> a = previous;
  QVector<SerialPortInfo> b = current;
  sortByDeviceId(&a);
  sortByDeviceId(&b);
  return a != b;
}

QVector<SerialPortInfo> PortMonitor::baseline() const {
  return previous_;
}

void PortMonitor::start(int intervalMs) {
  if (!timer_) {
    timer_ = new QTimer(this);
    connect(timer_, &QTimer::timeout, this, &PortMonitor::pollOnce);
  }
  timer_->setInterval(intervalMs);
  timer_->start();
  pollOnce();
}

void PortMonitor::stop() {
  if (timer_) {
    timer_->stop();
  }
}

void PortMonitor::pollOnce() {
  // A failed query keeps the previous baseline; the next cycle retries.
  QVector<SerialPortInfo> current;
  if (!query(&current)) {
    return;
  }

  if (!changedSince(previous_, current)) {
    return;
  }
  qCDebug(log_ports) << "Port set changed:" << previous_.size() << "->" << current.size();
  previous_ = current;
  emit portsChanged(current);
}

PortRegistry::PortRegistry(std::unique_ptr<PortEnumerator> enumerator, QObject* parent)
    : QObject(parent) {
  qRegisterMetaType<SerialPortInfo>();
  qRegisterMetaType<QVector<SerialPortInfo>>();

  thread_ = new QThread(this);
  thread_->setObjectName(QStringLiteral("port-registry"));
  monitor_ = new PortMonitor(std::move(enumerator));
  monitor_->moveToThread(thread_);
  connect(thread_, &QThread::finished, monitor_, &QObject::deleteLater);

  connect(monitor_, &PortMonitor::portsChanged, this, [this](QVector<SerialPortInfo> ports) {
    ports_ = std::move(ports);
    emit portsChanged(ports_);
  });
}

PortRegistry::~PortRegistry() {
  if (thread_->isRunning()) {
    stop();
    return;
  }
  // Never started: nothing will deliver the deferred delete.
  delete monitor_;
  monitor_ = nullptr;
}

void PortRegistry::start(int intervalMs) {
  if (!monitor_ || thread_->isRunning()) {
    return;
  }
  thread_->start();
  PortMonitor* monitor = monitor_;
  QMetaObject::invokeMethod(
      monitor, [monitor, intervalMs] { monitor->start(intervalMs); }, Qt::QueuedConnection);
  qCDebug(log_ports) << "Port polling started, interval" << intervalMs << "ms";
}

void PortRegistry::stop() {
  if (!thread_->isRunning()) {
    return;
  }
  thread_->quit();
  thread_->wait();
  monitor_ = nullptr;
  qCDebug(log_ports) << "Port polling stopped";
}

bool PortRegistry::isRunning() const {
  return thread_->isRunning();
}

void PortRegistry::refresh() {
  if (!monitor_) {
    return;
  }
  QMetaObject::invokeMethod(monitor_, &PortMonitor::pollOnce, Qt::QueuedConnection);
}

QVector<SerialPortInfo> PortRegistry::ports() const {
  return ports_;
}

bool PortRegistry::contains(const QString& deviceId) const {
  for (const SerialPortInfo& port : ports_) {
    if (port.deviceId == deviceId) {
      return true;
    }
  }
  return false;
}
