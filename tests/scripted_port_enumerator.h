#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QVector>

#include <memory>
#include <optional>

#include "port_registry.h"

// Replays a fixed sequence of enumeration results; the last entry repeats.
// std::nullopt stands for a failed query. The script is shared so a test can
// change it while the monitor owns the enumerator.
class ScriptedPortEnumerator final : public PortEnumerator {
 public:
  struct Script final {
    QMutex mutex;
    QVector<std::optional<QVector<SerialPortInfo>>> steps;
    int calls = 0;

    void push(std::optional<QVector<SerialPortInfo>> step) {
      QMutexLocker lock(&mutex);
      steps.append(std::move(step));
    }

    void replace(QVector<SerialPortInfo> ports) {
      QMutexLocker lock(&mutex);
      steps.clear();
      steps.append(std::move(ports));
    }

    int callCount() {
      QMutexLocker lock(&mutex);
      return calls;
    }
  };

  explicit ScriptedPortEnumerator(std::shared_ptr<Script> script) : script_(std::move(script)) {}

  bool enumerate(QVector<SerialPortInfo>* out, QString* error) override {
    QMutexLocker lock(&script_->mutex);
    ++script_->calls;
    if (script_->steps.isEmpty()) {
      out->clear();
      return true;
    }
    const std::optional<QVector<SerialPortInfo>> step =
        script_->steps.size() > 1 ? script_->steps.takeFirst() : script_->steps.front();
    if (!step) {
      if (error) {
        *error = QStringLiteral("enumeration failed");
      }
      return false;
    }
    *out = *step;
    return true;
  }

 private:
  std::shared_ptr<Script> script_;
};

inline SerialPortInfo makePort(const QString& id, const QString& description) {
  SerialPortInfo info;
  info.deviceId = id;
  info.description = description;
  return info;
}
