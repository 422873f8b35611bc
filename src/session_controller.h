#pragma once

#include <QObject>
#include <QString>
#include <QVector>

#include <memory>

#include "firmware_catalog.h"
#include "operation_result.h"
#include "port_registry.h"

class DeviceConfigClient;
class FlashJob;
class FlashOrchestrator;

// Owns the selection state and runs configure/flash on behalf of a
// presentation layer. All public methods are called on the control thread;
// results come back as signals on the same thread.
class SessionController final : public QObject {
  Q_OBJECT

 public:
  struct Options final {
    QString firmwareRoot;
    QString toolPath;  // empty: FlashOrchestrator::resolveDefaultToolPath()
    QString chip;
    int baudRate = 0;
    int pollIntervalMs = PortMonitor::kPollIntervalMs;
  };

  enum class Operation {
    None,
    Configure,
    Flash,
  };

  SessionController(Options options,
                    std::unique_ptr<PortEnumerator> enumerator,
                    QObject* parent = nullptr);
  ~SessionController() override;

  // Starts port polling and scans the firmware root once.
  void start();

  // Accepts either a device id or a "<device> - <description>" entry.
  void selectPort(const QString& port);
  // Returns false if |name| is not a version under the firmware root.
  bool selectVersion(const QString& name);

  bool startConfigure(const QString& name, const QString& id);
  bool startFlash();
  void requestRefresh();

  // Only prevents follow-up work. A flash already writing runs to completion.
  void requestStop();

  QString currentPort() const;
  QString currentVersion() const;
  FirmwareFileSet currentFiles() const;
  QVector<SerialPortInfo> ports() const;
  QVector<FirmwareVersion> versions() const;
  QString firmwareRoot() const;
  Operation currentOperation() const;
  bool isBusy() const;

  FlashOrchestrator* orchestrator() const;
  DeviceConfigClient* configClient() const;
  PortRegistry* portRegistry() const;

 signals:
  void portsChanged(QVector<SerialPortInfo> ports);
  void versionsChanged(QVector<FirmwareVersion> versions);
  void selectionChanged(QString port, QString version);
  void outputCleared();
  void operationOutput(QString line);
  void operationFinished(int exitStatus);
  void operationResult(OperationResult result);
  void validationError(QString message);
  void statusChanged(QString status);
  void busyChanged(bool busy);

 private:
  struct SessionState final {
    QString portId;
    QString versionName;
    FirmwareFileSet files;
    QVector<FirmwareVersion> versions;
    Operation operation = Operation::None;
  };

  Options options_;
  SessionState state_;
  PortRegistry* registry_ = nullptr;
  FlashOrchestrator* orchestrator_ = nullptr;
  DeviceConfigClient* configClient_ = nullptr;

  void refreshVersions();
  void resolveCurrentFiles();
  void applyPorts(const QVector<SerialPortInfo>& ports);
  void beginOperation(Operation operation, const QString& status);
  void endOperation(const OperationResult& result, const QString& status);
  void reject(const QString& message);

  void onJobFinished(FlashJob* job, int exitCode);
  void onConfigFinished(const OperationResult& result);
};
