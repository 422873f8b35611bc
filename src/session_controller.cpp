#include "session_controller.h"

#include "device_config_client.h"
#include "flash_orchestrator.h"
#include "logging.h"

SessionController::SessionController(Options options,
                                     std::unique_ptr<PortEnumerator> enumerator,
                                     QObject* parent)
    : QObject(parent), options_(std::move(options)) {
  qRegisterMetaType<OperationResult>();
  qRegisterMetaType<FirmwareVersion>();
  qRegisterMetaType<QVector<FirmwareVersion>>();

  if (options_.firmwareRoot.trimmed().isEmpty()) {
    options_.firmwareRoot = FirmwareCatalog::defaultRootDir();
  }

  registry_ = new PortRegistry(std::move(enumerator), this);
  orchestrator_ = new FlashOrchestrator(this);
  if (!options_.toolPath.isEmpty()) {
    orchestrator_->setToolPath(options_.toolPath);
  }
  if (!options_.chip.isEmpty()) {
    orchestrator_->setChip(options_.chip);
  }
  if (options_.baudRate > 0) {
    orchestrator_->setBaudRate(options_.baudRate);
  }
  configClient_ = new DeviceConfigClient(orchestrator_, this);

  connect(registry_, &PortRegistry::portsChanged, this, &SessionController::applyPorts);

  connect(orchestrator_, &FlashOrchestrator::outputLine, this,
          &SessionController::operationOutput);
  connect(orchestrator_, &FlashOrchestrator::jobFinished, this,
          &SessionController::onJobFinished);
  connect(orchestrator_, &FlashOrchestrator::rejected, this, &SessionController::reject);

  connect(configClient_, &DeviceConfigClient::outputLine, this,
          &SessionController::operationOutput);
  connect(configClient_, &DeviceConfigClient::finished, this,
          &SessionController::onConfigFinished);
}

SessionController::~SessionController() {
  registry_->stop();
  configClient_->waitForExchange();
  // A running write is waited for, never killed.
  orchestrator_->requestStop();
  orchestrator_->waitForIdle();
}

void SessionController::start() {
  refreshVersions();
  registry_->start(options_.pollIntervalMs);
}

void SessionController::selectPort(const QString& port) {
  const QString id = SerialPortInfo::deviceIdFromDisplayName(port);
  if (id == state_.portId) {
    return;
  }
  state_.portId = id;
  qCDebug(log_session) << "Selected port" << id;
  emit selectionChanged(state_.portId, state_.versionName);
}

bool SessionController::selectVersion(const QString& name) {
  if (name.isEmpty()) {
    state_.versionName.clear();
    state_.files.clear();
    emit selectionChanged(state_.portId, state_.versionName);
    return true;
  }

  bool known = false;
  for (const FirmwareVersion& v : state_.versions) {
    if (v.name == name) {
      known = true;
      break;
    }
  }
  if (!known) {
    // The directory may have appeared since the last scan.
    refreshVersions();
    for (const FirmwareVersion& v : state_.versions) {
      if (v.name == name) {
        known = true;
        break;
      }
    }
  }
  if (!known) {
    return false;
  }

  state_.versionName = name;
  resolveCurrentFiles();
  qCDebug(log_session) << "Selected version" << name << "with" << state_.files.size()
                       << "of" << FirmwareFileSet::requiredRoles().size() << "files";
  emit selectionChanged(state_.portId, state_.versionName);
  return true;
}

bool SessionController::startConfigure(const QString& name, const QString& id) {
  if (isBusy()) {
    reject(QStringLiteral("An operation is already running."));
    return false;
  }
  if (state_.portId.isEmpty()) {
    reject(QStringLiteral("Please select a COM port."));
    return false;
  }

  DeviceConfigClient::Request request;
  request.portPath = state_.portId;
  request.baudRate = orchestrator_->baudRate();
  request.signalId = id;
  request.signalName = name;
  const QString invalid = DeviceConfigClient::validate(request);
  if (!invalid.isEmpty()) {
    reject(invalid);
    return false;
  }

  beginOperation(Operation::Configure, QStringLiteral("Configuring device..."));
  if (!configClient_->configure(request)) {
    // finished() was already delivered and ended the operation.
    return false;
  }
  return true;
}

bool SessionController::startFlash() {
  if (isBusy()) {
    reject(QStringLiteral("An operation is already running."));
    return false;
  }
  if (state_.portId.isEmpty() && state_.versionName.isEmpty()) {
    reject(QStringLiteral("A COM port and firmware version must be selected."));
    return false;
  }
  if (state_.portId.isEmpty()) {
    reject(QStringLiteral("Please select a COM port."));
    return false;
  }
  if (state_.versionName.isEmpty()) {
    reject(QStringLiteral("Please select a firmware version."));
    return false;
  }

  resolveCurrentFiles();
  if (!state_.files.isComplete()) {
    reject(QString("Missing required files in %1 folder: %2")
               .arg(state_.versionName,
                    FirmwareCatalog::roleNames(state_.files.missingRoles()).join(", ")));
    return false;
  }

  emit outputCleared();
  beginOperation(Operation::Flash, QStringLiteral("Flashing in progress..."));
  if (!orchestrator_->writeFlash(state_.portId, state_.files)) {
    endOperation(OperationResult::failure(OperationResult::Kind::Validation,
                                          QStringLiteral("The flashing tool is busy.")),
                 QStringLiteral("Ready"));
    return false;
  }
  return true;
}

void SessionController::requestRefresh() {
  registry_->refresh();
  refreshVersions();
}

void SessionController::requestStop() {
  if (!isBusy()) {
    return;
  }
  const bool exchanging =
      state_.operation == Operation::Configure && !orchestrator_->isBusy();
  configClient_->requestStop();
  orchestrator_->requestStop();
  if (exchanging) {
    emit statusChanged(
        QStringLiteral("Stop requested; the serial exchange will finish, but the chip-id check "
                       "will be skipped."));
  } else if (orchestrator_->isBusy()) {
    emit statusChanged(
        QStringLiteral("Stop requested; the running operation cannot be interrupted and will "
                       "finish on its own."));
  }
}

QString SessionController::currentPort() const {
  return state_.portId;
}

QString SessionController::currentVersion() const {
  return state_.versionName;
}

FirmwareFileSet SessionController::currentFiles() const {
  return state_.files;
}

QVector<SerialPortInfo> SessionController::ports() const {
  return registry_->ports();
}

QVector<FirmwareVersion> SessionController::versions() const {
  return state_.versions;
}

QString SessionController::firmwareRoot() const {
  return options_.firmwareRoot;
}

SessionController::Operation SessionController::currentOperation() const {
  return state_.operation;
}

bool SessionController::isBusy() const {
  return state_.operation != Operation::None;
}

FlashOrchestrator* SessionController::orchestrator() const {
  return orchestrator_;
}

DeviceConfigClient* SessionController::configClient() const {
  return configClient_;
}

PortRegistry* SessionController::portRegistry() const {
  return registry_;
}

void SessionController::refreshVersions() {
  state_.versions = FirmwareCatalog::listVersions(options_.firmwareRoot);

  const QString previous = state_.versionName;
  bool stillThere = false;
  for (const FirmwareVersion& v : state_.versions) {
    if (v.name == previous) {
      stillThere = true;
      break;
    }
  }
  if (!stillThere) {
    state_.versionName = state_.versions.isEmpty() ? QString{} : state_.versions.front().name;
  }
  resolveCurrentFiles();

  emit versionsChanged(state_.versions);
  if (state_.versionName != previous) {
    emit selectionChanged(state_.portId, state_.versionName);
  }
}

void SessionController::resolveCurrentFiles() {
  state_.files.clear();
  if (state_.versionName.isEmpty()) {
    return;
  }
  for (const FirmwareVersion& v : state_.versions) {
    if (v.name == state_.versionName) {
      state_.files = FirmwareCatalog::resolveFiles(v);
      return;
    }
  }
}

void SessionController::applyPorts(const QVector<SerialPortInfo>& ports) {
  const QString previous = state_.portId;
  bool stillThere = false;
  for (const SerialPortInfo& p : ports) {
    if (p.deviceId == previous) {
      stillThere = true;
      break;
    }
  }
  // The port in use may drop off the bus during a reset; keep it until done.
  if (!stillThere && !isBusy()) {
    state_.portId = ports.isEmpty() ? QString{} : ports.front().deviceId;
  }

  emit portsChanged(ports);
  if (state_.portId != previous) {
    emit selectionChanged(state_.portId, state_.versionName);
  }
}

void SessionController::beginOperation(Operation operation, const QString& status) {
  state_.operation = operation;
  emit busyChanged(true);
  emit statusChanged(status);
}

void SessionController::endOperation(const OperationResult& result, const QString& status) {
  state_.operation = Operation::None;
  emit statusChanged(status);
  emit operationResult(result);
  emit operationFinished(result.ok() ? 0 : (result.exitCode != 0 ? result.exitCode : 1));
  emit busyChanged(false);

  // A reset device may re-enumerate, and the firmware folder may have changed.
  requestRefresh();
}

void SessionController::reject(const QString& message) {
  qCInfo(log_session).noquote() << "Rejected:" << message;
  emit validationError(message);
}

void SessionController::onJobFinished(FlashJob* job, int exitCode) {
  if (!job || job->mode() != FlashJob::Mode::Write || state_.operation != Operation::Flash) {
    return;
  }
  if (exitCode == 0) {
    endOperation(OperationResult::success(), QStringLiteral("Flashing completed successfully!"));
    return;
  }
  endOperation(OperationResult::failure(OperationResult::Kind::ExternalTool,
                                        QStringLiteral("Flashing failed. Check the output for details."),
                                        exitCode),
               QStringLiteral("Flashing failed!"));
}

void SessionController::onConfigFinished(const OperationResult& result) {
  if (state_.operation != Operation::Configure) {
    return;
  }
  if (result.ok()) {
    endOperation(result, QStringLiteral("Name and ID set successfully!"));
    return;
  }
  endOperation(result, result.message);
}
