#include "flash_orchestrator.h"

#include "logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

FlashJob::FlashJob(Mode mode, QString portPath, QString program, QStringList arguments,
                   QObject* parent)
    : QObject(parent),
      mode_(mode),
      portPath_(std::move(portPath)),
      program_(std::move(program)),
      arguments_(std::move(arguments)) {
  process_ = new QProcess(this);
  process_->setProcessChannelMode(QProcess::MergedChannels);

  connect(process_, &QProcess::readyReadStandardOutput, this, [this] {
    consumeText(QString::fromLocal8Bit(process_->readAllStandardOutput()));
  });
  connect(process_, &QProcess::finished, this,
          [this](int exitCode, QProcess::ExitStatus exitStatus) {
            flushLineBuffer();
            if (exitStatus == QProcess::CrashExit) {
              emit outputLine(QStringLiteral("%1 terminated unexpectedly.")
                                  .arg(QFileInfo(program_).fileName()));
              finish(exitCode != 0 ? exitCode : -1);
              return;
            }
            finish(exitCode);
          });
  connect(process_, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
    if (error == QProcess::FailedToStart) {
      emit outputLine(tr("Failed to start %1. Please ensure esptool is installed and in your PATH.")
                          .arg(program_));
      finish(-1);
    }
  });
}

FlashJob::~FlashJob() {
  // QProcess kills its child on destruction; let a write finish first.
  if (process_->state() != QProcess::NotRunning) {
    qCWarning(log_flash) << "Flash job destroyed while running; waiting for the tool to exit";
    process_->waitForFinished(-1);
  }
}

FlashJob::Mode FlashJob::mode() const {
  return mode_;
}

FlashJob::State FlashJob::state() const {
  return state_;
}

QString FlashJob::portPath() const {
  return portPath_;
}

QString FlashJob::program() const {
  return program_;
}

QStringList FlashJob::arguments() const {
  return arguments_;
}

int FlashJob::exitCode() const {
  return exitCode_;
}

bool FlashJob::isRunning() const {
  return state_ == State::Running;
}

bool FlashJob::isFinished() const {
  return state_ == State::Succeeded || state_ == State::Failed;
}

void FlashJob::start() {
  if (state_ != State::Idle) {
    return;
  }
  state_ = State::Running;
  lineBuffer_.clear();
  emit outputLine(QString("Running: %1 %2").arg(program_, arguments_.join(' ')));
  emit started();
  process_->start(program_, arguments_);
}

void FlashJob::requestStop() {
  if (stopRequested_) {
    return;
  }
  stopRequested_ = true;
  if (isRunning()) {
    qCInfo(log_flash) << "Stop requested; the running" << program_
                      << "invocation will be allowed to finish";
  }
}

bool FlashJob::stopRequested() const {
  return stopRequested_;
}

bool FlashJob::waitForFinished(int msecs) {
  if (!isRunning()) {
    return true;
  }
  if (process_->state() == QProcess::NotRunning) {
    return !isRunning();
  }
  process_->waitForFinished(msecs);
  return !isRunning();
}

QString FlashJob::stateName(State state) {
  switch (state) {
    case State::Idle:
      return QStringLiteral("idle");
    case State::Running:
      return QStringLiteral("running");
    case State::Succeeded:
      return QStringLiteral("succeeded");
    case State::Failed:
      return QStringLiteral("failed");
  }
  return {};
}

void FlashJob::consumeText(const QString& chunk) {
  lineBuffer_.append(chunk);
  // esptool redraws progress with '\r'; each redraw is its own line.
  while (true) {
    int idx = -1;
    for (int i = 0; i < lineBuffer_.size(); ++i) {
      const QChar c = lineBuffer_.at(i);
      if (c == QLatin1Char('\n') || c == QLatin1Char('\r')) {
        idx = i;
        break;
      }
    }
    if (idx < 0) {
      break;
    }
    const QString line = lineBuffer_.left(idx).trimmed();
    lineBuffer_.remove(0, idx + 1);
    if (!line.isEmpty()) {
      emit outputLine(line);
    }
  }
}

void FlashJob::flushLineBuffer() {
  const QString rest = lineBuffer_.trimmed();
  lineBuffer_.clear();
  if (!rest.isEmpty()) {
    emit outputLine(rest);
  }
}

void FlashJob::finish(int exitCode) {
  if (state_ != State::Running) {
    return;
  }
  exitCode_ = exitCode;
  state_ = exitCode == 0 ? State::Succeeded : State::Failed;
  emit finished(exitCode);
}

const QVector<FlashOrchestrator::Region>& FlashOrchestrator::flashLayout() {
  static const QVector<Region> kLayout = {
      {0x0, FirmwareRole::Bootloader},
      {0x8000, FirmwareRole::PartitionTable},
      {0xE000, FirmwareRole::OtaSelector},
      {0x10000, FirmwareRole::Application},
  };
  return kLayout;
}

QString FlashOrchestrator::formatAddress(quint32 address) {
  return QStringLiteral("0x") + QString::number(address, 16);
}

QStringList FlashOrchestrator::writeFlashArguments(const QString& chip,
                                                   const QString& portPath,
                                                   int baudRate,
                                                   const FirmwareFileSet& files) {
  QStringList args = {
      QStringLiteral("--chip"),       chip,
      QStringLiteral("--port"),       portPath,
      QStringLiteral("--baud"),       QString::number(baudRate),
      QStringLiteral("--before"),     QStringLiteral("default-reset"),
      QStringLiteral("--after"),      QStringLiteral("hard-reset"),
      QStringLiteral("write_flash"),
      QStringLiteral("--flash-mode"), QStringLiteral("keep"),
      QStringLiteral("--flash-freq"), QStringLiteral("keep"),
      QStringLiteral("--flash-size"), QStringLiteral("keep"),
      QStringLiteral("-z"),
  };
  for (const Region& region : flashLayout()) {
    args << formatAddress(region.address) << files.path(region.role);
  }
  return args;
}

QStringList FlashOrchestrator::chipIdArguments(const QString& chip,
                                               const QString& portPath,
                                               int baudRate) {
  return {
      QStringLiteral("--chip"),  chip,
      QStringLiteral("--port"),  portPath,
      QStringLiteral("--baud"),  QString::number(baudRate),
      QStringLiteral("--after"), QStringLiteral("hard-reset"),
      QStringLiteral("chip-id"),
  };
}

FlashOrchestrator::FlashOrchestrator(QObject* parent) : QObject(parent) {
  toolPath_ = resolveDefaultToolPath();
}

FlashOrchestrator::~FlashOrchestrator() {
  waitForIdle();
}

void FlashOrchestrator::setToolPath(QString path) {
  toolPath_ = std::move(path);
}

QString FlashOrchestrator::toolPath() const {
  return toolPath_;
}

void FlashOrchestrator::setChip(QString chip) {
  chip_ = std::move(chip);
}

QString FlashOrchestrator::chip() const {
  return chip_;
}

void FlashOrchestrator::setBaudRate(int baudRate) {
  baudRate_ = baudRate;
}

int FlashOrchestrator::baudRate() const {
  return baudRate_;
}

FlashJob* FlashOrchestrator::writeFlash(const QString& portPath, const FirmwareFileSet& files) {
  if (!files.isComplete()) {
    emit rejected(QString("Missing firmware files: %1")
                      .arg(FirmwareCatalog::roleNames(files.missingRoles()).join(", ")));
    return nullptr;
  }
  return launch(FlashJob::Mode::Write, portPath,
                writeFlashArguments(chip_, portPath, baudRate_, files));
}

FlashJob* FlashOrchestrator::queryChipId(const QString& portPath, int baudRate) {
  return launch(FlashJob::Mode::ConfigureCheck, portPath,
                chipIdArguments(chip_, portPath, baudRate > 0 ? baudRate : baudRate_));
}

FlashJob* FlashOrchestrator::launch(FlashJob::Mode mode,
                                    const QString& portPath,
                                    QStringList arguments) {
  if (isBusy()) {
    emit rejected(QStringLiteral("A flashing operation is already running."));
    return nullptr;
  }
  if (portPath.trimmed().isEmpty()) {
    emit rejected(QStringLiteral("No serial port selected."));
    return nullptr;
  }
  if (toolPath_.trimmed().isEmpty()) {
    emit rejected(QStringLiteral("Flashing tool path is not configured."));
    return nullptr;
  }

  const QFileInfo toolInfo(toolPath_);
  const QString program = toolInfo.exists() ? toolInfo.absoluteFilePath() : toolPath_;

  auto* job = new FlashJob(mode, portPath, program, std::move(arguments), this);
  active_ = job;

  connect(job, &FlashJob::outputLine, this, &FlashOrchestrator::outputLine);
  connect(job, &FlashJob::finished, this, [this, job](int exitCode) {
    if (active_ == job) {
      active_.clear();
    }
    qCInfo(log_flash).noquote() << QString("Job on %1 %2 (exit %3)")
                                       .arg(job->portPath(), FlashJob::stateName(job->state()))
                                       .arg(exitCode);
    emit jobFinished(job, exitCode);
    job->deleteLater();
  });

  qCInfo(log_flash).noquote() << QString("Starting %1 on %2")
                                     .arg(mode == FlashJob::Mode::Write ? "write_flash" : "chip-id",
                                          portPath);
  qCDebug(log_flash) << "Arguments:" << job->arguments();
  emit jobStarted(job);
  job->start();
  return job;
}

bool FlashOrchestrator::isBusy() const {
  return !active_.isNull() && active_->isRunning();
}

FlashJob* FlashOrchestrator::activeJob() const {
  return active_.data();
}

void FlashOrchestrator::requestStop() {
  if (active_) {
    active_->requestStop();
  }
}

bool FlashOrchestrator::waitForIdle(int msecs) {
  if (!active_) {
    return true;
  }
  return active_->waitForFinished(msecs);
}

QString FlashOrchestrator::resolveDefaultToolPath() {
  const QString env = qEnvironmentVariable("SIGNAL_FLASHER_ESPTOOL");
  if (!env.isEmpty()) {
    return env;
  }

  const QString appDir = QCoreApplication::applicationDirPath();
  const QStringList bundled = {
      QDir(appDir).absoluteFilePath(QStringLiteral("esptool")),
      QDir(appDir).absoluteFilePath(QStringLiteral("esptool.exe")),
  };
  for (const QString& candidate : bundled) {
    const QFileInfo fi(candidate);
    if (fi.exists() && fi.isFile() && fi.isExecutable()) {
      return fi.absoluteFilePath();
    }
  }

  for (const QString& name : {QStringLiteral("esptool"), QStringLiteral("esptool.py")}) {
    const QString found = QStandardPaths::findExecutable(name);
    if (!found.isEmpty()) {
      return found;
    }
  }
  return QStringLiteral("esptool");
}
