#include "device_config_client.h"

#include "flash_orchestrator.h"
#include "logging.h"
#include "serial_port.h"

#include <QRegularExpression>
#include <QThread>

namespace {
constexpr auto kSignalIdField = "signal_id";
constexpr auto kSignalNameField = "signal_name";
}  // namespace

QString DeviceConfigClient::validate(const Request& request) {
  if (request.portPath.trimmed().isEmpty()) {
    return QStringLiteral("Please select a COM port.");
  }
  if (request.signalId.isEmpty()) {
    return QStringLiteral("Signal ID is empty.");
  }
  if (request.signalId.size() > kMaxIdLength) {
    return QStringLiteral("Signal ID must be at most %1 characters.").arg(kMaxIdLength);
  }
  static const QRegularExpression kDigits(QStringLiteral("^[0-9]+$"));
  if (!kDigits.match(request.signalId).hasMatch()) {
    return QStringLiteral("Signal ID must be numeric.");
  }
  if (request.signalName.trimmed().isEmpty()) {
    return QStringLiteral("Signal name is empty.");
  }
  if (request.signalName.contains(QLatin1Char('\n')) ||
      request.signalName.contains(QLatin1Char('\r'))) {
    return QStringLiteral("Signal name must be a single line.");
  }
  return {};
}

QByteArray DeviceConfigClient::commandLine(const QString& field, const QString& value) {
  return (field + QLatin1Char(':') + value + QLatin1Char('\n')).toUtf8();
}

OperationResult DeviceConfigClient::exchange(const Request& request, const LineSink& sink) {
  auto emitLine = [&sink](const QString& line) {
    if (sink) {
      sink(line);
    }
  };

  const QString invalid = validate(request);
  if (!invalid.isEmpty()) {
    return OperationResult::failure(OperationResult::Kind::Validation, invalid);
  }

  SerialPort port;
  if (!port.openPort(request.portPath, request.baudRate)) {
    return OperationResult::failure(OperationResult::Kind::Transport,
                                    QString("Failed to configure device: %1")
                                        .arg(port.errorString()));
  }
  qCDebug(log_config) << "Opened" << request.portPath << "at" << request.baudRate;

  const QList<QPair<QString, QString>> fields = {
      {QString::fromLatin1(kSignalIdField), request.signalId},
      {QString::fromLatin1(kSignalNameField), request.signalName},
  };

  for (const auto& field : fields) {
    const QByteArray cmd = commandLine(field.first, field.second);
    emitLine(QString("Sending: %1").arg(QString::fromUtf8(cmd).trimmed()));
    if (!port.writeBytes(cmd, request.timeoutMs)) {
      return OperationResult::failure(OperationResult::Kind::Transport,
                                      QString("Failed to configure device: %1")
                                          .arg(port.errorString()));
    }

    for (int i = 0; i < kResponseLinesPerCommand; ++i) {
      QByteArray line;
      const SerialPort::ReadStatus status = port.readLine(&line, request.timeoutMs);
      if (status == SerialPort::ReadStatus::Timeout) {
        return OperationResult::failure(
            OperationResult::Kind::DeviceProtocol,
            QString("Failed to configure device: no response to %1 (got %2 of %3 lines).")
                .arg(field.first)
                .arg(i)
                .arg(kResponseLinesPerCommand));
      }
      if (status == SerialPort::ReadStatus::Error) {
        return OperationResult::failure(OperationResult::Kind::Transport,
                                        QString("Failed to configure device: %1")
                                            .arg(port.errorString()));
      }
      emitLine(QString("Response: %1").arg(QString::fromUtf8(line).trimmed()));
    }
  }

  port.closePort();
  qCDebug(log_config) << "Closed" << request.portPath;
  return OperationResult::success();
}

DeviceConfigClient::DeviceConfigClient(FlashOrchestrator* orchestrator, QObject* parent)
    : QObject(parent), orchestrator_(orchestrator) {
  qRegisterMetaType<OperationResult>();
  if (orchestrator_) {
    connect(orchestrator_, &FlashOrchestrator::jobFinished, this, &DeviceConfigClient::onChipIdFinished);
  }
}

DeviceConfigClient::~DeviceConfigClient() {
  waitForExchange();
}

bool DeviceConfigClient::configure(const Request& request) {
  if (busy_) {
    emit finished(OperationResult::failure(OperationResult::Kind::Validation,
                                           QStringLiteral("Configuration is already running.")));
    return false;
  }
  if (orchestrator_ && orchestrator_->isBusy()) {
    emit finished(OperationResult::failure(OperationResult::Kind::Validation,
                                           QStringLiteral("A flashing operation is already running.")));
    return false;
  }
  const QString invalid = validate(request);
  if (!invalid.isEmpty()) {
    emit finished(OperationResult::failure(OperationResult::Kind::Validation, invalid));
    return false;
  }

  busy_ = true;
  stopRequested_ = false;
  awaitingChipId_ = false;
  pending_ = request;
  qCInfo(log_config) << "Configuring" << request.portPath << "id" << request.signalId
                     << "name" << request.signalName;

  // A previous exchange has already reported back; let its thread wind down.
  waitForExchange();

  QPointer<DeviceConfigClient> self(this);
  exchangeThread_ = QThread::create([request, self] {
    const OperationResult result = exchange(request, [self](const QString& line) {
      QMetaObject::invokeMethod(
          self.data(), [self, line] {
            if (!self) {
              return;
            }
            emit self->outputLine(line);
          }, Qt::QueuedConnection);
    });
    QMetaObject::invokeMethod(
        self.data(), [self, result] {
          if (!self) {
            return;
          }
          self->onExchangeFinished(result);
        }, Qt::QueuedConnection);
  });
  exchangeThread_->setParent(this);
  exchangeThread_->setObjectName(QStringLiteral("device-config"));
  QThread* thread = exchangeThread_;
  connect(thread, &QThread::finished, this, [this, thread] {
    thread->deleteLater();
    if (exchangeThread_ == thread) {
      exchangeThread_ = nullptr;
    }
  });
  exchangeThread_->start();
  return true;
}

bool DeviceConfigClient::isBusy() const {
  return busy_;
}

void DeviceConfigClient::requestStop() {
  if (!busy_) {
    return;
  }
  stopRequested_ = true;
  qCInfo(log_config) << "Stop requested; the serial exchange will finish but no chip-id check runs";
}

void DeviceConfigClient::waitForExchange() {
  if (exchangeThread_) {
    exchangeThread_->wait();
  }
}

void DeviceConfigClient::onExchangeFinished(const OperationResult& result) {
  if (!result.ok()) {
    complete(result);
    return;
  }
  if (stopRequested_) {
    complete(OperationResult::failure(OperationResult::Kind::Stopped,
                                      QStringLiteral("Stopped before the chip-id check.")));
    return;
  }
  if (!orchestrator_) {
    complete(OperationResult::failure(OperationResult::Kind::ExternalTool,
                                      QStringLiteral("No flashing tool available for the chip-id check.")));
    return;
  }

  awaitingChipId_ = true;
  if (!orchestrator_->queryChipId(pending_.portPath, pending_.baudRate)) {
    // The orchestrator may already have reported a job that failed to start.
    if (awaitingChipId_) {
      awaitingChipId_ = false;
      complete(OperationResult::failure(OperationResult::Kind::ExternalTool,
                                        QStringLiteral("Could not start the chip-id check."),
                                        -1));
    }
  }
}

void DeviceConfigClient::onChipIdFinished(FlashJob* job, int exitCode) {
  if (!awaitingChipId_ || !job || job->mode() != FlashJob::Mode::ConfigureCheck) {
    return;
  }
  awaitingChipId_ = false;
  if (exitCode == 0) {
    complete(OperationResult::success());
    return;
  }
  complete(OperationResult::failure(OperationResult::Kind::ExternalTool,
                                    QStringLiteral("Failed to reset device after configuration."),
                                    exitCode));
}

void DeviceConfigClient::complete(const OperationResult& result) {
  busy_ = false;
  if (result.ok()) {
    qCInfo(log_config) << "Configuration of" << pending_.portPath << "succeeded";
  } else {
    qCWarning(log_config).noquote()
        << QString("Configuration of %1 failed (%2): %3")
               .arg(pending_.portPath, OperationResult::kindName(result.kind), result.message);
  }
  emit finished(result);
}
