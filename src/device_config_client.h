#pragma once

#include <QObject>
#include <QPointer>
#include <QString>

#include <functional>

#include "operation_result.h"

class FlashJob;
class FlashOrchestrator;
class QThread;

// Sets a device's signal id and name over the line protocol
//   signal_id:<id>\n  -> two response lines
//   signal_name:<name>\n -> two response lines
// and then checks with a chip-id query that the device came back after reset.
class DeviceConfigClient final : public QObject {
  Q_OBJECT

 public:
  static constexpr int kDefaultBaudRate = 115200;
  static constexpr int kReadTimeoutMs = 2000;
  static constexpr int kMaxIdLength = 3;
  static constexpr int kResponseLinesPerCommand = 2;

  struct Request final {
    QString portPath;
    int baudRate = kDefaultBaudRate;
    int timeoutMs = kReadTimeoutMs;
    QString signalId;
    QString signalName;
  };

  using LineSink = std::function<void(const QString& line)>;

  // Empty when |request| may be sent.
  static QString validate(const Request& request);

  static QByteArray commandLine(const QString& field, const QString& value);

  // Runs the serial part of the exchange on the calling thread. The port is
  // closed before this returns, on every path.
  static OperationResult exchange(const Request& request, const LineSink& sink);

  explicit DeviceConfigClient(FlashOrchestrator* orchestrator, QObject* parent = nullptr);
  ~DeviceConfigClient() override;

  // Starts the exchange on a worker thread followed by the chip-id check.
  // An invalid request, or one made while busy, is reported through
  // finished() before this returns false.
  bool configure(const Request& request);
  bool isBusy() const;

  // Skips the chip-id check if the serial exchange is still in progress.
  void requestStop();

  // Blocks until the serial exchange thread has exited.
  void waitForExchange();

 signals:
  void outputLine(QString line);
  void finished(OperationResult result);

 private:
  QPointer<FlashOrchestrator> orchestrator_;
  QThread* exchangeThread_ = nullptr;
  Request pending_;
  bool busy_ = false;
  bool stopRequested_ = false;
  bool awaitingChipId_ = false;

  void onExchangeFinished(const OperationResult& result);
  void onChipIdFinished(FlashJob* job, int exitCode);
  void complete(const OperationResult& result);
};
