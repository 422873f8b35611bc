#pragma once

#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QStringList>
#include <QVector>

#include "firmware_catalog.h"

// One run of the flashing tool. A job moves Idle -> Running -> Succeeded or
// Failed exactly once; a retry is a new job.
class FlashJob final : public QObject {
  Q_OBJECT

 public:
  enum class Mode {
    ConfigureCheck,
    Write,
  };

  enum class State {
    Idle,
    Running,
    Succeeded,
    Failed,
  };

  FlashJob(Mode mode, QString portPath, QString program, QStringList arguments,
           QObject* parent = nullptr);
  ~FlashJob() override;

  Mode mode() const;
  State state() const;
  QString portPath() const;
  QString program() const;
  QStringList arguments() const;
  int exitCode() const;
  bool isRunning() const;
  bool isFinished() const;

  void start();

  // Marks the job as no longer wanted. A running tool is never interrupted:
  // killing it mid-write leaves the device flash corrupt, so the job still
  // runs to its natural end.
  void requestStop();
  bool stopRequested() const;

  // Blocks until the tool exits. Returns false if it is still running after
  // |msecs| (-1 waits without a bound).
  bool waitForFinished(int msecs = -1);

  static QString stateName(State state);

 signals:
  void started();
  void outputLine(QString line);
  void finished(int exitCode);

 private:
  Mode mode_;
  State state_ = State::Idle;
  QString portPath_;
  QString program_;
  QStringList arguments_;
  QProcess* process_ = nullptr;
  QString lineBuffer_;
  int exitCode_ = 0;
  bool stopRequested_ = false;

  void consumeText(const QString& chunk);
  void flushLineBuffer();
  void finish(int exitCode);
};

class FlashOrchestrator final : public QObject {
  Q_OBJECT

 public:
  static constexpr auto kDefaultChip = "esp32s3";
  static constexpr int kDefaultBaudRate = 115200;

  struct Region final {
    quint32 address = 0;
    FirmwareRole role = FirmwareRole::Application;
  };

  // Fixed by the device's partition table, ascending by address.
  static const QVector<Region>& flashLayout();
  static QString formatAddress(quint32 address);

  static QStringList writeFlashArguments(const QString& chip, const QString& portPath,
                                         int baudRate, const FirmwareFileSet& files);
  static QStringList chipIdArguments(const QString& chip, const QString& portPath, int baudRate);

  explicit FlashOrchestrator(QObject* parent = nullptr);
  ~FlashOrchestrator() override;

  void setToolPath(QString path);
  QString toolPath() const;
  void setChip(QString chip);
  QString chip() const;
  void setBaudRate(int baudRate);
  int baudRate() const;

  // Both return nullptr and emit rejected() when another job is running or
  // the request is incomplete. The returned job is already started and is
  // deleted after finished() has been delivered.
  FlashJob* writeFlash(const QString& portPath, const FirmwareFileSet& files);
  // |baudRate| <= 0 uses baudRate().
  FlashJob* queryChipId(const QString& portPath, int baudRate = 0);

  bool isBusy() const;
  FlashJob* activeJob() const;

  // Forwards to the active job; see FlashJob::requestStop().
  void requestStop();
  bool waitForIdle(int msecs = -1);

  static QString resolveDefaultToolPath();

 signals:
  void jobStarted(FlashJob* job);
  void outputLine(QString line);
  void jobFinished(FlashJob* job, int exitCode);
  void rejected(QString reason);

 private:
  QString toolPath_;
  QString chip_ = QString::fromLatin1(kDefaultChip);
  int baudRate_ = kDefaultBaudRate;
  QPointer<FlashJob> active_;

  FlashJob* launch(FlashJob::Mode mode, const QString& portPath, QStringList arguments);
};
