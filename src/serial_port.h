#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

// Blocking serial connection for short request/response exchanges.
// The port is closed when the object goes out of scope.
class SerialPort final {
 public:
  enum class ReadStatus {
    Ok,
    Timeout,
    Error,
  };

  SerialPort() = default;
  ~SerialPort();

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  bool openPort(const QString& portPath, int baudRate);
  void closePort();

  bool isOpen() const;
  QString portPath() const;
  int baudRate() const;
  QString errorString() const;

  bool writeBytes(const QByteArray& data, int timeoutMs);

  // Reads up to and including the next '\n'. The terminator is not part of
  // |line|. Bytes past the terminator stay buffered for the next call.
  ReadStatus readLine(QByteArray* line, int timeoutMs);

 private:
#if defined(Q_OS_UNIX)
  int fd_ = -1;
#elif defined(Q_OS_WIN)
  qintptr nativeHandle_ = -1;
#endif
  QString portPath_;
  int baudRate_ = 0;
  QByteArray readBuffer_;
  QString errorString_;

  bool takeBufferedLine(QByteArray* line);
  bool fail(QString message);
};
