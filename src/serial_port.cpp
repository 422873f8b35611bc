#include "serial_port.h"

#include <QDeadlineTimer>

#include <algorithm>
#include <limits>

#if defined(Q_OS_UNIX)
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#elif defined(Q_OS_WIN)
#include <QThread>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {
constexpr int kReadChunkSize = 4096;

#if defined(Q_OS_UNIX)
speed_t baudToSpeed(int baudRate) {
  switch (baudRate) {
    case 1200:
      return B1200;
    case 2400:
      return B2400;
    case 4800:
      return B4800;
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
#ifdef B460800
    case 460800:
      return B460800;
#endif
#ifdef B921600
    case 921600:
      return B921600;
#endif
#ifdef B1500000
    case 1500000:
      return B1500000;
#endif
#ifdef B2000000
    case 2000000:
      return B2000000;
#endif
    default:
      return 0;
  }
}

QString errnoString() {
  return QString::fromLocal8Bit(strerror(errno));
}

int remainingMs(const QDeadlineTimer& deadline) {
  const qint64 ms = deadline.remainingTime();
  if (ms < 0) {
    return -1;
  }
  return static_cast<int>(qMin<qint64>(ms, std::numeric_limits<int>::max()));
}
#elif defined(Q_OS_WIN)
QString lastErrorString(const QString& context) {
  return QString("%1: %2").arg(context, qt_error_string(static_cast<int>(GetLastError())));
}

// COM10 and above only open through the device namespace; the prefix works for any COMn.
QString devicePath(const QString& portPath) {
  if (portPath.startsWith(QLatin1String("\\\\.\\"))) {
    return portPath;
  }
  return QStringLiteral("\\\\.\\") + portPath.toUpper();
}

HANDLE toHandle(qintptr nativeHandle) {
  return reinterpret_cast<HANDLE>(nativeHandle);
}
#endif
}  // namespace

SerialPort::~SerialPort() {
  closePort();
}

bool SerialPort::fail(QString message) {
  errorString_ = std::move(message);
  return false;
}

bool SerialPort::openPort(const QString& portPath, int baudRate) {
  closePort();
  errorString_.clear();

#if !defined(Q_OS_UNIX) && !defined(Q_OS_WIN)
  Q_UNUSED(portPath);
  Q_UNUSED(baudRate);
  return fail("Serial port is not supported on this platform.");
#elif defined(Q_OS_UNIX)
  const QByteArray pathBytes = portPath.toLocal8Bit();
  const int fd = ::open(pathBytes.constData(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    return fail(QString("Failed to open %1: %2").arg(portPath, errnoString()));
  }

  const speed_t speed = baudToSpeed(baudRate);
  if (speed == 0) {
    ::close(fd);
    return fail(QString("Unsupported baud rate: %1").arg(baudRate));
  }

  termios tty {};
  if (tcgetattr(fd, &tty) != 0) {
    const QString error = QString("tcgetattr failed: %1").arg(errnoString());
    ::close(fd);
    return fail(error);
  }

  cfmakeraw(&tty);
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag &= ~PARENB;
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (cfsetispeed(&tty, speed) != 0 || cfsetospeed(&tty, speed) != 0) {
    const QString error = QString("Failed to set baud rate: %1").arg(errnoString());
    ::close(fd);
    return fail(error);
  }

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    const QString error = QString("tcsetattr failed: %1").arg(errnoString());
    ::close(fd);
    return fail(error);
  }

  fd_ = fd;
  portPath_ = portPath;
  baudRate_ = baudRate;
  return true;
#else
  const QString trimmedPortPath = portPath.trimmed();
  if (trimmedPortPath.isEmpty()) {
    return fail("Serial port path is empty.");
  }

  HANDLE handle = CreateFileW(reinterpret_cast<LPCWSTR>(devicePath(trimmedPortPath).utf16()),
                              GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_EXISTING, 0, nullptr);
  if (handle == INVALID_HANDLE_VALUE) {
    return fail(lastErrorString(QString("Failed to open %1").arg(trimmedPortPath)));
  }

  DCB dcb {};
  dcb.DCBlength = sizeof(DCB);
  bool configured = GetCommState(handle, &dcb) != 0;
  if (configured) {
    dcb.BaudRate = static_cast<DWORD>(baudRate);
    dcb.ByteSize = 8;
    dcb.Parity = NOPARITY;
    dcb.StopBits = ONESTOPBIT;
    dcb.fBinary = TRUE;
    dcb.fParity = FALSE;
    dcb.fOutxCtsFlow = FALSE;
    dcb.fOutxDsrFlow = FALSE;
    dcb.fOutX = FALSE;
    dcb.fInX = FALSE;
    dcb.fDtrControl = DTR_CONTROL_ENABLE;
    dcb.fRtsControl = RTS_CONTROL_ENABLE;
    configured = SetCommState(handle, &dcb) != 0;
  }

  // ReadFile returns at once with whatever is queued; readLine() does the waiting.
  COMMTIMEOUTS timeouts {};
  timeouts.ReadIntervalTimeout = MAXDWORD;
  timeouts.WriteTotalTimeoutConstant = 1000;
  configured = configured && SetCommTimeouts(handle, &timeouts) != 0;
  if (!configured) {
    const QString error = lastErrorString(QString("Failed to configure %1").arg(trimmedPortPath));
    CloseHandle(handle);
    return fail(error);
  }
  PurgeComm(handle, PURGE_RXCLEAR | PURGE_TXCLEAR);

  nativeHandle_ = reinterpret_cast<qintptr>(handle);
  portPath_ = trimmedPortPath;
  baudRate_ = baudRate;
  return true;
#endif
}

void SerialPort::closePort() {
#if defined(Q_OS_UNIX)
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#elif defined(Q_OS_WIN)
  if (nativeHandle_ != -1) {
    CloseHandle(toHandle(nativeHandle_));
  }
  nativeHandle_ = -1;
#endif
  portPath_.clear();
  baudRate_ = 0;
  readBuffer_.clear();
}

bool SerialPort::isOpen() const {
#if defined(Q_OS_UNIX)
  return fd_ >= 0;
#elif defined(Q_OS_WIN)
  return nativeHandle_ != -1;
#else
  return false;
#endif
}

QString SerialPort::portPath() const {
  return portPath_;
}

int SerialPort::baudRate() const {
  return baudRate_;
}

QString SerialPort::errorString() const {
  return errorString_;
}

bool SerialPort::writeBytes(const QByteArray& data, int timeoutMs) {
  if (!isOpen()) {
    return fail("Serial port is not open.");
  }
  if (data.isEmpty()) {
    return true;
  }

#if defined(Q_OS_UNIX)
  const QDeadlineTimer deadline(timeoutMs);
  const char* p = data.constData();
  qsizetype remaining = data.size();
  while (remaining > 0) {
    const ssize_t n = ::write(fd_, p, static_cast<size_t>(remaining));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        pollfd pfd {fd_, POLLOUT, 0};
        const int ready = ::poll(&pfd, 1, qMax(0, remainingMs(deadline)));
        if (ready == 0) {
          return fail("Write timed out.");
        }
        if (ready < 0 && errno != EINTR) {
          return fail(QString("Write failed: %1").arg(errnoString()));
        }
        continue;
      }
      return fail(QString("Write failed: %1").arg(errnoString()));
    }
    p += n;
    remaining -= n;
  }
  return true;
#elif defined(Q_OS_WIN)
  Q_UNUSED(timeoutMs);
  HANDLE handle = toHandle(nativeHandle_);
  const char* p = data.constData();
  qsizetype remaining = data.size();
  while (remaining > 0) {
    const DWORD chunk =
        static_cast<DWORD>(std::min<qsizetype>(remaining, std::numeric_limits<DWORD>::max()));
    DWORD written = 0;
    if (!WriteFile(handle, p, chunk, &written, nullptr)) {
      return fail(lastErrorString("Write failed"));
    }
    if (written == 0) {
      return fail("Write failed: no bytes were written.");
    }
    p += static_cast<qsizetype>(written);
    remaining -= static_cast<qsizetype>(written);
  }
  return true;
#else
  Q_UNUSED(timeoutMs);
  return fail("Serial port is not supported on this platform.");
#endif
}

bool SerialPort::takeBufferedLine(QByteArray* line) {
  const int idx = readBuffer_.indexOf('\n');
  if (idx < 0) {
    return false;
  }
  *line = readBuffer_.left(idx);
  readBuffer_.remove(0, idx + 1);
  return true;
}

SerialPort::ReadStatus SerialPort::readLine(QByteArray* line, int timeoutMs) {
  if (!line) {
    return ReadStatus::Error;
  }
  line->clear();
  if (takeBufferedLine(line)) {
    return ReadStatus::Ok;
  }
  if (!isOpen()) {
    fail("Serial port is not open.");
    return ReadStatus::Error;
  }

  const QDeadlineTimer deadline(timeoutMs);

#if defined(Q_OS_UNIX)
  QByteArray chunk;
  chunk.resize(kReadChunkSize);
  while (true) {
    if (deadline.hasExpired()) {
      fail(QString("Timed out after %1 ms waiting for a response line.").arg(timeoutMs));
      return ReadStatus::Timeout;
    }

    pollfd pfd {fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, remainingMs(deadline));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      fail(QString("Read failed: %1").arg(errnoString()));
      return ReadStatus::Error;
    }
    if (ready == 0) {
      continue;
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
      fail("Read failed: device reported an error.");
      return ReadStatus::Error;
    }

    const ssize_t n = ::read(fd_, chunk.data(), static_cast<size_t>(chunk.size()));
    if (n > 0) {
      readBuffer_.append(chunk.constData(), static_cast<int>(n));
      if (takeBufferedLine(line)) {
        return ReadStatus::Ok;
      }
      continue;
    }
    if (n == 0 || (pfd.revents & POLLHUP) != 0) {
      fail("Serial port closed.");
      return ReadStatus::Error;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    fail(QString("Read failed: %1").arg(errnoString()));
    return ReadStatus::Error;
  }
#elif defined(Q_OS_WIN)
  HANDLE handle = toHandle(nativeHandle_);
  while (true) {
    DWORD errors = 0;
    COMSTAT stat {};
    if (!ClearCommError(handle, &errors, &stat)) {
      fail(lastErrorString("ClearCommError failed"));
      return ReadStatus::Error;
    }
    if (stat.cbInQue > 0) {
      const DWORD bytesToRead = std::min<DWORD>(stat.cbInQue, kReadChunkSize);
      QByteArray data;
      data.resize(static_cast<int>(bytesToRead));
      DWORD bytesRead = 0;
      if (!ReadFile(handle, data.data(), bytesToRead, &bytesRead, nullptr)) {
        fail(lastErrorString("Read failed"));
        return ReadStatus::Error;
      }
      readBuffer_.append(data.left(static_cast<int>(bytesRead)));
      if (takeBufferedLine(line)) {
        return ReadStatus::Ok;
      }
      continue;
    }
    if (deadline.hasExpired()) {
      fail(QString("Timed out after %1 ms waiting for a response line.").arg(timeoutMs));
      return ReadStatus::Timeout;
    }
    QThread::msleep(15);
  }
#else
  fail("Serial port is not supported on this platform.");
  return ReadStatus::Error;
#endif
}
