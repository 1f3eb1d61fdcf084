/*
 * Copyright (C) 2024 Matthias Klumpp <matthias@tenstral.net>
 *
 * Licensed under the GNU Lesser General Public License Version 3
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the license, or
 * (at your option) any later version.
 *
 * This software is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this software.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "serialdevice.h"

#include <QDebug>
#include <QThread>

namespace DevIO
{
Q_LOGGING_CATEGORY(logSerialDevice, "devio.serial")
}

using namespace DevIO;

/**
 * Claims the serial port for the calling thread for the duration of
 * an I/O operation and releases it afterwards, so the next worker
 * thread can pull it in.
 */
class PortThreadClaim
{
public:
    explicit PortThreadClaim(QSerialPort *port)
        : m_port(port)
    {
        if (m_port->thread() != QThread::currentThread())
            m_port->moveToThread(QThread::currentThread());
    }

    ~PortThreadClaim()
    {
        m_port->moveToThread(nullptr);
    }

private:
    Q_DISABLE_COPY(PortThreadClaim)
    QSerialPort *m_port;
};

class SerialDevice::Private
{
public:
    Private()
        : timeoutMsec(4 * 1000)
    {
    }

    QScopedPointer<QSerialPort> port;
    QString lastError;
    int timeoutMsec;
};

SerialDevice::SerialDevice(const QString &name)
    : AbstractDevice(name),
      d(new SerialDevice::Private)
{
    setAlive(false);
}

SerialDevice::~SerialDevice()
{
    close();
}

static QString serialErrorToString(QSerialPort::SerialPortError e)
{
    switch (e) {
    case QSerialPort::NoError:
        return QStringLiteral("No error");
    case QSerialPort::DeviceNotFoundError:
        return QStringLiteral("Device not found");
    case QSerialPort::PermissionError:
        return QStringLiteral("Permission denied");
    case QSerialPort::OpenError:
        return QStringLiteral("Device already opened");
    case QSerialPort::ResourceError:
        return QStringLiteral("Unable to communicate with the device. Is it plugged in?");
    case QSerialPort::TimeoutError:
        return QStringLiteral("Operation timed out");
    default:
        return QStringLiteral("Error code %1").arg(e);
    }
}

bool SerialDevice::open(const QString &portName, qint32 baudRate)
{
    QMutexLocker locker(mutex());
    if (d->port) {
        {
            PortThreadClaim claim(d->port.data());
            d->port->close();
        }
        d->port.reset();
    }

    if (baudRate <= 0) {
        setError(QStringLiteral("Can't open %1: Invalid baud rate %2").arg(portName).arg(baudRate));
        setAlive(false);
        return false;
    }

    d->port.reset(new QSerialPort(portName));
    PortThreadClaim claim(d->port.data());
    if (!d->port->setBaudRate(baudRate)) {
        setError(QStringLiteral("Can't open %1: Unable to set baud rate %2 (%3)")
                     .arg(portName)
                     .arg(baudRate)
                     .arg(serialErrorToString(d->port->error())));
        setAlive(false);
        return false;
    }
    if (!d->port->setStopBits(QSerialPort::OneStop)) {
        setError(QStringLiteral("Can't open %1: Unable to set stop bits (%2)")
                     .arg(portName, serialErrorToString(d->port->error())));
        setAlive(false);
        return false;
    }

    if (!d->port->open(QIODevice::ReadWrite)) {
        setError(QStringLiteral("Can't open %1: %2").arg(portName, serialErrorToString(d->port->error())));
        setAlive(false);
        return false;
    }

    // discard anything the device sent before we were listening
    d->port->clear();

    qCDebug(logSerialDevice).noquote() << "Opened serial port" << portName << "at" << baudRate << "baud";
    setAlive(true);
    return true;
}

void SerialDevice::close()
{
    QMutexLocker locker(mutex());
    if (!d->port)
        return;

    PortThreadClaim claim(d->port.data());
    d->port->close();
}

bool SerialDevice::isOpen() const
{
    return d->port && d->port->isOpen();
}

QString SerialDevice::portName() const
{
    return d->port ? d->port->portName() : QString();
}

QString SerialDevice::lastError() const
{
    return d->lastError;
}

int SerialDevice::timeoutMsec() const
{
    return d->timeoutMsec;
}

void SerialDevice::setTimeoutMsec(int timeout)
{
    d->timeoutMsec = timeout;
}

void SerialDevice::setError(const QString &message)
{
    d->lastError = message;
    qCWarning(logSerialDevice).noquote().nospace() << name() << ": " << message;
}

bool SerialDevice::query(const QByteArray &command, QByteArray &reply)
{
    if (!write(command))
        return false;
    return readLine(reply);
}

bool SerialDevice::write(const QByteArray &command)
{
    if (!isOpen()) {
        setError(QStringLiteral("Device is not open."));
        return false;
    }

    PortThreadClaim claim(d->port.data());
    d->port->write(command + "\n");
    if (!d->port->waitForBytesWritten(d->timeoutMsec)) {
        setError(QStringLiteral("Timed out while trying to write data to device %1 (%2)")
                     .arg(d->port->portName(), d->port->errorString()));
        return false;
    }

    return true;
}

bool SerialDevice::readLine(QByteArray &line)
{
    if (!isOpen()) {
        setError(QStringLiteral("Device is not open."));
        return false;
    }

    PortThreadClaim claim(d->port.data());
    while (!d->port->canReadLine()) {
        if (!d->port->waitForReadyRead(d->timeoutMsec)) {
            setError(QStringLiteral("Timed out while waiting for a reply from device %1").arg(d->port->portName()));
            return false;
        }

        // guard against devices flooding us without ever sending a newline
        if (d->port->bytesAvailable() > 4096) {
            setError(QStringLiteral("Received overlong reply from device %1").arg(d->port->portName()));
            d->port->clear(QSerialPort::Input);
            return false;
        }
    }

    line = d->port->readLine().trimmed();
    return true;
}
