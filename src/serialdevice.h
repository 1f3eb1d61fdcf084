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

#pragma once

#include <QLoggingCategory>
#include <QScopedPointer>
#include <QSerialPort>

#include "device.h"

namespace DevIO
{

Q_DECLARE_LOGGING_CATEGORY(logSerialDevice)

/**
 * @brief A line-based serial device
 *
 * Talks to instruments using a simple "command\n" / "reply\n" protocol,
 * like most Arduino sketches do.
 *
 * The port may be used from any thread, as long as the device mutex is
 * held during I/O. The DAQ and jobs workers take care of that, so the
 * I/O methods must not lock it themselves (QMutex is not recursive).
 * Only open() and close() lock the device mutex.
 */
class SerialDevice : public AbstractDevice
{
public:
    explicit SerialDevice(const QString &name = QString());
    ~SerialDevice() override;

    bool open(const QString &portName, qint32 baudRate = QSerialPort::Baud115200);
    void close();
    bool isOpen() const;

    QString portName() const;
    QString lastError() const;

    int timeoutMsec() const;
    void setTimeoutMsec(int timeout);

    /**
     * @brief Write a command, terminated by a newline.
     */
    bool write(const QByteArray &command);

    /**
     * @brief Write a command and read back one line of reply.
     * @param command The command to send.
     * @param reply The trimmed reply.
     */
    bool query(const QByteArray &command, QByteArray &reply);

    /**
     * @brief Read one line, without the line terminator and surrounding whitespace.
     */
    bool readLine(QByteArray &line);

private:
    class Private;
    Q_DISABLE_COPY(SerialDevice)
    QScopedPointer<Private> d;

    void setError(const QString &message);
};

} // namespace DevIO
