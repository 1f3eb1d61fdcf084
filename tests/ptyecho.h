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

#include <atomic>
#include <cerrno>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>
#include <QByteArray>
#include <QList>
#include <QString>

/**
 * @brief Device end of a pseudo terminal pair
 *
 * Serves as the instrument a SerialDevice talks to: commands written to
 * the serial end are collected line by line and answered with whatever
 * the reply function returns for them (nothing, if it returns an empty
 * array).
 */
class PtyEcho
{
public:
    using ReplyFunction = std::function<QByteArray(const QByteArray &command)>;

    explicit PtyEcho(const ReplyFunction &replyFn = nullptr)
        : m_replyFn(replyFn),
          m_masterFd(-1),
          m_slaveFd(-1),
          m_running(false)
    {
        char name[256] = {0};
        if (openpty(&m_masterFd, &m_slaveFd, name, nullptr, nullptr) != 0)
            return;

        // no echo, no newline translation
        struct termios tio;
        if (tcgetattr(m_slaveFd, &tio) == 0) {
            cfmakeraw(&tio);
            tcsetattr(m_slaveFd, TCSANOW, &tio);
        }

        // we must never block on the device end, so closeMaster() always succeeds
        fcntl(m_masterFd, F_SETFL, fcntl(m_masterFd, F_GETFL) | O_NONBLOCK);

        m_slavePath = QString::fromLocal8Bit(name);
        m_running = true;
        m_thread = std::thread(&PtyEcho::run, this);
    }

    ~PtyEcho()
    {
        closeMaster();
        if (m_slaveFd >= 0)
            ::close(m_slaveFd);
    }

    bool isValid() const
    {
        return !m_slavePath.isEmpty();
    }

    QString slavePath() const
    {
        return m_slavePath;
    }

    QList<QByteArray> commands() const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return m_commands;
    }

    int countCommands(const QByteArray &command) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<int>(m_commands.count(command));
    }

    /**
     * Unplug the device: stop answering and close our end of the line.
     */
    void closeMaster()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
        if (m_masterFd >= 0) {
            ::close(m_masterFd);
            m_masterFd = -1;
        }
    }

private:
    void run()
    {
        QByteArray buffer;
        while (m_running) {
            struct pollfd pfd = {m_masterFd, POLLIN, 0};
            if (poll(&pfd, 1, 20) <= 0 || (pfd.revents & POLLIN) == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }

            char data[512];
            const auto len = ::read(m_masterFd, data, sizeof(data));
            if (len <= 0)
                continue;
            buffer.append(data, len);

            qsizetype idx;
            while ((idx = buffer.indexOf('\n')) >= 0) {
                const auto command = buffer.left(idx).trimmed();
                buffer.remove(0, idx + 1);
                {
                    const std::lock_guard<std::mutex> lock(m_mutex);
                    m_commands.append(command);
                }

                if (m_replyFn)
                    writeAll(m_replyFn(command));
            }
        }
    }

    void writeAll(const QByteArray &data)
    {
        qsizetype written = 0;
        while (written < data.size() && m_running) {
            const auto ret = ::write(m_masterFd, data.constData() + written, data.size() - written);
            if (ret < 0) {
                if (errno != EAGAIN && errno != EINTR)
                    return;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            written += ret;
        }
    }

    ReplyFunction m_replyFn;
    int m_masterFd;
    int m_slaveFd;
    QString m_slavePath;
    std::atomic_bool m_running;

    mutable std::mutex m_mutex;
    QList<QByteArray> m_commands;
    std::thread m_thread;
};
