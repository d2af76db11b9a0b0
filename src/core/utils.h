// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringDecoder>
#include <QStringList>

namespace XKalamine {
namespace Utils {

/**
 * @brief Read a whole file
 * @param filePath File to read
 * @param data Output: raw content
 * @return FileError::ok(), or the reason the file could not be read
 */
inline FileError readFile(const QString& filePath, QByteArray* data)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return FileError::fromDevice(file, filePath, QIODevice::ReadOnly);
    }

    *data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        return FileError::fromDevice(file, filePath, QIODevice::ReadOnly);
    }
    return FileError::ok();
}

/**
 * @brief Read a whole UTF-8 text file
 * @param filePath File to read
 * @param text Output: decoded content
 * @return FileError::ok(), or the reason the file could not be read/decoded
 */
inline FileError readTextFile(const QString& filePath, QString* text)
{
    QByteArray data;
    const FileError error = readFile(filePath, &data);
    if (!error.isOk()) {
        return error;
    }

    auto decoder = QStringDecoder(QStringDecoder::Utf8);
    QString decoded = decoder(data);
    if (decoder.hasError()) {
        return FileError::ioFailure(filePath, QStringLiteral("invalid UTF-8 content"));
    }

    *text = decoded;
    return FileError::ok();
}

/**
 * @brief Replace the content of a file, creating it if needed
 *
 * The file is truncated and rewritten in place. The parent directory must
 * already exist: a missing XKB directory is reported, not created.
 */
inline FileError writeFile(const QString& filePath, const QByteArray& data)
{
    const QDir parent = QFileInfo(filePath).absoluteDir();
    if (!parent.exists()) {
        return FileError::ioFailure(filePath, QStringLiteral("directory %1 does not exist").arg(parent.path()));
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return FileError::fromDevice(file, filePath, QIODevice::WriteOnly);
    }

    if (file.write(data) != data.size()) {
        return FileError::fromDevice(file, filePath, QIODevice::WriteOnly);
    }

    if (!file.flush()) {
        return FileError::fromDevice(file, filePath, QIODevice::WriteOnly);
    }

    return FileError::ok();
}

/**
 * @brief Remove trailing whitespace (spaces, tabs, newlines)
 */
inline QString chopTrailingWhitespace(const QString& text)
{
    qsizetype end = text.size();
    while (end > 0 && text.at(end - 1).isSpace()) {
        --end;
    }
    return text.left(end);
}

/**
 * @brief Split text into lines without their line terminators
 *
 * A final newline does not produce an extra empty line. "\r\n" ends a
 * line like "\n" does.
 */
inline QStringList splitLines(const QString& text)
{
    if (text.isEmpty()) {
        return {};
    }
    QStringList lines = text.split(QLatin1Char('\n'));
    if (text.endsWith(QLatin1Char('\n'))) {
        lines.removeLast();
    }
    for (QString& line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }
    return lines;
}

} // namespace Utils
} // namespace XKalamine
