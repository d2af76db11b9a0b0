// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include <QCoreApplication>
#include <QFileInfo>

namespace XKalamine {

namespace {

// QFile reports a refused open() as a generic OpenError, so check access rights directly
bool accessDenied(const QString& path, QIODevice::OpenMode mode)
{
    const QFileInfo info(path);
    if (mode.testFlag(QIODevice::WriteOnly)) {
        return info.exists() ? !info.isWritable() : !QFileInfo(info.absolutePath()).isWritable();
    }
    return info.exists() && !info.isReadable();
}

} // namespace

FileError FileError::fromDevice(const QFileDevice& device, const QString& path, QIODevice::OpenMode mode)
{
    FileError error;
    const bool denied = device.error() == QFileDevice::PermissionsError
        || (device.error() == QFileDevice::OpenError && accessDenied(path, mode));
    error.kind = denied ? Kind::PermissionDenied : Kind::IoFailure;
    error.path = path;
    error.message = device.errorString();
    return error;
}

FileError FileError::permissionDenied(const QString& path, const QString& message)
{
    return FileError{Kind::PermissionDenied, path, message};
}

FileError FileError::ioFailure(const QString& path, const QString& message)
{
    return FileError{Kind::IoFailure, path, message};
}

FileError FileError::malformed(const QString& path, const QString& message)
{
    return FileError{Kind::MalformedRegistry, path, message};
}

QString FileError::toString() const
{
    switch (kind) {
    case Kind::None:
        return QString();
    case Kind::PermissionDenied:
        return QCoreApplication::translate("FileError", "Permission denied: %1").arg(path);
    case Kind::IoFailure:
        return QCoreApplication::translate("FileError", "I/O error on file %1: %2").arg(path, message);
    case Kind::MalformedRegistry:
        return QCoreApplication::translate("FileError", "Unexpected XML format in %1: %2").arg(path, message);
    }
    return QString();
}

} // namespace XKalamine
