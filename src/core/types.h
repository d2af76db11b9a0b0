// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xkalamine_export.h"
#include <QFileDevice>
#include <QList>
#include <QMap>
#include <QString>

namespace XKalamine {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief A keyboard layout ready to be written into an XKB configuration
 *
 * The body is an xkb_symbols section as produced by the layout compiler.
 * Lines starting with "//#" are stripped when the body is written.
 */
struct XKALAMINE_EXPORT LayoutDefinition
{
    QString locale;         ///< XKB locale, i.e. the symbols file name ("fr")
    QString name;           ///< Variant name ("bepo")
    QString description;    ///< Human readable label for layout selectors
    QString body;           ///< xkb_symbols text
};

/**
 * @brief Registered layouts as read back from disk: locale -> variant -> description
 */
using VariantListing = QMap<QString, QMap<QString, QString>>;

/**
 * @brief Outcome of an operation on a single XKB file
 *
 * Permission errors are kept apart from other I/O errors so that callers can
 * suggest running again with elevated privileges.
 */
struct XKALAMINE_EXPORT FileError
{
    enum class Kind {
        None,
        PermissionDenied,   ///< The file or its directory is not writable/readable by this user
        IoFailure,          ///< Missing directory, short write, encoding error...
        MalformedRegistry   ///< Rules XML that does not follow the xkbConfigRegistry schema
    };

    Kind kind = Kind::None;
    QString path;
    QString message;

    bool isOk() const
    {
        return kind == Kind::None;
    }

    static FileError ok()
    {
        return FileError{};
    }

    /**
     * @brief Classify the error left on @p device by a failed operation
     * @param mode Mode the file was opened (or was being opened) with
     */
    static FileError fromDevice(const QFileDevice& device, const QString& path, QIODevice::OpenMode mode);
    static FileError permissionDenied(const QString& path, const QString& message);
    static FileError ioFailure(const QString& path, const QString& message);
    static FileError malformed(const QString& path, const QString& message);

    /**
     * @brief Translated one-line description naming the offending path
     */
    QString toString() const;
};

} // namespace XKalamine
