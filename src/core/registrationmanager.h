// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layoutindex.h"
#include "types.h"
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

namespace XKalamine {

/**
 * @brief Outcome of a commit: which files were processed, which failed
 *
 * Files are independent. A failure on one of them does not stop the others,
 * so a report may hold errors next to successfully updated files.
 */
struct XKALAMINE_EXPORT CommitReport
{
    QStringList processedFiles;
    QList<FileError> errors;

    bool isOk() const
    {
        return errors.isEmpty();
    }

    /// True if at least one file could not be accessed for lack of privileges
    bool permissionDenied() const;
};

/**
 * @brief Installs, removes and lists custom layouts in an XKB configuration root
 *
 * The root holds two parts that are kept consistent:
 * - rules/{base,evdev}.xml: layout references shown by layout selectors
 * - symbols/[locale]: layout definitions, between KALAMINE markers
 *
 * A commit updates the rules first, then the symbols. A layout reference to
 * a missing definition only hides the layout from selectors; the opposite
 * would offer a layout that cannot be loaded.
 *
 * Commits are not transactional. Re-running the same commit is always safe
 * and converges files that failed the first time.
 */
class XKALAMINE_EXPORT RegistrationManager : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString rootDirectory READ rootDirectory CONSTANT)
    Q_PROPERTY(bool systemScope READ isSystemScope CONSTANT)

public:
    /**
     * @param rootDirectory XKB root containing rules/ and symbols/
     * @param systemScope True for the system-wide root (no user-space bootstrap)
     */
    explicit RegistrationManager(const QString& rootDirectory, bool systemScope = false, QObject* parent = nullptr);
    ~RegistrationManager() override;

    QString rootDirectory() const
    {
        return m_rootDirectory;
    }

    bool isSystemScope() const
    {
        return m_systemScope;
    }

    /// rules/base.xml and rules/evdev.xml, whether they exist or not
    QStringList rulesFilePaths() const;

    QString symbolsFilePath(const QString& locale) const;

    /**
     * @brief Write all pending changes of @p index to disk
     *
     * Every existing rules file is updated first, then each locale's symbols
     * file once. @p index is consumed: it is empty when this returns.
     */
    CommitReport commit(LayoutIndex&& index);

    /**
     * @brief Installed layouts: declared in the rules and present in symbols/[locale]
     * @param mask "", "*", "locale" or "locale/variant"
     * @param errors If non-null, receives files that could not be read
     */
    VariantListing listRegistered(const QString& mask = QString(), QList<FileError>* errors = nullptr) const;

    /**
     * @brief Every layout declared in the rules, installed or not
     */
    VariantListing listAll(const QString& mask = QString(), QList<FileError>* errors = nullptr) const;

    /**
     * @brief Check if there is a usable symbols/custom layout
     *
     * True when symbols/custom exists and a rules file declares a "custom" layout.
     */
    bool hasCustomSymbols() const;

    /**
     * @brief Ensure there is an XKB configuration in user space
     *
     * Creates the expected subdirectories, a rules/evdev file including the
     * system one and an empty rules/evdev.xml registry. Existing files are
     * left alone. Does nothing for the system root.
     */
    FileError ensureUserConfigReady() const;

    /**
     * @brief Drop the obsolete "type" attributes older installers added to variants
     */
    CommitReport dropLegacyTypeAttributes();

Q_SIGNALS:
    /**
     * @brief A file is about to be rewritten
     */
    void fileProcessing(const QString& filePath);

    /**
     * @brief A variant was written to (installed) or dropped from (!installed) a symbols file
     */
    void variantUpdated(const QString& locale, const QString& name, bool installed);

    /**
     * @brief A file could not be updated; the commit goes on with the next file
     */
    void fileFailed(const QString& filePath, const QString& message);

private:
    void recordError(CommitReport& report, const FileError& error);

    QString m_rootDirectory;
    bool m_systemScope = false;
};

} // namespace XKalamine
