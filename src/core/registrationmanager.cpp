// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "registrationmanager.h"
#include "constants.h"
#include "layoutmask.h"
#include "logging.h"
#include "rulesregistry.h"
#include "symbolmarker.h"
#include "symbolsfile.h"
#include "utils.h"
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <algorithm>

namespace XKalamine {

namespace {

// rules/evdev for a user-space configuration: defer to the system rules
const char UserEvdevRules[] =
    "// Generated by Kalamine\n"
    "// Include the system 'evdev' file\n"
    "! include %S/evdev\n";

// Minimal rules/evdev.xml; locales and variants are added by commits
const char UserEvdevRegistry[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE xkbConfigRegistry SYSTEM \"xkb.dtd\">\n"
    "<!-- Generated by Kalamine -->\n"
    "<xkbConfigRegistry version=\"1.1\">\n"
    "  <layoutList/>\n"
    "</xkbConfigRegistry>\n";

FileError writeIfMissing(const QString& filePath, const QByteArray& content)
{
    if (QFileInfo::exists(filePath)) {
        return FileError::ok();
    }
    qCInfo(lcManager) << "Creating" << filePath;
    return Utils::writeFile(filePath, content);
}

FileError createDirectory(const QString& path)
{
    if (QDir().mkpath(path)) {
        return FileError::ok();
    }

    // Find out whether the closest existing ancestor refused the new directory
    QFileInfo ancestor(QFileInfo(path).absolutePath());
    while (!ancestor.exists() && !ancestor.isRoot()) {
        ancestor = QFileInfo(ancestor.absolutePath());
    }
    const QString message = QStringLiteral("could not create directory");
    return ancestor.isWritable() ? FileError::ioFailure(path, message) : FileError::permissionDenied(path, message);
}

} // namespace

bool CommitReport::permissionDenied() const
{
    return std::any_of(errors.cbegin(), errors.cend(), [](const FileError& error) {
        return error.kind == FileError::Kind::PermissionDenied;
    });
}

RegistrationManager::RegistrationManager(const QString& rootDirectory, bool systemScope, QObject* parent)
    : QObject(parent)
    , m_rootDirectory(QDir::cleanPath(rootDirectory))
    , m_systemScope(systemScope)
{
}

RegistrationManager::~RegistrationManager() = default;

QStringList RegistrationManager::rulesFilePaths() const
{
    const QDir rulesDir(QDir(m_rootDirectory).filePath(XkbDirs::Rules));
    return {rulesDir.filePath(XkbDirs::BaseRegistry), rulesDir.filePath(XkbDirs::EvdevRegistry)};
}

QString RegistrationManager::symbolsFilePath(const QString& locale) const
{
    return QDir(QDir(m_rootDirectory).filePath(XkbDirs::Symbols)).filePath(locale);
}

void RegistrationManager::recordError(CommitReport& report, const FileError& error)
{
    qCWarning(lcManager) << "Failed to update" << error.path << ":" << error.message;
    report.errors.append(error);
    Q_EMIT fileFailed(error.path, error.toString());
}

CommitReport RegistrationManager::commit(LayoutIndex&& index)
{
    CommitReport report;
    if (index.isEmpty()) {
        qCDebug(lcManager) << "Nothing to commit";
        return report;
    }

    // XKB/rules/{base,evdev}.xml: each shard on its own
    for (const QString& rulesPath : rulesFilePaths()) {
        if (!QFileInfo::exists(rulesPath)) {
            continue;
        }
        Q_EMIT fileProcessing(rulesPath);
        RulesRegistry registry(rulesPath);
        const FileError error = registry.apply(index);
        if (error.isOk()) {
            report.processedFiles.append(rulesPath);
        } else {
            recordError(report, error);
        }
    }

    // XKB/symbols/[locale]
    for (const LocaleChanges& changes : index.locales()) {
        const QString symbolsPath = symbolsFilePath(changes.locale);
        Q_EMIT fileProcessing(symbolsPath);

        const FileError error = SymbolsFile(symbolsPath).update(changes.variants);
        if (!error.isOk()) {
            recordError(report, error);
            continue;
        }

        report.processedFiles.append(symbolsPath);
        for (const VariantChange& change : changes.variants) {
            Q_EMIT variantUpdated(changes.locale, change.name, !change.isRemoval());
        }
    }

    if (!report.isOk() && !report.processedFiles.isEmpty()) {
        qCCritical(lcManager) << "Partial commit in" << m_rootDirectory << "- updated:" << report.processedFiles
                              << "failed:" << report.errors.size();
    }

    index.clear();
    return report;
}

VariantListing RegistrationManager::listAll(const QString& mask, QList<FileError>* errors) const
{
    const LayoutMask layoutMask = LayoutMask::parse(mask);
    VariantListing listing;

    for (const QString& rulesPath : rulesFilePaths()) {
        if (!QFileInfo::exists(rulesPath)) {
            continue;
        }
        RulesRegistry registry(rulesPath);
        const FileError error = registry.load();
        if (!error.isOk()) {
            if (errors) {
                errors->append(error);
            }
            continue;
        }
        registry.collectVariants(layoutMask, &listing);
    }

    return listing;
}

VariantListing RegistrationManager::listRegistered(const QString& mask, QList<FileError>* errors) const
{
    const VariantListing declared = listAll(mask, errors);
    VariantListing registered;

    for (auto it = declared.constBegin(); it != declared.constEnd(); ++it) {
        const QString symbolsPath = symbolsFilePath(it.key());
        if (!QFileInfo::exists(symbolsPath)) {
            continue;
        }

        QSet<QString> installed;
        const FileError error = SymbolsFile(symbolsPath).listVariants(&installed);
        if (!error.isOk()) {
            if (errors) {
                errors->append(error);
            }
            continue;
        }

        const QMap<QString, QString>& variants = it.value();
        for (auto variant = variants.constBegin(); variant != variants.constEnd(); ++variant) {
            if (installed.contains(SymbolMarker::lookupKey(variant.key()))) {
                registered[it.key()][variant.key()] = variant.value();
            }
        }
    }

    return registered;
}

bool RegistrationManager::hasCustomSymbols() const
{
    if (!QFileInfo::exists(symbolsFilePath(XkbDirs::CustomLayout))) {
        return false;
    }

    for (const QString& rulesPath : rulesFilePaths()) {
        if (!QFileInfo::exists(rulesPath)) {
            continue;
        }
        RulesRegistry registry(rulesPath);
        if (registry.load().isOk() && registry.declaresLayout(XkbDirs::CustomLayout)) {
            return true;
        }
    }

    return false;
}

FileError RegistrationManager::ensureUserConfigReady() const
{
    if (m_systemScope) {
        return FileError::ok();
    }

    const QDir root(m_rootDirectory);
    FileError error = createDirectory(m_rootDirectory);
    if (!error.isOk()) {
        return error;
    }
    for (const QLatin1String& subdir : XkbDirs::UserSubdirs) {
        error = createDirectory(root.filePath(subdir));
        if (!error.isOk()) {
            return error;
        }
    }

    const QDir rulesDir(root.filePath(XkbDirs::Rules));
    error = writeIfMissing(rulesDir.filePath(XkbDirs::EvdevRuleset), QByteArray(UserEvdevRules));
    if (!error.isOk()) {
        return error;
    }
    return writeIfMissing(rulesDir.filePath(XkbDirs::EvdevRegistry), QByteArray(UserEvdevRegistry));
}

CommitReport RegistrationManager::dropLegacyTypeAttributes()
{
    CommitReport report;
    for (const QString& rulesPath : rulesFilePaths()) {
        if (!QFileInfo::exists(rulesPath)) {
            continue;
        }

        RulesRegistry registry(rulesPath);
        FileError error = registry.load();
        if (error.isOk() && registry.dropTypeAttributes() > 0) {
            Q_EMIT fileProcessing(rulesPath);
            error = registry.save();
            if (error.isOk()) {
                report.processedFiles.append(rulesPath);
            }
        }
        if (!error.isOk()) {
            recordError(report, error);
        }
    }
    return report;
}

} // namespace XKalamine
