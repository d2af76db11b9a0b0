// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#define TRANSLATION_DOMAIN "xkalamine"

#include "../core/layoutindex.h"
#include "../core/logging.h"
#include "../core/registrationmanager.h"
#include "../core/utils.h"
#include "../core/xkbpaths.h"
#include "version.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include <algorithm>
#include <utility>

using namespace XKalamine;

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitUsage = 1,
    ExitPermissionDenied = 2,
    ExitFailure = 3
};

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int reportResult(const CommitReport& report)
{
    for (const FileError& error : report.errors) {
        err() << i18n("Error: %1", error.toString()) << Qt::endl;
    }

    if (report.permissionDenied()) {
        err() << i18n("Permission denied. System layouts require elevated privileges: run again as root.")
              << Qt::endl;
        return ExitPermissionDenied;
    }
    return report.isOk() ? ExitSuccess : ExitFailure;
}

void printListing(const VariantListing& listing)
{
    for (auto locale = listing.constBegin(); locale != listing.constEnd(); ++locale) {
        for (auto variant = locale->constBegin(); variant != locale->constEnd(); ++variant) {
            const QString id = locale.key() + QLatin1Char('/') + variant.key();
            out() << id.leftJustified(24) << QLatin1Char(' ') << variant.value() << Qt::endl;
        }
    }
}

int listLayouts(const RegistrationManager& manager, const QString& mask, bool all)
{
    QList<FileError> errors;
    const VariantListing listing = all ? manager.listAll(mask, &errors) : manager.listRegistered(mask, &errors);
    for (const FileError& error : errors) {
        err() << i18n("Warning: %1", error.toString()) << Qt::endl;
    }
    printListing(listing);
    return ExitSuccess;
}

int installLayout(RegistrationManager& manager, const QString& symbolsPath, const LayoutDefinition& layout)
{
    LayoutDefinition definition = layout;
    const FileError readError = Utils::readTextFile(symbolsPath, &definition.body);
    if (!readError.isOk()) {
        err() << i18n("Error: %1", readError.toString()) << Qt::endl;
        return ExitFailure;
    }

    if (!manager.isSystemScope()) {
        const FileError setupError = manager.ensureUserConfigReady();
        if (!setupError.isOk()) {
            err() << i18n("Error: %1", setupError.toString()) << Qt::endl;
            return setupError.kind == FileError::Kind::PermissionDenied ? ExitPermissionDenied : ExitFailure;
        }
        if (!XkbPaths::isWaylandSession()) {
            err() << i18n("Warning: user-space layouts are only used by Wayland sessions.") << Qt::endl;
        }
    }

    LayoutIndex index;
    if (!index.add(definition)) {
        err() << i18n("Locale and variant names cannot be empty.") << Qt::endl;
        return ExitUsage;
    }
    return reportResult(manager.commit(std::move(index)));
}

int removeLayouts(RegistrationManager& manager, const QStringList& masks)
{
    LayoutIndex index;
    QList<FileError> errors;
    for (const QString& mask : masks) {
        const VariantListing matching = manager.listRegistered(mask, &errors);
        if (matching.isEmpty()) {
            err() << i18n("No installed layout matches \"%1\".", mask) << Qt::endl;
        }
        for (auto locale = matching.constBegin(); locale != matching.constEnd(); ++locale) {
            for (auto variant = locale->constBegin(); variant != locale->constEnd(); ++variant) {
                index.remove(locale.key(), variant.key());
            }
        }
    }

    for (const FileError& error : errors) {
        err() << i18n("Warning: %1", error.toString()) << Qt::endl;
    }

    const int result = reportResult(manager.commit(std::move(index)));
    if (result != ExitSuccess || errors.isEmpty()) {
        return result;
    }
    // Unreadable files may hide installed layouts: do not report a clean run
    const bool denied = std::any_of(errors.cbegin(), errors.cend(), [](const FileError& error) {
        return error.kind == FileError::Kind::PermissionDenied;
    });
    return denied ? ExitPermissionDenied : ExitFailure;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("xkalamine");

    KAboutData aboutData(QStringLiteral("xkalamine"), i18n("XKalamine"), QString::fromLatin1(XKalamine::VERSION_STRING),
                         i18n("Install and remove custom keyboard layouts in XKB"), KAboutLicense::GPL_V3,
                         i18n("(c) 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption systemOption(QStringLiteral("system"),
                                    i18n("Use the system XKB configuration (%1)", XkbPaths::systemRoot()));
    QCommandLineOption rootOption(QStringLiteral("root"), i18n("Use the XKB configuration in this directory"),
                                  QStringLiteral("dir"));
    QCommandLineOption allOption(QStringList{QStringLiteral("a"), QStringLiteral("all")},
                                 i18n("list: show every declared layout, installed or not"));
    QCommandLineOption localeOption(QStringList{QStringLiteral("l"), QStringLiteral("locale")},
                                    i18n("install: XKB locale of the layout"), QStringLiteral("locale"));
    QCommandLineOption variantOption(QStringList{QStringLiteral("n"), QStringLiteral("variant")},
                                     i18n("install: variant name of the layout"), QStringLiteral("name"));
    QCommandLineOption descriptionOption(QStringList{QStringLiteral("d"), QStringLiteral("description")},
                                         i18n("install: description shown by layout selectors"),
                                         QStringLiteral("text"));

    parser.addOptions({systemOption, rootOption, allOption, localeOption, variantOption, descriptionOption});
    parser.addPositionalArgument(QStringLiteral("command"), i18n("list, install, remove or clean"));
    parser.addPositionalArgument(QStringLiteral("arguments"),
                                 i18n("list: [mask]; install: <symbols-file>; remove: <locale/variant>..."),
                                 QStringLiteral("[arguments...]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString command = arguments.takeFirst();

    const bool systemScope = parser.isSet(systemOption);
    const QString root = parser.isSet(rootOption) ? parser.value(rootOption) : XkbPaths::root(systemScope);
    RegistrationManager manager(root, systemScope);
    qCDebug(lcCli) << "Using XKB root" << manager.rootDirectory() << "system:" << systemScope;

    QObject::connect(&manager, &RegistrationManager::fileProcessing, [](const QString& filePath) {
        out() << "... " << filePath << Qt::endl;
    });
    QObject::connect(&manager, &RegistrationManager::variantUpdated,
                     [](const QString& locale, const QString& name, bool installed) {
                         out() << "      " << (installed ? '+' : '-') << ' ' << locale << '/' << name << Qt::endl;
                     });

    if (command == QLatin1String("list")) {
        return listLayouts(manager, arguments.value(0), parser.isSet(allOption));
    }

    if (command == QLatin1String("install")) {
        if (arguments.size() != 1 || !parser.isSet(localeOption) || !parser.isSet(variantOption)) {
            err() << i18n("Usage: xkalamine install <symbols-file> --locale <locale> --variant <name> "
                          "[--description <text>]")
                  << Qt::endl;
            return ExitUsage;
        }
        LayoutDefinition layout;
        layout.locale = parser.value(localeOption);
        layout.name = parser.value(variantOption);
        layout.description = parser.isSet(descriptionOption) ? parser.value(descriptionOption) : layout.name;
        if (layout.locale.isEmpty() || layout.name.isEmpty()) {
            err() << i18n("Locale and variant names cannot be empty.") << Qt::endl;
            return ExitUsage;
        }
        if (layout.locale.contains(QLatin1Char('/')) || layout.name.contains(QLatin1Char('/'))) {
            err() << i18n("Locale and variant names cannot contain '/'.") << Qt::endl;
            return ExitUsage;
        }
        return installLayout(manager, arguments.constFirst(), layout);
    }

    if (command == QLatin1String("remove")) {
        if (arguments.isEmpty()) {
            err() << i18n("Usage: xkalamine remove <locale/variant>...") << Qt::endl;
            return ExitUsage;
        }
        return removeLayouts(manager, arguments);
    }

    if (command == QLatin1String("clean")) {
        return reportResult(manager.dropLegacyTypeAttributes());
    }

    err() << i18n("Unknown command: %1", command) << Qt::endl;
    return ExitUsage;
}
