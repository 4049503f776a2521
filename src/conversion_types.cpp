#include "conversion_types.h"
#include "conversion_strategy.h"

#include <QFileInfo>

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::ToolNotFound: return "ToolNotFound";
        case ErrorKind::InputNotFound: return "InputNotFound";
        case ErrorKind::NoFilesFound: return "NoFilesFound";
        case ErrorKind::ConversionFailed: return "ConversionFailed";
        case ErrorKind::TimedOut: return "TimedOut";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::ProbeFailed: return "ProbeFailed";
        case ErrorKind::SameFileSelected: return "SameFileSelected";
        case ErrorKind::IdenticalFiles: return "IdenticalFiles";
    }
    return QString();
}

ExitCode exitCodeFor(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None: return ExitOk;
        case ErrorKind::ToolNotFound:
        case ErrorKind::InputNotFound:
        case ErrorKind::NoFilesFound:
            return ExitUsage;
        default:
            return ExitFailure;
    }
}

QString ConversionResult::message() const
{
    const QString name = QFileInfo(inputPath).fileName();
    if (success) {
        return QString("[OK] %1 (%2)").arg(name, Strategy::name(strategy));
    }
    switch (error) {
        case ErrorKind::Cancelled:
            return QString("[Cancelled] %1").arg(name);
        case ErrorKind::TimedOut:
            return QString("[ERROR] %1: timed out (%2)").arg(name, Strategy::name(strategy));
        case ErrorKind::InputNotFound:
            return QString("[ERROR] Source not found: %1").arg(inputPath);
        case ErrorKind::ToolNotFound:
            return QString("[ERROR] %1: FFmpeg not found").arg(name);
        default:
            break;
    }
    if (diagnostic.isEmpty()) return QString("[ERROR] %1: conversion failed").arg(name);
    return QString("[ERROR] %1: %2").arg(name, diagnostic);
}
