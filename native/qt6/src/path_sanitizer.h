#pragma once
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QVector>

/**
 * PathSanitizer - pure name/path rewriting for the library tree.
 *
 * No function here touches the filesystem. Every function is deterministic and
 * sanitizeName/sanitizePath are idempotent.
 */
class PathSanitizer {
public:
    // Longest segment we produce, in UTF-8 bytes (also bounds the character count).
    static constexpr int MAX_NAME_BYTES = 200;

    // Replacement for names that sanitize down to nothing.
    static QString placeholderName() { return QStringLiteral("unnamed_file"); }

    // Characters rejected by Windows/NTFS in a path segment.
    static QString illegalCharacters() { return QStringLiteral("<>:\"|?*"); }

    struct Substitution {
        char16_t from;
        const char* to; // UTF-8
    };
    // Full-width punctuation folded to its half-width form, applied in order.
    static const QVector<Substitution>& substitutionTable();

    // Season markers tried in order; the first pattern that matches wins.
    static const QVector<QRegularExpression>& seasonPatterns();

    static QString sanitizeName(const QString& raw);

    // Sanitizes every segment except the root / drive / UNC prefix. '\' and '/'
    // both separate segments on input; the result always uses '/'.
    static QString sanitizePath(const QString& rawPath);

    // Splits a '/'- or '\'-separated relative target and sanitizes each segment.
    static QStringList splitRelativeTarget(const QString& raw);

    // Expands {season}, {season:02}, {season:03} and sanitizes the result.
    static QString generateFolderName(const QString& templ, uint season);

    // Season number from "Season 2", "S03", "第4季", ... ; 1 when nothing matches.
    static uint extractSeasonNumber(const QString& pathSegment);

    // Shortens `fileName` so it is at most `maxLength` characters, keeping the
    // extension. Returns an empty string when the extension alone does not fit.
    static QString shortenFileName(const QString& fileName, int maxLength);

private:
    static QString truncateUtf8(const QString& s, int maxBytes);
    static QString trimWhitespaceAndDots(const QString& s);
};
