#include "path_sanitizer.h"
#include <QFileInfo>
#include <utility>

const QVector<PathSanitizer::Substitution>& PathSanitizer::substitutionTable()
{
    static const QVector<Substitution> table = {
        { u'☆', "★" },
        { u'～', "~" },
        { u'＆', "&" },
        { u'！', "!" },
        { u'？', "?" },
        { u'：', ":" },
        { u'；', ";" },
        { u'，', "," },
        { u'。', "." },
        { u'（', "(" },
        { u'）', ")" },
        { u'【', "[" },
        { u'】', "]" },
        { u'｛', "{" },
        { u'｝', "}" },
        { u'　', " " },
    };
    return table;
}

const QVector<QRegularExpression>& PathSanitizer::seasonPatterns()
{
    static const QVector<QRegularExpression> patterns = {
        QRegularExpression(QStringLiteral(R"(Season\s*(\d+))")),
        QRegularExpression(QStringLiteral(R"(S(\d+))")),
        QRegularExpression(QStringLiteral("第(\\d+)季")),
        QRegularExpression(QStringLiteral(R"(season\s*(\d+))"), QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral(R"(s(\d+))")),
    };
    return patterns;
}

QString PathSanitizer::trimWhitespaceAndDots(const QString& s)
{
    int begin = 0;
    int end = s.size();
    auto trimmable = [](QChar c) { return c.isSpace() || c == QLatin1Char('.'); };
    while (begin < end && trimmable(s.at(begin))) ++begin;
    while (end > begin && trimmable(s.at(end - 1))) --end;
    return s.mid(begin, end - begin);
}

QString PathSanitizer::truncateUtf8(const QString& s, int maxBytes)
{
    int bytes = 0;
    int i = 0;
    while (i < s.size()) {
        const QChar c = s.at(i);
        int units = 1;
        int len = 0;
        if (c.isHighSurrogate() && i + 1 < s.size() && s.at(i + 1).isLowSurrogate()) {
            units = 2;
            len = 4;
        } else if (c.unicode() < 0x80) {
            len = 1;
        } else if (c.unicode() < 0x800) {
            len = 2;
        } else {
            len = 3;
        }
        if (bytes + len > maxBytes) break;
        bytes += len;
        i += units;
    }
    return s.left(i);
}

QString PathSanitizer::sanitizeName(const QString& raw)
{
    QString s = raw;

    for (const Substitution& sub : substitutionTable()) {
        s.replace(QChar(sub.from), QString::fromUtf8(sub.to));
    }

    // After the table: it folds '？' and '：' onto characters that are illegal.
    const QString illegal = illegalCharacters();
    for (QChar& c : s) {
        if (illegal.contains(c)) c = QLatin1Char('_');
    }

    QString cleaned;
    cleaned.reserve(s.size());
    for (const QChar c : std::as_const(s)) {
        if (c.category() == QChar::Other_Control) continue;
        cleaned.append(c);
    }

    cleaned = trimWhitespaceAndDots(cleaned);
    if (cleaned.isEmpty()) {
        return placeholderName();
    }

    if (cleaned.toUtf8().size() > MAX_NAME_BYTES) {
        cleaned = trimWhitespaceAndDots(truncateUtf8(cleaned, MAX_NAME_BYTES));
        if (cleaned.isEmpty()) cleaned = placeholderName();
    }
    return cleaned;
}

QString PathSanitizer::sanitizePath(const QString& rawPath)
{
    QString p = rawPath;
    p.replace(QLatin1Char('\\'), QLatin1Char('/'));

    QString prefix;
#ifdef Q_OS_WIN
    if (p.startsWith(QLatin1String("//"))) {
        // UNC: //server/share stays as-is
        const int s1 = p.indexOf(QLatin1Char('/'), 2);
        const int s2 = s1 < 0 ? -1 : p.indexOf(QLatin1Char('/'), s1 + 1);
        prefix = s2 < 0 ? p : p.left(s2);
        p = s2 < 0 ? QString() : p.mid(s2);
    } else if (p.size() >= 2 && p.at(1) == QLatin1Char(':') && p.at(0).isLetter()) {
        prefix = p.left(2);
        p = p.mid(2);
    }
#endif

    const bool rooted = p.startsWith(QLatin1Char('/'));
    QStringList out;
    const QStringList segments = p.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString& seg : segments) {
        if (seg == QLatin1String(".")) continue;
        if (seg == QLatin1String("..")) { out.append(seg); continue; }
        out.append(sanitizeName(seg));
    }

    QString result = prefix;
    if (rooted) result += QLatin1Char('/');
    result += out.join(QLatin1Char('/'));
    return result;
}

QStringList PathSanitizer::splitRelativeTarget(const QString& raw)
{
    QString cleaned = raw;
    cleaned.replace(QLatin1Char('\\'), QLatin1Char('/'));
    QStringList parts;
    const QStringList segments = cleaned.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString& seg : segments) {
        parts.append(sanitizeName(seg));
    }
    return parts;
}

QString PathSanitizer::generateFolderName(const QString& templ, uint season)
{
    QString name = templ;
    name.replace(QLatin1String("{season}"), QString::number(season));
    name.replace(QLatin1String("{season:02}"), QString("%1").arg(season, 2, 10, QLatin1Char('0')));
    name.replace(QLatin1String("{season:03}"), QString("%1").arg(season, 3, 10, QLatin1Char('0')));
    return sanitizeName(name);
}

uint PathSanitizer::extractSeasonNumber(const QString& pathSegment)
{
    for (const QRegularExpression& re : seasonPatterns()) {
        const QRegularExpressionMatch m = re.match(pathSegment);
        if (!m.hasMatch()) continue;
        bool ok = false;
        const uint season = m.captured(1).toUInt(&ok);
        if (ok) return season;
    }
    return 1;
}

QString PathSanitizer::shortenFileName(const QString& fileName, int maxLength)
{
    const QString suffix = QFileInfo(fileName).suffix();
    const QString ext = suffix.isEmpty() ? QString() : QLatin1Char('.') + suffix;
    const int keep = maxLength - ext.size();
    if (keep < 1) return QString();

    QString stem = fileName.left(fileName.size() - ext.size());
    if (stem.size() > keep) {
        stem.truncate(keep);
        if (!stem.isEmpty() && stem.back().isHighSurrogate()) stem.chop(1);
    }
    return sanitizeName(stem + ext);
}
