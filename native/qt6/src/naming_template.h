#pragma once
#include <QString>

// Episode file name preview for user templates like
// "{title_romaji} - S{season}E{episode:02}".
namespace NamingTemplate {

// Empty group and year <= 0 render as "Unknown"; {ext} renders as "mkv".
QString preview(const QString& pattern, const QString& title, int episode,
                const QString& group = QString(), int year = 0, int season = 1);

} // namespace NamingTemplate
