#include "naming_template.h"

namespace NamingTemplate {

QString preview(const QString& pattern, const QString& title, int episode,
                const QString& group, int year, int season)
{
    const QString unknown = QStringLiteral("Unknown");
    QString result = pattern;

    // {title_romaji} has no separate source here, both use the given title
    result.replace("{title}", title);
    result.replace("{title_romaji}", title);

    result.replace("{episode}", QString("%1").arg(episode, 2, 10, QLatin1Char('0')));
    result.replace("{episode:02}", QString("%1").arg(episode, 2, 10, QLatin1Char('0')));
    result.replace("{episode:03}", QString("%1").arg(episode, 3, 10, QLatin1Char('0')));

    result.replace("{season:02}", QString("%1").arg(season, 2, 10, QLatin1Char('0')));
    result.replace("{season}", QString::number(season));

    result.replace("{group}", group.isEmpty() ? unknown : group);
    result.replace("{year}", year > 0 ? QString::number(year) : unknown);
    result.replace("{ext}", "mkv");
    return result;
}

} // namespace NamingTemplate
