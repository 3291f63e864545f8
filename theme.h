#ifndef THEME_H
#define THEME_H

#include <QString>

enum class Theme { Light, Dark };

QString themeStyleSheet(Theme theme);
Theme toggledTheme(Theme theme);
QString themeName(Theme theme);

#endif // THEME_H
