#include "theme.h"

namespace {

struct ThemeColors
{
    const char *window;
    const char *panel;
    const char *text;
    const char *title;
    const char *button;
    const char *buttonText;
    const char *buttonBorder;
    const char *buttonHover;
    const char *buttonHoverBorder;
    const char *buttonPressed;
    const char *edit;
    const char *editBorder;
    const char *selection;
    const char *selectionText;
    const char *paneBorder;
    const char *tab;
    const char *tabHover;
    const char *frame;
};

const ThemeColors kLight = {
    "#f0f0f0", "#ffffff", "#333333", "#0078d7",
    "#e0e0e0", "#333333", "#cccccc", "#d0d0d0", "#bbbbbb", "#c0c0c0",
    "#ffffff", "#cccccc", "#aaddff", "#333333",
    "#cccccc", "#e0e0e0", "#d0d0d0", "#e8e8e8"
};

const ThemeColors kDark = {
    "#2e2e2e", "#3c3c3c", "#e0e0e0", "#87ceeb",
    "#555555", "#ffffff", "#666666", "#6a6a6a", "#888888", "#4a4a4a",
    "#4a4a4a", "#666666", "#0078d7", "#ffffff",
    "#555555", "#555555", "#6a6a6a", "#424242"
};

// The tab pane shares the panel color in the dark theme and the window color in the light one.
QString buildStyleSheet(const ThemeColors &c, const char *pane)
{
    return QStringLiteral(
        "QMainWindow { background-color: %1; color: %3; }\n"
        "QWidget { background-color: %2; color: %3;"
        " font-family: \"Segoe UI\", \"Helvetica Neue\", Arial, sans-serif; font-size: 10pt; }\n"
        "QLabel { color: %3; padding: 2px; }\n"
        "QLabel#titleLabel { font-size: 12pt; font-weight: bold; color: %4; }\n"
        "QPushButton { background-color: %5; color: %6; border: 1px solid %7;"
        " border-radius: 5px; padding: 8px 15px; min-width: 80px; }\n"
        "QPushButton:hover { background-color: %8; border-color: %9; }\n"
        "QPushButton:pressed { background-color: %10; }\n"
        "QLineEdit, QTextEdit { background-color: %11; color: %3; border: 1px solid %12;"
        " border-radius: 5px; padding: 5px; }\n"
        "QTextEdit { font-family: \"Consolas\", \"DejaVu Sans Mono\", monospace; }\n"
        "QTreeView { background-color: %11; color: %3; border: 1px solid %12; border-radius: 5px;"
        " padding: 5px; selection-background-color: %13; selection-color: %14; }\n"
        "QTabWidget::pane { border: 1px solid %15; background-color: %18; border-radius: 5px; }\n"
        "QTabBar::tab { background: %16; color: %3; border: 1px solid %16; border-bottom-color: %18;"
        " border-top-left-radius: 4px; border-top-right-radius: 4px; padding: 8px 15px; margin-right: 2px; }\n"
        "QTabBar::tab:selected { background: %18; border-color: %15; border-bottom-color: %18; }\n"
        "QTabBar::tab:hover { background: %17; }\n"
        "QFrame { border: 1px solid %15; border-radius: 7px; background-color: %19; margin: 5px; padding: 5px; }\n"
        "QScrollArea { border: 1px solid %15; border-radius: 7px; background-color: %19; }\n"
        "QScrollArea > QWidget > QWidget { background-color: %19; }\n")
        .arg(QString::fromLatin1(c.window), QString::fromLatin1(c.panel), QString::fromLatin1(c.text),
             QString::fromLatin1(c.title), QString::fromLatin1(c.button), QString::fromLatin1(c.buttonText),
             QString::fromLatin1(c.buttonBorder), QString::fromLatin1(c.buttonHover),
             QString::fromLatin1(c.buttonHoverBorder))
        .arg(QString::fromLatin1(c.buttonPressed), QString::fromLatin1(c.edit), QString::fromLatin1(c.editBorder),
             QString::fromLatin1(c.selection), QString::fromLatin1(c.selectionText),
             QString::fromLatin1(c.paneBorder), QString::fromLatin1(c.tab), QString::fromLatin1(c.tabHover),
             QString::fromLatin1(pane))
        .arg(QString::fromLatin1(c.frame));
}

} // namespace

QString themeStyleSheet(Theme theme)
{
    if (theme == Theme::Dark)
        return buildStyleSheet(kDark, kDark.panel);
    return buildStyleSheet(kLight, kLight.window);
}

Theme toggledTheme(Theme theme)
{
    return theme == Theme::Light ? Theme::Dark : Theme::Light;
}

QString themeName(Theme theme)
{
    return theme == Theme::Dark ? QStringLiteral("dark") : QStringLiteral("light");
}
