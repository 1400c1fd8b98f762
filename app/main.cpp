#include <QGuiApplication>
#include <QCommandLineParser>
#include <QCursor>
#include <QDebug>
#include <QPainter>
#include <QSettings>
#include <QTimer>

#include "menu/menuoverlaywindow.h"
#include "menu/menuthemesettings.h"

using namespace PullDown;

namespace {

// Filled circle, used as custom icon content for the color items
class SwatchIcon : public CustomIconContent {
public:
    explicit SwatchIcon(const QColor& color) : m_Color(color) {}

    void paint(QPainter* painter, const QRectF& rect, const QColor&) const override
    {
        const qreal d = qMin(rect.width(), rect.height()) * 0.8;
        painter->setRenderHint(QPainter::Antialiasing);
        painter->setPen(Qt::NoPen);
        painter->setBrush(m_Color);
        painter->drawEllipse(QRectF(rect.center().x() - d / 2, rect.center().y() - d / 2, d, d));
    }

private:
    QColor m_Color;
};

MenuItemSpec actionItem(const QString& title, QChar glyph, std::function<void()> onTap)
{
    MenuItemSpec spec;
    spec.title = title;
    spec.icon = IconContent::fromGlyph(IconGlyph{glyph, QString()});
    spec.onTap = std::move(onTap);
    return spec;
}

MenuItemSpec colorItem(const QString& title, const QColor& color, bool selected,
                       std::function<void()> onTap)
{
    MenuItemSpec spec;
    spec.title = title;
    spec.icon = IconContent::fromCustom(std::make_shared<SwatchIcon>(color));
    spec.selected = selected;
    spec.tapPolicy = TapPolicy::Immediate;
    spec.onTap = std::move(onTap);
    return spec;
}

}

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pulldown-demo"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Shows a pull-down menu at the cursor."));
    parser.addHelpOption();
    QCommandLineOption themeOption(QStringLiteral("theme"),
                                   QStringLiteral("Load the ambient menu theme from an INI file."),
                                   QStringLiteral("file"));
    QCommandLineOption darkOption(QStringLiteral("dark"), QStringLiteral("Use the dark appearance."));
    QCommandLineOption scaleOption(QStringLiteral("text-scale"),
                                   QStringLiteral("Text scale factor (default 1.0)."),
                                   QStringLiteral("factor"), QStringLiteral("1.0"));
    parser.addOption(themeOption);
    parser.addOption(darkOption);
    parser.addOption(scaleOption);
    parser.process(app);

    Brightness brightness = parser.isSet(darkOption) ? Brightness::Dark : Brightness::Light;
    MenuItemTheme theme;
    if (parser.isSet(themeOption)) {
        QSettings settings(parser.value(themeOption), QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            qWarning() << "[PullDownMenu] Unable to read theme file" << parser.value(themeOption);
        } else {
            if (!parser.isSet(darkOption))
                brightness = MenuThemeSettings::loadBrightness(settings, brightness);
            theme = MenuThemeSettings::load(settings, brightness);
        }
    }

    bool ok = false;
    qreal textScale = parser.value(scaleOption).toDouble(&ok);
    if (!ok || textScale <= 0) {
        qWarning() << "[PullDownMenu] Invalid text scale" << parser.value(scaleOption) << "- using 1.0";
        textScale = 1.0;
    }

    MenuOverlayWindow menu;
    menu.setBrightness(brightness);
    menu.setTheme(theme);
    menu.setTextScaleFactor(textScale);

    std::vector<MenuItemSpec> row;
    row.push_back(actionItem(QStringLiteral("Cut"), QChar(0x2702), [] { qInfo() << "Cut"; }));
    row.push_back(actionItem(QStringLiteral("Copy"), QChar(0x2398), [] { qInfo() << "Copy"; }));
    row.push_back(actionItem(QStringLiteral("Paste"), QChar(0x2397), [] { qInfo() << "Paste"; }));
    menu.setActionsRow(std::move(row), SizeClassification::Standard);

    std::vector<MenuItemSpec> items;

    MenuItemSpec share = actionItem(QStringLiteral("Share"), QChar(0x21EA), [] { qInfo() << "Share"; });
    share.tapPolicy = TapPolicy::PopThenDelayedInvoke;
    items.push_back(share);

    items.push_back(colorItem(QStringLiteral("Red"), QColor(255, 59, 48), true, [] { qInfo() << "Red"; }));
    items.push_back(colorItem(QStringLiteral("Blue"), QColor(0, 122, 255), false, [] { qInfo() << "Blue"; }));

    MenuItemSpec archived;
    archived.title = QStringLiteral("Archived\nNot available offline");
    archived.enabled = false;
    archived.onTap = [] { qInfo() << "Archived"; };
    items.push_back(archived);

    MenuItemSpec remove = actionItem(QStringLiteral("Delete"), QChar(0x2715), [] { qInfo() << "Delete"; });
    remove.isDestructive = true;
    items.push_back(remove);

    menu.setItems(std::move(items));

    // Leave time for delayed actions to run before exiting
    QObject::connect(&menu, &MenuOverlayWindow::closed, &app, [&app]() {
        QTimer::singleShot(MenuOverlayWindow::kCloseDurationMs * 3, &app, &QCoreApplication::quit);
    });

    menu.showAt(QCursor::pos());

    return app.exec();
}
