#pragma once

#include <QString>

#include "menuitemtheme.h"

class QSettings;

namespace PullDown {

/**
 * MenuThemeSettings - persists the ambient menu theme in QSettings.
 *
 * Only keys present in the settings become set theme fields, so a partial
 * file overrides just what it names and the cascade fills in the rest.
 * Text style sub-groups start from the static defaults for the brightness
 * and replace the keys they contain.
 *
 *   [PullDownMenu]
 *   destructiveColor=#ff3b30
 *   iconSize=22
 *   checkmark/codePoint=0x2713
 *   textStyle/pixelSize=16
 */
class MenuThemeSettings
{
public:
    static constexpr const char* kDefaultGroup = "PullDownMenu";

    static MenuItemTheme load(QSettings& settings,
                              Brightness brightness = Brightness::Light,
                              const QString& group = QLatin1String(kDefaultGroup));

    static void save(QSettings& settings,
                     const MenuItemTheme& theme,
                     const QString& group = QLatin1String(kDefaultGroup));

    static Brightness loadBrightness(QSettings& settings,
                                     Brightness fallback = Brightness::Light,
                                     const QString& group = QLatin1String(kDefaultGroup));
};

}
