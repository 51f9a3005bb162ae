#include "hue_lightcontrol.h"

namespace huelink {

QString colorModeName(ColorMode mode)
{
    switch (mode) {
    case ColorMode::HS:
        return QStringLiteral("hs");
    case ColorMode::CT:
        return QStringLiteral("ct");
    case ColorMode::XY:
        return QStringLiteral("xy");
    }
    return QString();
}

std::optional<ColorMode> colorModeFromName(const QString &name)
{
    const QString key = name.toLower();
    if (key == QLatin1String("hs"))
        return ColorMode::HS;
    if (key == QLatin1String("ct"))
        return ColorMode::CT;
    if (key == QLatin1String("xy"))
        return ColorMode::XY;
    return std::nullopt;
}

QString effectName(Effect effect)
{
    switch (effect) {
    case Effect::None:
        return QStringLiteral("none");
    case Effect::ColorLoop:
        return QStringLiteral("colorloop");
    }
    return QString();
}

std::optional<Effect> effectFromName(const QString &name)
{
    if (name == QLatin1String("none"))
        return Effect::None;
    if (name == QLatin1String("colorloop"))
        return Effect::ColorLoop;
    return std::nullopt;
}

QString alertName(Alert alert)
{
    switch (alert) {
    case Alert::None:
        return QStringLiteral("none");
    case Alert::Select:
        return QStringLiteral("select");
    case Alert::LSelect:
        return QStringLiteral("lselect");
    }
    return QString();
}

bool validateBrightness(int brightness, Error *error)
{
    if (brightness < 0 || brightness > 255)
        return fail(error, Error::validation(QStringLiteral("Brightness must be between 0-255")));
    return true;
}

bool validateHue(int hue, Error *error)
{
    if (hue < 0 || hue > 65535)
        return fail(error, Error::validation(QStringLiteral("Hue must be between 0-65535")));
    return true;
}

bool validateSaturation(int saturation, Error *error)
{
    if (saturation < 0 || saturation > 255)
        return fail(error, Error::validation(QStringLiteral("Saturation must be between 0-255")));
    return true;
}

bool validateCieXY(double x, double y, Error *error)
{
    // negated so NaN is rejected too
    if (!(x >= 0.0 && x <= 1.0 && y >= 0.0 && y <= 1.0))
        return fail(error, Error::validation(QStringLiteral("A cie coordinate must be between 0.0-1.0")));
    return true;
}

bool validateColorTemperature(int colorTemperature, Error *error)
{
    if (colorTemperature < 153 || colorTemperature > 500)
        return fail(error, Error::validation(QStringLiteral("Color temperature must be between 153-500")));
    return true;
}

} // namespace huelink
