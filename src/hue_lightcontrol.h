#pragma once

#include <functional>
#include <optional>

#include <QString>

#include "hue_error.h"

namespace huelink {

class Bridge;

inline constexpr int HUE_BLUE = 46920;

enum class ColorMode {
    HS,
    CT,
    XY
};

enum class Effect {
    None,
    ColorLoop
};

// Write-only, the bridge never reports an alert back.
enum class Alert {
    None,
    Select,
    LSelect
};

QString colorModeName(ColorMode mode);
std::optional<ColorMode> colorModeFromName(const QString &name);
QString effectName(Effect effect);
std::optional<Effect> effectFromName(const QString &name);
QString alertName(Alert alert);

// Range checks shared by every light-like object. All of them run before a
// request is built.
bool validateBrightness(int brightness, Error *error = nullptr);
bool validateHue(int hue, Error *error = nullptr);
bool validateSaturation(int saturation, Error *error = nullptr);
bool validateCieXY(double x, double y, Error *error = nullptr);
bool validateColorTemperature(int colorTemperature, Error *error = nullptr);

// Everything that can be switched and colored: a single light, a group on
// the bridge or a client side virtual group.
class LightControl
{
public:
    // Body of a state change transaction. Returning false aborts the
    // transaction, *error then says why.
    using Changes = std::function<bool(Error *error)>;

    virtual ~LightControl() = default;

    virtual int id() const = 0;
    virtual Bridge *bridge() const = 0;

    virtual QString name(Error *error = nullptr) = 0;
    virtual bool setName(const QString &name, Error *error = nullptr) = 0;

    // In units of 100 ms; unset leaves the bridge default.
    virtual std::optional<int> transitionTime() const = 0;
    virtual void setTransitionTime(std::optional<int> transitionTime) = 0;

    virtual bool setOn(bool on, Error *error = nullptr) = 0;
    virtual bool setBrightness(int brightness, Error *error = nullptr) = 0;
    virtual bool setHue(int hue, Error *error = nullptr) = 0;
    virtual bool setSaturation(int saturation, Error *error = nullptr) = 0;
    virtual bool setCieXY(double x, double y, Error *error = nullptr) = 0;
    virtual bool setColorTemperature(int colorTemperature, Error *error = nullptr) = 0;
    virtual bool setEffect(Effect effect, Error *error = nullptr) = 0;
    virtual bool setAlert(Alert alert, Error *error = nullptr) = 0;

    // Collects every state change made on this object by changes() and sends
    // them as one request. On failure the object is resynced from the bridge.
    virtual bool stateChangeTransaction(std::optional<int> transitionTime,
                                        const Changes &changes,
                                        Error *error = nullptr) = 0;

    virtual QString toString() const = 0;
};

} // namespace huelink
