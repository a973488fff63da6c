#include "core/device.hpp"

namespace lumen {

std::optional<PowerState> power_state_from_string(std::string_view text) {
    if (text == "on") return PowerState::On;
    if (text == "off") return PowerState::Off;
    return std::nullopt;
}

std::optional<ColorMode> color_mode_from_code(unsigned code) {
    switch (code) {
        case 1: return ColorMode::Color;
        case 2: return ColorMode::ColorTemperature;
        case 3: return ColorMode::Hsv;
        default: return std::nullopt;
    }
}

QString to_string(PowerState power) {
    return power == PowerState::On ? QStringLiteral("on") : QStringLiteral("off");
}

QString to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::Color: return QStringLiteral("color");
        case ColorMode::ColorTemperature: return QStringLiteral("color-temperature");
        case ColorMode::Hsv: return QStringLiteral("hsv");
    }
    return QStringLiteral("unknown");
}

} // namespace lumen
