#pragma once

#include <QString>

#include <optional>

namespace pa {

// Pulls numeric magnitudes out of free-form spec text. Blank text and
// "N/A" parse as absent; nothing here fails.
class SpecParser {
public:
    static std::optional<int> batteryMah(const QString& battery);

    // First "<N> MP" figure, i.e. the main camera.
    static std::optional<int> cameraMegapixels(const QString& camera);

    static std::optional<int> ramGigabytes(const QString& ram);

    // USD amount ("$1,299", "$ 1,049.99"), else EUR amount.
    static std::optional<double> priceUsd(const QString& price);

    static bool mentionsHighRefresh(const QString& display);
    static bool mentionsAmoled(const QString& display);

private:
    static bool isBlank(const QString& text);
};

} // namespace pa
