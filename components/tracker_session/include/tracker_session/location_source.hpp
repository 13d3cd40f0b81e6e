#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace tracker_session {

/**
 * @brief A position sample from the positioning provider
 */
struct Position {
    double latitude = 0.0;
    double longitude = 0.0;
    double speedKmh = 0.0;
    double headingDeg = 0.0;
    double accuracy = 0.0;      ///< Meters
    uint8_t satellites = 8;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    bool isValid = false;

    /**
     * @brief A usable fix: marked valid and not the (0,0) placeholder
     */
    bool isFix() const {
        return isValid && !(latitude == 0.0 && longitude == 0.0);
    }
};

/**
 * @class ILocationSource
 * @brief Pull interface to the positioning provider
 */
class ILocationSource {
public:
    virtual ~ILocationSource() = default;

    /**
     * @brief Latest known position
     *
     * @return Position, or std::nullopt when the provider has nothing yet
     */
    virtual std::optional<Position> currentPosition() = 0;
};

/**
 * @class StaticLocationSource
 * @brief Thread-safe location source holding a settable position
 *
 * Used for fixed installations and tests. Positions are restamped with
 * the current time when read.
 */
class StaticLocationSource : public ILocationSource {
public:
    StaticLocationSource() = default;

    /**
     * @brief Start with a valid fix at the given coordinates
     */
    StaticLocationSource(double latitude, double longitude);

    std::optional<Position> currentPosition() override;

    void setPosition(const Position& position);
    void setCoordinates(double latitude, double longitude);
    void clear();

private:
    std::mutex mutex_;
    std::optional<Position> position_;
};

} // namespace tracker_session
