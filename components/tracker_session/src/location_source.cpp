#include "tracker_session/location_source.hpp"

namespace tracker_session {

StaticLocationSource::StaticLocationSource(double latitude, double longitude) {
    setCoordinates(latitude, longitude);
}

std::optional<Position> StaticLocationSource::currentPosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!position_) {
        return std::nullopt;
    }
    Position position = *position_;
    position.timestamp = std::chrono::system_clock::now();
    return position;
}

void StaticLocationSource::setPosition(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = position;
}

void StaticLocationSource::setCoordinates(double latitude, double longitude) {
    Position position;
    position.latitude = latitude;
    position.longitude = longitude;
    position.accuracy = 5.0;
    position.isValid = true;
    setPosition(position);
}

void StaticLocationSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    position_.reset();
}

} // namespace tracker_session
