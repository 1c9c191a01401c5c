#include "layout.h"

#include "errors.h"

#include <algorithm>
#include <string>

static std::vector<int> usedSeatsInGroup(int seatGroup, SeatLayout layout) {
    if (layout == SeatLayout::Dense) {
        std::vector<int> all;
        for (int s = 1; s <= seatGroup; ++s) all.push_back(s);
        return all;
    }

    switch (seatGroup) {
        case 2: return {2};
        case 3: return {1, 3};
        case 4: return {1, 4};
    }
    return {};
}

const char* seatLayoutToString(SeatLayout layout) {
    switch (layout) {
        case SeatLayout::Dense:  return "dense";
        case SeatLayout::Spaced: return "spaced";
    }
    return "dense";
}

bool seatLayoutFromString(const std::string& s, SeatLayout& out) {
    if (s == "dense") {
        out = SeatLayout::Dense;
        return true;
    }
    if (s == "spaced") {
        out = SeatLayout::Spaced;
        return true;
    }
    return false;
}

void validateClassroom(const Classroom& room) {
    std::string who = "classroom " + std::to_string(room.id);
    if (!room.code.empty()) who += " (" + room.code + ")";

    if (room.capacity <= 0) {
        throw InvalidInputError(who + " has non-positive capacity");
    }
    if (room.rows <= 0 || room.columns <= 0) {
        throw InvalidInputError(who + " has an empty seat grid");
    }
    if (room.seatGroup < 2 || room.seatGroup > 4) {
        throw InvalidInputError(who + " seat group must be 2, 3 or 4, got " +
                                std::to_string(room.seatGroup));
    }
}

std::vector<SeatCoordinate> seatCoordinates(const Classroom& room, SeatLayout layout) {
    std::vector<SeatCoordinate> seats;
    if (room.rows <= 0 || room.columns <= 0) return seats;

    std::vector<int> inGroup = usedSeatsInGroup(room.seatGroup, layout);
    seats.reserve(static_cast<size_t>(room.rows) * room.columns * inGroup.size());

    for (int r = 0; r < room.rows; ++r) {
        for (int c = 0; c < room.columns; ++c) {
            for (int s : inGroup) {
                seats.push_back(SeatCoordinate{r + 1, c * room.seatGroup + s});
            }
        }
    }
    return seats;
}

int effectiveCapacity(const Classroom& room, SeatLayout layout) {
    if (room.capacity <= 0) return 0;
    int seats = static_cast<int>(seatCoordinates(room, layout).size());
    return std::min(room.capacity, seats);
}
