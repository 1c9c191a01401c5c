#pragma once

#include <string>
#include <vector>

#include "model.h"

enum class SeatLayout {
    Dense,   // все места за каждой партой
    Spaced   // через место: парта на 2 -> место 2, на 3 -> 1 и 3, на 4 -> 1 и 4
};

const char* seatLayoutToString(SeatLayout layout);
bool seatLayoutFromString(const std::string& s, SeatLayout& out);

// Проверяет размеры аудитории, бросает InvalidInputError
void validateClassroom(const Classroom& room);

// Координаты мест в порядке обхода: ряд за рядом, слева направо
std::vector<SeatCoordinate> seatCoordinates(const Classroom& room, SeatLayout layout);

// min(capacity, число мест в раскладке)
int effectiveCapacity(const Classroom& room, SeatLayout layout);
