#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "layout.h"
#include "model.h"

// Источник случайности для рассадки. Внедряется явно,
// чтобы прогон можно было воспроизвести по seed.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Равномерное 32-битное значение
    virtual std::uint32_t next() = 0;

    // Равномерно в [0, bound), без смещения
    std::uint32_t below(std::uint32_t bound);
};

// std::mt19937: последовательность зафиксирована стандартом
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint32_t seed) : engine_(seed) {}

    std::uint32_t next() override { return static_cast<std::uint32_t>(engine_()); }

private:
    std::mt19937 engine_;
};

// Фишер–Йейтс поверх RandomSource
void shuffleIds(std::vector<int>& ids, RandomSource& rng);

struct RoomFill {
    int classroomId;
    int placed;
};

struct SeatingPlan {
    int examId;
    std::vector<SeatAssignment> seats;   // в порядке обхода мест
    std::vector<RoomFill> rooms;         // аудитории в порядке заполнения
};

// Бросает CapacityShortfallError (не хватает мест) или InvalidInputError.
// При ошибке ничего не возвращается: либо место есть у каждого студента, либо исключение.
SeatingPlan assignSeating(
    const Exam& exam,
    const std::vector<Student>& enrolledStudents,
    const std::vector<Classroom>& classroomCandidates,
    RandomSource& rng,
    SeatLayout layout = SeatLayout::Dense
);

SeatingPlan assignSeating(
    const Exam& exam,
    const std::vector<Student>& enrolledStudents,
    const std::vector<Classroom>& classroomCandidates,
    std::uint32_t randomSeed,
    SeatLayout layout = SeatLayout::Dense
);
