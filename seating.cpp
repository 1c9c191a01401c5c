#include "seating.h"

#include "errors.h"
#include "logger.h"
#include "validator.h"

#include <algorithm>
#include <limits>
#include <set>
#include <string>

std::uint32_t RandomSource::below(std::uint32_t bound) {
    if (bound <= 1) return 0;
    // отбрасываем хвост, который дал бы смещение по модулю
    const std::uint32_t limit =
        std::numeric_limits<std::uint32_t>::max() -
        std::numeric_limits<std::uint32_t>::max() % bound;
    std::uint32_t x = next();
    while (x >= limit) x = next();
    return x % bound;
}

void shuffleIds(std::vector<int>& ids, RandomSource& rng) {
    for (size_t i = ids.size(); i > 1; --i) {
        size_t j = rng.below(static_cast<std::uint32_t>(i));
        std::swap(ids[i - 1], ids[j]);
    }
}

SeatingPlan assignSeating(
    const Exam& exam,
    const std::vector<Student>& enrolledStudents,
    const std::vector<Classroom>& classroomCandidates,
    RandomSource& rng,
    SeatLayout layout
) {
    std::set<int> roomIds;
    for (const Classroom& r : classroomCandidates) {
        validateClassroom(r);
        if (!roomIds.insert(r.id).second) {
            throw InvalidInputError("duplicate classroom id " + std::to_string(r.id));
        }
    }

    std::vector<int> students;
    students.reserve(enrolledStudents.size());
    for (const Student& s : enrolledStudents) students.push_back(s.id);
    std::sort(students.begin(), students.end());
    if (std::adjacent_find(students.begin(), students.end()) != students.end()) {
        throw InvalidInputError("student listed twice for exam " + std::to_string(exam.id));
    }

    SeatingPlan plan;
    plan.examId = exam.id;

    if (students.empty()) {
        logInfo("Экзамен id=" + std::to_string(exam.id) + ": студентов нет, рассадка пустая");
        return plan;
    }

    // сначала большие аудитории, при равенстве по id
    std::vector<Classroom> rooms = classroomCandidates;
    std::sort(rooms.begin(), rooms.end(),
        [&](const Classroom& a, const Classroom& b) {
            int ca = effectiveCapacity(a, layout);
            int cb = effectiveCapacity(b, layout);
            if (ca != cb) return ca > cb;
            return a.id < b.id;
        }
    );

    const int required = static_cast<int>(students.size());
    if (!capacitySufficient(rooms, required, layout)) {
        int available = 0;
        for (const Classroom& r : rooms) available += effectiveCapacity(r, layout);
        logWarning("Экзамен id=" + std::to_string(exam.id) + ": студентов " +
                   std::to_string(required) + ", мест " + std::to_string(available));
        throw CapacityShortfallError(required, available);
    }

    shuffleIds(students, rng);

    size_t next = 0;
    for (const Classroom& r : rooms) {
        if (next >= students.size()) break;

        std::vector<SeatCoordinate> coords = seatCoordinates(r, layout);
        const int cap = effectiveCapacity(r, layout);

        int placed = 0;
        for (const SeatCoordinate& c : coords) {
            if (next >= students.size() || placed >= cap) break;
            plan.seats.push_back(SeatAssignment{exam.id, r.id, c.row, c.column, students[next]});
            ++next;
            ++placed;
        }
        plan.rooms.push_back(RoomFill{r.id, placed});

        logDebug("Аудитория " + (r.code.empty() ? std::to_string(r.id) : r.code) +
                 ": размещено " + std::to_string(placed) + " из " + std::to_string(cap));
    }

    ScheduleValidator validator;
    ValidationResult vr = validator.checkSeating(exam, rooms, students, plan.seats, layout);
    if (!vr.ok) {
        throw VerificationError("seating failed verification: " + vr.errors.front());
    }

    logInfo("Рассадка экзамена id=" + std::to_string(exam.id) + ": " +
            std::to_string(plan.seats.size()) + " студентов в " +
            std::to_string(plan.rooms.size()) + " аудиториях");
    return plan;
}

SeatingPlan assignSeating(
    const Exam& exam,
    const std::vector<Student>& enrolledStudents,
    const std::vector<Classroom>& classroomCandidates,
    std::uint32_t randomSeed,
    SeatLayout layout
) {
    SeededRandomSource rng(randomSeed);
    return assignSeating(exam, enrolledStudents, classroomCandidates, rng, layout);
}
