#include <map>
#include <string>
#include <vector>

#include "config.h"
#include "enrollment.h"
#include "layout.h"
#include "model.h"

#pragma once

// --- чистые предикаты, вызываются перед каждым размещением ---

// Окна [start, end + gap) пересекаются в одну и ту же дату
bool overlaps(const Exam& a, const Exam& b, int gapMinutes = 0);

// Превысит ли proposed лимит экзаменов в день для курса обучения classLevel.
// courseLevels: courseId -> classLevel
bool dailyCountExceeded(
    int classLevel,
    const std::string& date,
    const Exam& proposed,
    const std::vector<Exam>& committed,
    const std::map<int, int>& courseLevels,
    int dailyCap
);

bool capacitySufficient(
    const std::vector<Classroom>& classrooms,
    int studentCount,
    SeatLayout layout = SeatLayout::Dense
);

// Дата в окне, день недели не исключён, время внутри рабочих часов
bool withinSchedulingBounds(const Exam& exam, const ScheduleConfig& cfg);

struct ValidationResult {
    bool ok;                             // true, если ошибок нет
    std::vector<std::string> errors;     // нарушенные инварианты
    std::vector<std::string> warnings;   // необязательные замечания
};

class ScheduleValidator {
    public:
        ValidationResult checkAll(
            const std::vector<Course>& courses,
            const EnrollmentIndex& index,
            const std::vector<Classroom>& classrooms,
            const ScheduleConfig& cfg,
            const std::vector<Exam>& exams
        );

        ValidationResult checkSeating(
            const Exam& exam,
            const std::vector<Classroom>& classrooms,
            const std::vector<int>& enrolledStudentIds,
            const std::vector<SeatAssignment>& seats,
            SeatLayout layout
        );

    private:
        void checkAllExamsAssigned(
            const std::vector<Course>& courses,
            const std::vector<Exam>& exams,
            ValidationResult& result
        );

        void checkStudentConflicts(
            const EnrollmentIndex& index,
            const std::vector<Exam>& exams,
            int breakMinutes,
            ValidationResult& result
        );

        void checkClassroomConflicts(
            const EnrollmentIndex& index,
            const std::vector<Classroom>& classrooms,
            const std::vector<Exam>& exams,
            const ScheduleConfig& cfg,
            ValidationResult& result
        );

        void checkSchedulingBounds(
            const std::vector<Exam>& exams,
            const ScheduleConfig& cfg,
            ValidationResult& result
        );

        void checkMaxExamsPerDayForLevel(
            const std::vector<Course>& courses,
            const std::vector<Exam>& exams,
            int maxPerDay,
            ValidationResult& result
        );
};
