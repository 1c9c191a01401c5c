#include "validator.h"
#include "calendar.h"
#include "logger.h"

#include <algorithm>
#include <set>
#include <utility>

// ==================== предикаты ====================

bool overlaps(const Exam& a, const Exam& b, int gapMinutes) {
    if (a.date != b.date) return false;
    // сумма в long long: большой перерыв не должен переполнять int
    long long gap = gapMinutes;
    return a.startMinutes < b.endMinutes + gap &&
           b.startMinutes < a.endMinutes + gap;
}

bool dailyCountExceeded(
    int classLevel,
    const std::string& date,
    const Exam& proposed,
    const std::vector<Exam>& committed,
    const std::map<int, int>& courseLevels,
    int dailyCap
) {
    auto levelOf = [&](int courseId) {
        auto it = courseLevels.find(courseId);
        return it == courseLevels.end() ? -1 : it->second;
    };

    int count = 0;
    for (const Exam& e : committed) {
        if (e.courseId == proposed.courseId) continue;
        if (e.date != date) continue;
        if (levelOf(e.courseId) == classLevel) ++count;
    }
    if (proposed.date == date && levelOf(proposed.courseId) == classLevel) {
        ++count;
    }
    return count > dailyCap;
}

bool capacitySufficient(
    const std::vector<Classroom>& classrooms,
    int studentCount,
    SeatLayout layout
) {
    long total = 0;
    for (const Classroom& r : classrooms) {
        total += effectiveCapacity(r, layout);
    }
    return total >= studentCount;
}

bool withinSchedulingBounds(const Exam& exam, const ScheduleConfig& cfg) {
    // формат YYYY-MM-DD, сравнение строк совпадает с хронологическим
    if (exam.date < cfg.window.startDate || exam.date > cfg.window.endDate) return false;

    int wd = isoWeekday(exam.date);
    if (wd == 0 || cfg.excludedWeekdays.count(wd)) return false;

    if (exam.startMinutes < cfg.hours.openMinutes) return false;
    if (exam.endMinutes > cfg.hours.closeMinutes) return false;
    return exam.startMinutes < exam.endMinutes;
}

// ==================== хелперы для сообщений ====================

static std::string describeExam(const Exam& e) {
    // вид "course 7 @ 2025-01-20 09:00-10:15"
    return "course " + std::to_string(e.courseId) + " @ " + e.date + " " +
           formatTime(e.startMinutes) + "-" + formatTime(e.endMinutes);
}

static void addError(ValidationResult& result, const std::string& tag, const std::string& msg) {
    result.ok = false;
    result.errors.push_back(msg);
    logError("[" + tag + "] " + msg);
}

// ==================== проверки расписания ====================

void ScheduleValidator::checkAllExamsAssigned(
    const std::vector<Course>& courses,
    const std::vector<Exam>& exams,
    ValidationResult& result
) {
    std::map<int, int> counts;
    for (const Course& c : courses) counts[c.id] = 0;

    for (const Exam& e : exams) {
        auto it = counts.find(e.courseId);
        if (it == counts.end()) {
            addError(result, "UnknownCourse",
                     "Exam " + std::to_string(e.id) + " refers to course " +
                     std::to_string(e.courseId) + " outside of the run.");
            continue;
        }
        it->second++;
    }

    for (const auto& p : counts) {
        if (p.second == 0) {
            addError(result, "ExamNotAssigned",
                     "Course " + std::to_string(p.first) + " has no exam in the schedule.");
        } else if (p.second > 1) {
            addError(result, "ExamMultiAssigned",
                     "Course " + std::to_string(p.first) + " is scheduled " +
                     std::to_string(p.second) + " times.");
        }
    }
}

void ScheduleValidator::checkStudentConflicts(
    const EnrollmentIndex& index,
    const std::vector<Exam>& exams,
    int breakMinutes,
    ValidationResult& result
) {
    for (size_t i = 0; i < exams.size(); ++i) {
        for (size_t j = i + 1; j < exams.size(); ++j) {
            const Exam& a = exams[i];
            const Exam& b = exams[j];
            if (!index.conflicting(a.courseId, b.courseId)) continue;
            if (!overlaps(a, b, breakMinutes)) continue;

            addError(result, "StudentConflict",
                     "Students share " + describeExam(a) + " and " + describeExam(b) +
                     " (break " + std::to_string(breakMinutes) + " min).");
        }
    }
}

void ScheduleValidator::checkClassroomConflicts(
    const EnrollmentIndex& index,
    const std::vector<Classroom>& classrooms,
    const std::vector<Exam>& exams,
    const ScheduleConfig& cfg,
    ValidationResult& result
) {
    std::map<int, const Classroom*> byId;
    for (const Classroom& r : classrooms) byId[r.id] = &r;

    // одна аудитория не может принимать два пересекающихся экзамена
    for (size_t i = 0; i < exams.size(); ++i) {
        for (size_t j = i + 1; j < exams.size(); ++j) {
            const Exam& a = exams[i];
            const Exam& b = exams[j];

            if (cfg.noSimultaneousExams && overlaps(a, b, cfg.breakMinutes)) {
                addError(result, "SimultaneousExams",
                         describeExam(a) + " overlaps " + describeExam(b) +
                         " while simultaneous exams are disabled.");
            }

            if (!overlaps(a, b, cfg.breakMinutes)) continue;
            for (int roomId : a.classroomIds) {
                if (std::find(b.classroomIds.begin(), b.classroomIds.end(), roomId) ==
                    b.classroomIds.end()) {
                    continue;
                }
                addError(result, "RoomConflict",
                         "Classroom " + std::to_string(roomId) + " hosts both " +
                         describeExam(a) + " and " + describeExam(b) + ".");
            }
        }
    }

    // хватает ли мест в выделенных аудиториях
    for (const Exam& e : exams) {
        int students = index.studentCount(e.courseId);
        std::vector<Classroom> rooms;
        bool missing = false;
        for (int roomId : e.classroomIds) {
            auto it = byId.find(roomId);
            if (it == byId.end()) {
                addError(result, "RoomMissing",
                         describeExam(e) + " uses unknown classroom " +
                         std::to_string(roomId) + ".");
                missing = true;
                continue;
            }
            rooms.push_back(*it->second);
        }
        if (missing) continue;

        if (students > 0 && rooms.empty()) {
            addError(result, "RoomMissing",
                     describeExam(e) + " has " + std::to_string(students) +
                     " students but no classroom.");
            continue;
        }
        if (!capacitySufficient(rooms, students, cfg.seatLayout)) {
            addError(result, "RoomCapacity",
                     "Classrooms of " + describeExam(e) + " are too small for " +
                     std::to_string(students) + " students.");
        }
    }
}

void ScheduleValidator::checkSchedulingBounds(
    const std::vector<Exam>& exams,
    const ScheduleConfig& cfg,
    ValidationResult& result
) {
    for (const Exam& e : exams) {
        if (!withinSchedulingBounds(e, cfg)) {
            addError(result, "SessionBounds",
                     describeExam(e) + " is outside of " + cfg.window.startDate + " - " +
                     cfg.window.endDate + ", " + formatTime(cfg.hours.openMinutes) + "-" +
                     formatTime(cfg.hours.closeMinutes) + " or on an excluded weekday.");
        }
    }
}

void ScheduleValidator::checkMaxExamsPerDayForLevel(
    const std::vector<Course>& courses,
    const std::vector<Exam>& exams,
    int maxPerDay,
    ValidationResult& result
) {
    std::map<int, int> courseLevels;
    for (const Course& c : courses) courseLevels[c.id] = c.classLevel;

    // (classLevel, date) -> количество экзаменов в этот день
    std::map<std::pair<int, std::string>, int> table;
    for (const Exam& e : exams) {
        auto it = courseLevels.find(e.courseId);
        if (it == courseLevels.end()) continue;
        table[std::make_pair(it->second, e.date)]++;
    }

    for (const auto& p : table) {
        if (p.second > maxPerDay) {
            addError(result, "DailyLimit",
                     "Class level " + std::to_string(p.first.first) + " has " +
                     std::to_string(p.second) + " exams on " + p.first.second +
                     ", limit is " + std::to_string(maxPerDay) + ".");
        }
    }
}

ValidationResult ScheduleValidator::checkAll(
    const std::vector<Course>& courses,
    const EnrollmentIndex& index,
    const std::vector<Classroom>& classrooms,
    const ScheduleConfig& cfg,
    const std::vector<Exam>& exams
) {
    ValidationResult result;
    result.ok = true;

    logDebug("Проверка расписания: курсов=" + std::to_string(courses.size()) +
             ", экзаменов=" + std::to_string(exams.size()) +
             ", аудиторий=" + std::to_string(classrooms.size()));

    checkAllExamsAssigned(courses, exams, result);
    checkStudentConflicts(index, exams, cfg.breakMinutes, result);
    checkClassroomConflicts(index, classrooms, exams, cfg, result);
    checkSchedulingBounds(exams, cfg, result);
    checkMaxExamsPerDayForLevel(courses, exams, cfg.maxExamsPerDayPerLevel, result);

    if (result.ok) {
        logDebug("Проверка расписания завершена: ошибок не обнаружено.");
    } else {
        logWarning("Проверка расписания завершена: обнаружено ошибок = " +
                   std::to_string(result.errors.size()));
    }

    return result;
}

// ==================== проверка рассадки ====================

ValidationResult ScheduleValidator::checkSeating(
    const Exam& exam,
    const std::vector<Classroom>& classrooms,
    const std::vector<int>& enrolledStudentIds,
    const std::vector<SeatAssignment>& seats,
    SeatLayout layout
) {
    ValidationResult result;
    result.ok = true;

    std::map<int, const Classroom*> byId;
    for (const Classroom& r : classrooms) byId[r.id] = &r;

    std::set<int> enrolled(enrolledStudentIds.begin(), enrolledStudentIds.end());
    std::set<std::pair<int, std::pair<int, int>>> usedSeats;
    std::set<int> seatedStudents;
    std::map<int, int> perRoom;
    std::map<int, std::set<std::pair<int, int>>> validSeats;

    for (const SeatAssignment& s : seats) {
        if (s.examId != exam.id) {
            addError(result, "SeatExam",
                     "Seat of student " + std::to_string(s.studentId) +
                     " belongs to exam " + std::to_string(s.examId) + ".");
        }
        if (!byId.count(s.classroomId)) {
            addError(result, "SeatRoom",
                     "Student " + std::to_string(s.studentId) +
                     " is seated in unknown classroom " + std::to_string(s.classroomId) + ".");
            continue;
        }
        if (!enrolled.count(s.studentId)) {
            addError(result, "SeatStudent",
                     "Student " + std::to_string(s.studentId) + " is not enrolled in course " +
                     std::to_string(exam.courseId) + ".");
        }
        if (!seatedStudents.insert(s.studentId).second) {
            addError(result, "SeatStudentTwice",
                     "Student " + std::to_string(s.studentId) + " has more than one seat.");
        }
        auto key = std::make_pair(s.classroomId, std::make_pair(s.row, s.column));
        if (!validSeats.count(s.classroomId)) {
            std::set<std::pair<int, int>>& valid = validSeats[s.classroomId];
            for (const SeatCoordinate& c : seatCoordinates(*byId[s.classroomId], layout)) {
                valid.insert(std::make_pair(c.row, c.column));
            }
        }
        if (!validSeats[s.classroomId].count(key.second)) {
            addError(result, "SeatLayout",
                     "Seat " + std::to_string(s.row) + "-" + std::to_string(s.column) +
                     " does not exist in classroom " + std::to_string(s.classroomId) + ".");
        }
        if (!usedSeats.insert(key).second) {
            addError(result, "SeatTaken",
                     "Seat " + std::to_string(s.row) + "-" + std::to_string(s.column) +
                     " in classroom " + std::to_string(s.classroomId) + " is assigned twice.");
        }
        perRoom[s.classroomId]++;
    }

    for (const auto& p : perRoom) {
        int cap = effectiveCapacity(*byId[p.first], layout);
        if (p.second > cap) {
            addError(result, "SeatCapacity",
                     "Classroom " + std::to_string(p.first) + " holds " +
                     std::to_string(p.second) + " students, capacity " +
                     std::to_string(cap) + ".");
        }
    }

    if (seatedStudents.size() != enrolled.size()) {
        addError(result, "SeatMissing",
                 std::to_string(enrolled.size() - std::min(enrolled.size(), seatedStudents.size())) +
                 " enrolled students have no seat in exam " + std::to_string(exam.id) + ".");
    }

    return result;
}
