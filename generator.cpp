// generator.cpp
#include "generator.h"

#include "calendar.h"
#include "errors.h"
#include "layout.h"
#include "logger.h"
#include "validator.h"

#include <algorithm>
#include <set>
#include <string>

// --- маленькие хелперы ---

static std::string courseLabel(const Course& c) {
    if (c.code.empty()) return "id=" + std::to_string(c.id);
    return c.code + " (id=" + std::to_string(c.id) + ")";
}

static std::string joinIds(const std::vector<int>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out += ", ";
        out += std::to_string(ids[i]);
    }
    return out;
}

TimetableScheduler::TimetableScheduler(const ScheduleConfig& cfg)
    : cfg_(cfg) {}

// ============================================================================
//                              ПРОВЕРКА ВХОДА
// ============================================================================

void TimetableScheduler::validateInput(
    const std::vector<Course>& courses,
    const std::vector<Student>& students,
    const std::vector<Classroom>& classrooms
) const {
    validateScheduleConfig(cfg_);

    std::set<int> courseIds;
    for (const Course& c : courses) {
        if (!courseIds.insert(c.id).second) {
            throw InvalidInputError("duplicate course id " + std::to_string(c.id));
        }
    }

    std::set<int> studentIds;
    for (const Student& s : students) {
        if (!studentIds.insert(s.id).second) {
            throw InvalidInputError("duplicate student id " + std::to_string(s.id));
        }
    }

    std::set<int> roomIds;
    for (const Classroom& r : classrooms) {
        validateClassroom(r);
        if (!roomIds.insert(r.id).second) {
            throw InvalidInputError("duplicate classroom id " + std::to_string(r.id));
        }
    }

    for (const auto& p : cfg_.durationOverrides) {
        if (!courseIds.count(p.first)) {
            logWarning("Длительность задана для курса id=" + std::to_string(p.first) +
                       ", которого нет в запуске; игнорируем.");
        }
    }
}

// ============================================================================
//                              ПОДГОТОВКА
// ============================================================================

void TimetableScheduler::prepareTasks(const std::vector<Course>& courses) {
    tasks_.clear();
    courseLevels_.clear();

    const int dayLength = cfg_.hours.closeMinutes - cfg_.hours.openMinutes;

    for (const Course& c : courses) {
        Task t;
        t.course   = &c;
        t.duration = cfg_.durationFor(c.id);
        t.students = index_.studentCount(c.id);
        t.startsPerDay = t.duration > dayLength
            ? 0
            : (dayLength - t.duration) / cfg_.hours.slotStepMinutes + 1;
        tasks_.push_back(t);
        courseLevels_[c.id] = c.classLevel;
    }

    // самые «конфликтные» курсы первыми, дальше по числу студентов и id
    std::sort(tasks_.begin(), tasks_.end(),
        [&](const Task& a, const Task& b) {
            int da = index_.degree(a.course->id);
            int db = index_.degree(b.course->id);
            if (da != db) return da > db;
            if (a.students != b.students) return a.students > b.students;
            return a.course->id < b.course->id;
        }
    );
}

// Курсы, которые нельзя разместить ни при каком расписании
std::vector<int> TimetableScheduler::hopelessCourses() const {
    long totalSeats = 0;
    for (const Classroom& r : roomsBySize_) {
        totalSeats += effectiveCapacity(r, cfg_.seatLayout);
    }

    std::vector<int> hopeless;
    for (const Task& t : tasks_) {
        if (t.startsPerDay == 0) {
            logError("Экзамен " + courseLabel(*t.course) + " длится " +
                     std::to_string(t.duration) + " мин и не помещается в рабочие часы " +
                     formatTime(cfg_.hours.openMinutes) + "-" +
                     formatTime(cfg_.hours.closeMinutes));
            hopeless.push_back(t.course->id);
        } else if (t.students > totalSeats) {
            logError("Для курса " + courseLabel(*t.course) + " нужно " +
                     std::to_string(t.students) + " мест, всего доступно " +
                     std::to_string(totalSeats));
            hopeless.push_back(t.course->id);
        }
    }
    std::sort(hopeless.begin(), hopeless.end());
    return hopeless;
}

// ============================================================================
//                              КАНДИДАТЫ
// ============================================================================

bool TimetableScheduler::allocateRooms(Exam& exam, int students) const {
    exam.classroomIds.clear();
    if (students == 0) return true;

    // свободные в это время аудитории (с учётом перерыва)
    std::vector<const Classroom*> freeRooms;
    for (const Classroom& r : roomsBySize_) {
        bool busy = false;
        for (const Exam& other : placed_) {
            if (!overlaps(exam, other, cfg_.breakMinutes)) continue;
            if (std::find(other.classroomIds.begin(), other.classroomIds.end(), r.id) !=
                other.classroomIds.end()) {
                busy = true;
                break;
            }
        }
        if (!busy) freeRooms.push_back(&r);
    }

    // 1) одна аудитория: самая маленькая из подходящих
    const Classroom* best = nullptr;
    int bestCap = 0;
    for (const Classroom* r : freeRooms) {
        int cap = effectiveCapacity(*r, cfg_.seatLayout);
        if (cap >= students && (!best || cap < bestCap)) {
            best = r;
            bestCap = cap;
        }
    }

    std::vector<Classroom> chosen;
    if (best) {
        chosen.push_back(*best);
    } else {
        // 2) несколько аудиторий, начиная с самых больших
        int remaining = students;
        for (const Classroom* r : freeRooms) {
            if (remaining <= 0) break;
            chosen.push_back(*r);
            remaining -= effectiveCapacity(*r, cfg_.seatLayout);
        }
    }

    if (!capacitySufficient(chosen, students, cfg_.seatLayout)) {
        return false;
    }
    for (const Classroom& r : chosen) exam.classroomIds.push_back(r.id);
    return true;
}

int TimetableScheduler::findCandidate(const Task& task, int from, Exam& out) const {
    const int total = static_cast<int>(dates_.size()) * task.startsPerDay;
    const Course& course = *task.course;

    int k = from;
    while (k < total) {
        int dateIndex = k / task.startsPerDay;
        int start = cfg_.hours.openMinutes + (k % task.startsPerDay) * cfg_.hours.slotStepMinutes;

        Exam e;
        e.id           = 0;
        e.courseId     = course.id;
        e.type         = cfg_.examType;
        e.date         = dates_[dateIndex];
        e.startMinutes = start;
        e.endMinutes   = start + task.duration;

        // лимит на день не зависит от времени: пропускаем день целиком
        if (dailyCountExceeded(course.classLevel, e.date, e, placed_, courseLevels_,
                               cfg_.maxExamsPerDayPerLevel)) {
            k = (dateIndex + 1) * task.startsPerDay;
            continue;
        }

        if (!withinSchedulingBounds(e, cfg_)) {
            ++k;
            continue;
        }

        bool clash = false;
        for (const Exam& other : placed_) {
            if (other.date != e.date) continue;
            bool related = cfg_.noSimultaneousExams ||
                           index_.conflicting(course.id, other.courseId);
            if (related && overlaps(e, other, cfg_.breakMinutes)) {
                clash = true;
                break;
            }
        }

        if (!clash && allocateRooms(e, task.students)) {
            out = e;
            return k;
        }
        ++k;
    }
    return -1;
}

// ============================================================================
//                              ПЕРЕБОР С ВОЗВРАТОМ
// ============================================================================

bool TimetableScheduler::budgetExhausted() const {
    if (backtracks_ >= cfg_.maxBacktracks) return true;
    if (cfg_.timeBudgetMs > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt_).count();
        if (elapsed >= cfg_.timeBudgetMs) return true;
    }
    return false;
}

// Ближайшее сверху решение, которое мешает заблокированному курсу:
// общие студенты или тот же курс обучения (дневной лимит).
size_t TimetableScheduler::backtrackTarget(const Task& blocked) const {
    for (size_t i = stack_.size(); i-- > 0;) {
        const Course& other = *tasks_[i].course;
        if (cfg_.noSimultaneousExams) return i;
        if (index_.conflicting(blocked.course->id, other.id)) return i;
        if (other.classLevel == blocked.course->classLevel) return i;
    }
    return stack_.size() - 1;
}

bool TimetableScheduler::search() {
    const size_t n = tasks_.size();
    std::vector<int> next(n, 0);   // с какого кандидата продолжать на позиции

    stack_.clear();
    placed_.clear();

    size_t pos = 0;
    while (pos < n) {
        const Task& task = tasks_[pos];

        Exam e;
        int k = findCandidate(task, next[pos], e);
        if (k >= 0) {
            logDebug("Курс " + courseLabel(*task.course) + " -> " + e.date + " " +
                     formatTime(e.startMinutes) + "-" + formatTime(e.endMinutes) +
                     ", аудиторий: " + std::to_string(e.classroomIds.size()));
            stack_.push_back(Decision{k});
            placed_.push_back(e);
            next[pos] = k + 1;
            ++pos;
            if (pos < n) next[pos] = 0;
            continue;
        }

        // тупик
        if (stack_.empty()) {
            logWarning("Курс " + courseLabel(*task.course) +
                       ": все варианты размещения перебраны, возвращаться некуда");
            return false;
        }
        if (budgetExhausted()) {
            logWarning("Исчерпан бюджет перебора (возвратов: " +
                       std::to_string(backtracks_) + ")");
            return false;
        }

        size_t target = backtrackTarget(task);
        logDebug("Тупик на курсе " + courseLabel(*task.course) + ", снимаем " +
                 std::to_string(stack_.size() - target) + " решений до курса " +
                 courseLabel(*tasks_[target].course));

        while (stack_.size() > target) {
            stack_.pop_back();
            placed_.pop_back();
        }
        pos = target;   // next[target] уже указывает на следующий кандидат
        ++backtracks_;
    }
    return true;
}

// Детерминированный проход без возвратов: какие курсы не удаётся разместить
std::vector<int> TimetableScheduler::greedyUnplaceable() {
    stack_.clear();
    placed_.clear();

    std::vector<int> unplaceable;
    for (const Task& task : tasks_) {
        Exam e;
        int k = findCandidate(task, 0, e);
        if (k < 0) {
            logError("Не найден слот для курса " + courseLabel(*task.course) +
                     " (студентов: " + std::to_string(task.students) +
                     ", длительность: " + std::to_string(task.duration) + " мин)");
            unplaceable.push_back(task.course->id);
            continue;
        }
        stack_.push_back(Decision{k});
        placed_.push_back(e);
    }
    return unplaceable;
}

// ============================================================================
//                              РЕЗУЛЬТАТ
// ============================================================================

ScheduleResult TimetableScheduler::buildResult(
    const std::vector<Course>& courses,
    const std::vector<Classroom>& classrooms
) {
    std::vector<Exam> exams = placed_;
    std::sort(exams.begin(), exams.end(),
        [](const Exam& a, const Exam& b) {
            if (a.date != b.date) return a.date < b.date;
            if (a.startMinutes != b.startMinutes) return a.startMinutes < b.startMinutes;
            return a.courseId < b.courseId;
        }
    );
    for (size_t i = 0; i < exams.size(); ++i) {
        exams[i].id = static_cast<int>(i) + 1;
    }

    ScheduleValidator validator;
    ValidationResult vr = validator.checkAll(courses, index_, classrooms, cfg_, exams);
    if (!vr.ok) {
        throw VerificationError("schedule failed verification: " + vr.errors.front());
    }

    ScheduleResult result;
    result.examType = cfg_.examType;
    result.exams    = exams;

    std::set<std::string> days;
    for (const Exam& e : exams) {
        days.insert(e.date);
        if (e.classroomIds.size() > 1) result.stats.multiRoomExams++;
    }
    result.stats.examCount  = static_cast<int>(exams.size());
    result.stats.daysUsed   = static_cast<int>(days.size());
    result.stats.usableDays = static_cast<int>(dates_.size());
    result.stats.backtracks = backtracks_;
    return result;
}

// ============================================================================
//                              ЗАПУСК
// ============================================================================

ScheduleResult TimetableScheduler::run(
    const std::vector<Course>& courses,
    const std::vector<Student>& students,
    const std::vector<Classroom>& classrooms
) {
    validateInput(courses, students, classrooms);

    startedAt_  = std::chrono::steady_clock::now();
    backtracks_ = 0;

    std::set<int> selected;
    for (const Course& c : courses) selected.insert(c.id);

    index_ = EnrollmentIndex::build(students, selected);
    dates_ = usableDates(cfg_.window.startDate, cfg_.window.endDate, cfg_.excludedWeekdays);

    roomsBySize_ = classrooms;
    std::sort(roomsBySize_.begin(), roomsBySize_.end(),
        [&](const Classroom& a, const Classroom& b) {
            int ca = effectiveCapacity(a, cfg_.seatLayout);
            int cb = effectiveCapacity(b, cfg_.seatLayout);
            if (ca != cb) return ca > cb;
            return a.id < b.id;
        }
    );

    logInfo("=== Запуск генерации расписания (" +
            std::string(examTypeToString(cfg_.examType)) + ") ===");
    logInfo("Курсов: " + std::to_string(courses.size()) +
            ", студентов: " + std::to_string(students.size()) +
            ", аудиторий: " + std::to_string(classrooms.size()) +
            ", дней: " + std::to_string(dates_.size()) +
            ", конфликтных пар: " + std::to_string(index_.conflictPairCount()));

    ScheduleResult empty;
    empty.examType = cfg_.examType;
    empty.stats.usableDays = static_cast<int>(dates_.size());
    if (courses.empty()) {
        logWarning("Список курсов пуст. Расписание не будет сгенерировано.");
        return empty;
    }

    prepareTasks(courses);

    std::vector<int> hopeless = hopelessCourses();
    if (!hopeless.empty()) {
        throw InfeasibleScheduleError(
            "courses cannot fit any slot or classroom set: " + joinIds(hopeless),
            hopeless);
    }

    if (!search()) {
        std::vector<int> unplaceable = greedyUnplaceable();
        std::sort(unplaceable.begin(), unplaceable.end());
        logError("Расписание невозможно при текущих ограничениях, курсов без слота: " +
                 std::to_string(unplaceable.size()));
        throw InfeasibleScheduleError(
            "no feasible slot for course(s): " + joinIds(unplaceable) +
            " after " + std::to_string(backtracks_) + " backtracks",
            unplaceable);
    }

    ScheduleResult result = buildResult(courses, classrooms);

    logInfo("=== Генерация расписания завершена: экзаменов " +
            std::to_string(result.stats.examCount) + ", дней " +
            std::to_string(result.stats.daysUsed) + " из " +
            std::to_string(result.stats.usableDays) + ", возвратов " +
            std::to_string(result.stats.backtracks) + " ===");
    return result;
}

ScheduleResult scheduleExams(
    const std::vector<Course>& courses,
    const std::vector<Student>& students,
    const std::vector<Classroom>& classrooms,
    const ScheduleConfig& cfg
) {
    TimetableScheduler scheduler(cfg);
    return scheduler.run(courses, students, classrooms);
}
