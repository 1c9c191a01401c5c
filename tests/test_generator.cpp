#include <gtest/gtest.h>

#include <algorithm>
#include <climits>

#include "enrollment.h"
#include "errors.h"
#include "generator.h"
#include "test_support.h"
#include "validator.h"

namespace {

const Exam& examOf(const ScheduleResult& r, int courseId) {
    for (const Exam& e : r.exams) {
        if (e.courseId == courseId) return e;
    }
    throw std::runtime_error("no exam for course " + std::to_string(courseId));
}

bool contains(const std::vector<int>& v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

// Корона S3: u_i связан с v_j при i != j. Двудольная, но жадная раскраска
// в порядке u1, v1, u2, v2, u3, v3 упирается в тупик на u3.
struct CrownCase {
    std::vector<Course> courses;
    std::vector<Student> students;
    std::vector<Classroom> rooms;
    ScheduleConfig cfg;

    CrownCase() {
        // u1=1, v1=2, u2=3, v2=4, u3=5, v3=6; у всех разный курс обучения
        for (int id = 1; id <= 6; ++id) courses.push_back(makeCourse(id, id));
        students = {
            makeStudent(1, {1, 4}), makeStudent(2, {1, 6}),
            makeStudent(3, {3, 2}), makeStudent(4, {3, 6}),
            makeStudent(5, {5, 2}), makeStudent(6, {5, 4}),
        };
        for (int id = 1; id <= 6; ++id) rooms.push_back(makeRoom(id, 10));
        cfg = hourlyConfig("2025-01-20", 9, 11);
    }
};

} // namespace

// Два несвязанных курса, три дня по одному слоту: оба могут уйти в первый день
TEST(SchedulerTest, UnrelatedCoursesShareTheFirstDay) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 2)};
    std::vector<Student> students = {makeStudent(1, {1}), makeStudent(2, {2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-22", 9, 10);

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 2u);
    EXPECT_EQ(r.exams[0].date, "2025-01-20");
    EXPECT_EQ(r.exams[1].date, "2025-01-20");
    EXPECT_EQ(r.exams[0].startMinutes, 540);
    EXPECT_NE(r.exams[0].classroomIds, r.exams[1].classroomIds);
    EXPECT_EQ(r.stats.daysUsed, 1);
    EXPECT_EQ(r.stats.usableDays, 3);
    EXPECT_EQ(r.exams[0].id, 1);
    EXPECT_EQ(r.exams[1].id, 2);
}

// Общий студент, один день с двумя слотами: разные слоты
TEST(SchedulerTest, SharedStudentGetsSeparateSlots) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 1)};
    std::vector<Student> students = {makeStudent(1, {1, 2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 11);

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 2u);
    EXPECT_FALSE(overlaps(examOf(r, 1), examOf(r, 2)));
    EXPECT_EQ(examOf(r, 1).date, "2025-01-20");
    EXPECT_EQ(examOf(r, 2).date, "2025-01-20");
}

// Тот же случай, но слот один: расписание невозможно
TEST(SchedulerTest, SharedStudentWithSingleSlotIsInfeasible) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 1)};
    std::vector<Student> students = {makeStudent(1, {1, 2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 10);

    try {
        scheduleExams(courses, students, rooms, cfg);
        FAIL() << "expected InfeasibleScheduleError";
    } catch (const InfeasibleScheduleError& ex) {
        ASSERT_FALSE(ex.unplaceable().empty());
        for (int id : ex.unplaceable()) EXPECT_TRUE(id == 1 || id == 2);
    }
}

// Три курса одного курса обучения, лимит 2 в день, один день
TEST(SchedulerTest, DailyCapMakesThirdExamInfeasible) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 1), makeCourse(3, 1)};
    std::vector<Student> students = {makeStudent(1, {1}), makeStudent(2, {2}), makeStudent(3, {3})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30), makeRoom(3, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 17);

    try {
        scheduleExams(courses, students, rooms, cfg);
        FAIL() << "expected InfeasibleScheduleError";
    } catch (const InfeasibleScheduleError& ex) {
        EXPECT_EQ(ex.unplaceable(), std::vector<int>{3});
    }

    // второй день снимает проблему
    cfg.window.endDate = "2025-01-21";
    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    EXPECT_EQ(r.stats.daysUsed, 2);
}

TEST(SchedulerTest, BacktrackingRecoversFromGreedyDeadEnd) {
    CrownCase c;
    ScheduleResult r = scheduleExams(c.courses, c.students, c.rooms, c.cfg);

    ASSERT_EQ(r.exams.size(), 6u);
    EXPECT_GT(r.stats.backtracks, 0);

    EnrollmentIndex index = EnrollmentIndex::build(c.students);
    for (const Exam& a : r.exams) {
        for (const Exam& b : r.exams) {
            if (a.id < b.id && index.conflicting(a.courseId, b.courseId)) {
                EXPECT_FALSE(overlaps(a, b)) << a.courseId << " vs " << b.courseId;
            }
        }
    }
}

TEST(SchedulerTest, ExhaustedBudgetReportsUnplaceableCourses) {
    CrownCase c;
    c.cfg.maxBacktracks = 0;

    try {
        scheduleExams(c.courses, c.students, c.rooms, c.cfg);
        FAIL() << "expected InfeasibleScheduleError";
    } catch (const InfeasibleScheduleError& ex) {
        EXPECT_TRUE(contains(ex.unplaceable(), 5));
    }
}

TEST(SchedulerTest, DeterministicForIdenticalInput) {
    CrownCase c;
    ScheduleResult a = scheduleExams(c.courses, c.students, c.rooms, c.cfg);
    ScheduleResult b = scheduleExams(c.courses, c.students, c.rooms, c.cfg);

    ASSERT_EQ(a.exams.size(), b.exams.size());
    for (size_t i = 0; i < a.exams.size(); ++i) {
        EXPECT_EQ(a.exams[i].courseId, b.exams[i].courseId);
        EXPECT_EQ(a.exams[i].date, b.exams[i].date);
        EXPECT_EQ(a.exams[i].startMinutes, b.exams[i].startMinutes);
        EXPECT_EQ(a.exams[i].classroomIds, b.exams[i].classroomIds);
    }
}

TEST(SchedulerTest, DurationOverrideAndBreak) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 1)};
    std::vector<Student> students = {makeStudent(1, {1, 2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 13);
    cfg.hours.slotStepMinutes = 15;
    cfg.breakMinutes = 30;
    cfg.durationOverrides[1] = 90;

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    const Exam& first  = examOf(r, 1);
    const Exam& second = examOf(r, 2);

    EXPECT_EQ(first.endMinutes - first.startMinutes, 90);
    EXPECT_EQ(second.endMinutes - second.startMinutes, 60);
    EXPECT_EQ(first.startMinutes, 540);
    // 10:30 конец + 30 минут перерыва
    EXPECT_EQ(second.startMinutes, 660);
}

// Перерыв во весь рабочий день: общий студент сдаёт второй экзамен назавтра
TEST(SchedulerTest, DayLongBreakMovesConflictToNextDay) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 2)};
    std::vector<Student> students = {makeStudent(1, {1, 2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-21", 9, 17);
    cfg.breakMinutes = 8 * 60;

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 2u);
    EXPECT_EQ(examOf(r, 1).date, "2025-01-20");
    EXPECT_EQ(examOf(r, 2).date, "2025-01-21");
    EXPECT_FALSE(overlaps(examOf(r, 1), examOf(r, 2), cfg.breakMinutes));
}

TEST(SchedulerTest, RejectsBreakLongerThanTheDay) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 2)};
    std::vector<Student> students = {makeStudent(1, {1, 2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-21", 9, 17);
    cfg.breakMinutes = INT_MAX;

    EXPECT_THROW(scheduleExams(courses, students, rooms, cfg), InvalidInputError);
}

TEST(SchedulerTest, SkipsExcludedWeekdays) {
    std::vector<Course> courses = {makeCourse(1, 1)};
    std::vector<Student> students = {makeStudent(1, {1})};
    std::vector<Classroom> rooms = {makeRoom(1, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-27", 9, 10);
    cfg.window.startDate = "2025-01-25";

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 1u);
    EXPECT_EQ(r.exams[0].date, "2025-01-27");

    cfg.window.endDate = "2025-01-26";
    EXPECT_THROW(scheduleExams(courses, students, rooms, cfg), InvalidInputError);
}

TEST(SchedulerTest, NoSimultaneousExamsMode) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 2)};
    std::vector<Student> students = {makeStudent(1, {1}), makeStudent(2, {2})};
    std::vector<Classroom> rooms = {makeRoom(1, 30), makeRoom(2, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 11);
    cfg.noSimultaneousExams = true;

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 2u);
    EXPECT_FALSE(overlaps(r.exams[0], r.exams[1]));

    cfg.hours.closeMinutes = 10 * 60;
    EXPECT_THROW(scheduleExams(courses, students, rooms, cfg), InfeasibleScheduleError);
}

TEST(SchedulerTest, SplitsLargeCourseAcrossRooms) {
    std::vector<Course> courses = {makeCourse(1, 1)};
    std::vector<Student> students = numberedStudents(50, 1);
    std::vector<Classroom> rooms = {makeRoom(1, 25), makeRoom(2, 30), makeRoom(3, 10)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 10);

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 1u);
    EXPECT_EQ(r.exams[0].classroomIds, (std::vector<int>{2, 1}));
    EXPECT_EQ(r.stats.multiRoomExams, 1);
}

TEST(SchedulerTest, PrefersSmallestFittingRoom) {
    std::vector<Course> courses = {makeCourse(1, 1)};
    std::vector<Student> students = numberedStudents(10, 1);
    std::vector<Classroom> rooms = {makeRoom(1, 50), makeRoom(2, 12), makeRoom(3, 8)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 10);

    ScheduleResult r = scheduleExams(courses, students, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 1u);
    EXPECT_EQ(r.exams[0].classroomIds, std::vector<int>{2});
}

TEST(SchedulerTest, CourseWithoutStudentsNeedsNoRoom) {
    std::vector<Course> courses = {makeCourse(1, 1)};
    std::vector<Classroom> rooms = {makeRoom(1, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-20", 9, 10);

    ScheduleResult r = scheduleExams(courses, {}, rooms, cfg);
    ASSERT_EQ(r.exams.size(), 1u);
    EXPECT_TRUE(r.exams[0].classroomIds.empty());
}

TEST(SchedulerTest, EmptyCourseListGivesEmptySchedule) {
    ScheduleConfig cfg = hourlyConfig("2025-01-24", 9, 17);
    ScheduleResult r = scheduleExams({}, {}, {makeRoom(1, 30)}, cfg);
    EXPECT_TRUE(r.exams.empty());
    EXPECT_EQ(r.stats.usableDays, 5);
}

TEST(SchedulerTest, HopelessCoursesFailBeforeSearch) {
    std::vector<Course> courses = {makeCourse(1, 1), makeCourse(2, 2)};
    std::vector<Student> students = numberedStudents(40, 2);
    std::vector<Classroom> rooms = {makeRoom(1, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-24", 9, 12);
    cfg.durationOverrides[1] = 240;

    try {
        scheduleExams(courses, students, rooms, cfg);
        FAIL() << "expected InfeasibleScheduleError";
    } catch (const InfeasibleScheduleError& ex) {
        EXPECT_EQ(ex.unplaceable(), (std::vector<int>{1, 2}));
    }
}

TEST(SchedulerTest, RejectsInvalidInput) {
    std::vector<Student> students = {makeStudent(1, {1})};
    std::vector<Classroom> rooms = {makeRoom(1, 30)};
    ScheduleConfig cfg = hourlyConfig("2025-01-24", 9, 17);

    EXPECT_THROW(scheduleExams({makeCourse(1, 1), makeCourse(1, 2)}, students, rooms, cfg),
                 InvalidInputError);
    EXPECT_THROW(scheduleExams({makeCourse(1, 1)}, {makeStudent(1, {1}), makeStudent(1, {1})},
                               rooms, cfg),
                 InvalidInputError);
    EXPECT_THROW(scheduleExams({makeCourse(1, 1)}, students, {makeRoom(1, 30, 5, 5, 5)}, cfg),
                 InvalidInputError);
    EXPECT_THROW(scheduleExams({makeCourse(1, 1)}, students, {makeRoom(1, 30), makeRoom(1, 20)},
                               cfg),
                 InvalidInputError);

    cfg.maxExamsPerDayPerLevel = 0;
    EXPECT_THROW(scheduleExams({makeCourse(1, 1)}, students, rooms, cfg), InvalidInputError);
}

TEST(SchedulerTest, StampsExamType) {
    ScheduleConfig cfg = hourlyConfig("2025-01-24", 9, 17);
    cfg.examType = ExamType::Final;

    ScheduleResult r = scheduleExams({makeCourse(1, 1)}, {makeStudent(1, {1})}, {makeRoom(1, 30)}, cfg);
    EXPECT_EQ(r.examType, ExamType::Final);
    ASSERT_EQ(r.exams.size(), 1u);
    EXPECT_EQ(r.exams[0].type, ExamType::Final);
}
