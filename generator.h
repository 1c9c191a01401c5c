#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "config.h"
#include "enrollment.h"
#include "model.h"

struct ScheduleStats {
    int examCount      = 0;
    int daysUsed       = 0;
    int usableDays     = 0;
    int multiRoomExams = 0;   // экзамены, разнесённые по нескольким аудиториям
    int backtracks     = 0;
};

struct ScheduleResult {
    ExamType examType;
    std::vector<Exam> exams;   // по дате и времени, id = 1..n
    ScheduleStats stats;
};

// Жадное размещение с ограниченным перебором с возвратом.
// Порядок обхода: по убыванию степени в графе конфликтов.
// Бросает InvalidInputError или InfeasibleScheduleError; частичный результат не возвращается.
class TimetableScheduler {
public:
    explicit TimetableScheduler(const ScheduleConfig& cfg);

    ScheduleResult run(
        const std::vector<Course>& courses,
        const std::vector<Student>& students,
        const std::vector<Classroom>& classrooms
    );

private:
    struct Task {
        const Course* course;
        int duration;
        int students;
        int startsPerDay;   // число допустимых времён начала в одном дне
    };

    struct Decision {
        int candidate;
    };

    ScheduleConfig cfg_;

    EnrollmentIndex index_;
    std::vector<Task> tasks_;               // в порядке обхода
    std::vector<std::string> dates_;
    std::vector<Classroom> roomsBySize_;    // по убыванию вместимости, затем по id
    std::map<int, int> courseLevels_;

    // Стек решений: stack_[i] относится к tasks_[i], placed_[i] это созданный экзамен
    std::vector<Decision> stack_;
    std::vector<Exam> placed_;

    int backtracks_ = 0;
    std::chrono::steady_clock::time_point startedAt_;

    void validateInput(
        const std::vector<Course>& courses,
        const std::vector<Student>& students,
        const std::vector<Classroom>& classrooms
    ) const;

    void prepareTasks(const std::vector<Course>& courses);
    std::vector<int> hopelessCourses() const;

    bool search();
    std::vector<int> greedyUnplaceable();

    // Первый допустимый кандидат с номером >= from; -1, если нет
    int findCandidate(const Task& task, int from, Exam& out) const;
    bool allocateRooms(Exam& exam, int students) const;
    size_t backtrackTarget(const Task& blocked) const;

    bool budgetExhausted() const;

    ScheduleResult buildResult(const std::vector<Course>& courses,
                               const std::vector<Classroom>& classrooms);
};

ScheduleResult scheduleExams(
    const std::vector<Course>& courses,
    const std::vector<Student>& students,
    const std::vector<Classroom>& classrooms,
    const ScheduleConfig& cfg
);
