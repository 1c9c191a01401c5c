#pragma once

#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "model.h"

// Небольшие конструкторы тестовых данных

inline Course makeCourse(int id, int classLevel, const std::string& code = "") {
    Course c;
    c.id         = id;
    c.code       = code.empty() ? "C" + std::to_string(id) : code;
    c.name       = "Course " + std::to_string(id);
    c.instructor = "";
    c.classLevel = classLevel;
    c.mandatory  = true;
    return c;
}

inline Student makeStudent(int id, std::vector<int> courseIds, int classLevel = 1) {
    Student s;
    s.id         = id;
    s.number     = "S" + std::to_string(1000 + id);
    s.name       = "Student " + std::to_string(id);
    s.classLevel = classLevel;
    s.courseIds  = std::move(courseIds);
    return s;
}

// rows x columns парт по seatGroup мест
inline Classroom makeRoom(int id, int capacity, int rows = 10, int columns = 5, int seatGroup = 2) {
    Classroom r;
    r.id        = id;
    r.code      = "R" + std::to_string(id);
    r.name      = "Room " + std::to_string(id);
    r.capacity  = capacity;
    r.rows      = rows;
    r.columns   = columns;
    r.seatGroup = seatGroup;
    return r;
}

// Окно с понедельника 2025-01-20, часовые экзамены без перерыва
inline ScheduleConfig hourlyConfig(const std::string& endDate, int openHour, int closeHour) {
    ScheduleConfig cfg;
    cfg.window.startDate        = "2025-01-20";
    cfg.window.endDate          = endDate;
    cfg.hours.openMinutes       = openHour * 60;
    cfg.hours.closeMinutes      = closeHour * 60;
    cfg.hours.slotStepMinutes   = 60;
    cfg.defaultDurationMinutes  = 60;
    cfg.breakMinutes            = 0;
    cfg.maxExamsPerDayPerLevel  = 2;
    return cfg;
}

inline std::vector<Student> enrolledIn(const std::vector<Student>& students, int courseId) {
    std::vector<Student> out;
    for (const Student& s : students) {
        for (int c : s.courseIds) {
            if (c == courseId) {
                out.push_back(s);
                break;
            }
        }
    }
    return out;
}

inline std::vector<Student> numberedStudents(int count, int courseId) {
    std::vector<Student> out;
    for (int i = 1; i <= count; ++i) out.push_back(makeStudent(i, {courseId}));
    return out;
}
