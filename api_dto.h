#pragma once

#include <string>
#include <vector>

#include "model.h"
#include "seating.h"

struct ExamView {
    int examId;
    int courseId;
    std::string courseCode;
    std::string courseName;
    int classLevel;
    std::string examType;
    std::string date;       // "2025-01-20"
    std::string weekday;    // "Monday"
    std::string startTime;  // "09:00"
    std::string endTime;    // "10:15"
    int durationMinutes;
    int studentCount;
    std::vector<std::string> classrooms;   // коды аудиторий
};

struct SeatView {
    int classroomId;
    std::string classroom;
    int row;
    int column;
    int studentId;
    std::string studentNumber;
    std::string studentName;
};

// Сетка аудитории для отображения: rows x (columns * seatGroup), пустая строка означает свободное место
struct RoomGridView {
    int classroomId;
    std::string classroom;
    int placed;
    std::vector<std::vector<std::string>> grid;
};

struct SeatingView {
    int examId;
    std::string courseCode;
    std::vector<SeatView> seats;
    std::vector<RoomGridView> rooms;
};

std::vector<ExamView> buildExamViews(
    const std::vector<Exam>& exams,
    const DomainData& data
);

SeatingView buildSeatingView(
    const SeatingPlan& plan,
    const Exam& exam,
    const DomainData& data
);
