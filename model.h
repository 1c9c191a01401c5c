#pragma once

#include <string>
#include <vector>

struct Course {
    int id;
    std::string code;
    std::string name;
    std::string instructor;
    int classLevel;         // курс обучения (1..6), для лимита экзаменов в день
    bool mandatory = true;  // обязательный / по выбору
};

struct Student {
    int id;
    std::string number;     // номер студенческого
    std::string name;
    int classLevel;
    std::vector<int> courseIds;
};

struct Classroom {
    int id;
    std::string code;
    std::string name;
    int capacity;
    int rows;
    int columns;    // количество парт (групп мест) в ряду
    int seatGroup;  // мест за одной партой: 2, 3 или 4
};

struct SeatCoordinate {
    int row;     // с 1
    int column;  // номер места в ряду с 1: groupIndex * seatGroup + seatInGroup
};

enum class ExamType {
    Midterm,
    Final,
    Makeup
};

struct Exam {
    int id;
    int courseId;
    ExamType type;
    std::string date;       // "2025-01-20"
    int startMinutes;       // от полуночи
    int endMinutes;         // startMinutes + длительность
    std::vector<int> classroomIds;
};

struct SeatAssignment {
    int examId;
    int classroomId;
    int row;
    int column;
    int studentId;
};

// Входные данные одного запуска (то, что отдаёт импорт)
struct DomainData {
    std::vector<Course>    courses;
    std::vector<Student>   students;
    std::vector<Classroom> classrooms;
};

const char* examTypeToString(ExamType type);
bool examTypeFromString(const std::string& s, ExamType& out);
