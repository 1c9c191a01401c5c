#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "providers.h"

// Хранилище в памяти процесса (CLI, тесты).
// Замена выполняется под одной блокировкой, читатели не видят промежуточного состояния.
class InMemoryStore : public PersistenceProvider {
public:
    std::vector<Exam> replaceExams(
        ExamType type,
        const std::vector<int>& courseIds,
        const std::vector<Exam>& exams
    ) override;

    void replaceSeating(int examId, const std::vector<SeatAssignment>& seats) override;

    std::vector<Exam> loadExams(ExamType type) override;
    std::vector<SeatAssignment> loadSeating(int examId) override;

private:
    std::mutex mutex_;
    int nextExamId_ = 1;
    std::map<int, Exam> exams_;                           // id -> экзамен
    std::map<int, std::vector<SeatAssignment>> seating_;  // examId -> места
};
