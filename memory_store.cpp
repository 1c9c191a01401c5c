#include "memory_store.h"

#include "logger.h"

#include <set>
#include <stdexcept>
#include <string>

std::vector<Exam> InMemoryStore::replaceExams(
    ExamType type,
    const std::vector<int>& courseIds,
    const std::vector<Exam>& exams
) {
    std::set<int> courses(courseIds.begin(), courseIds.end());

    // готовим новое состояние целиком, потом подменяем
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<int, Exam> nextExams = exams_;
    std::map<int, std::vector<SeatAssignment>> nextSeating = seating_;

    int removed = 0;
    for (auto it = nextExams.begin(); it != nextExams.end();) {
        if (it->second.type == type && courses.count(it->second.courseId)) {
            nextSeating.erase(it->first);
            it = nextExams.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    int nextId = nextExamId_;
    std::vector<Exam> stored;
    for (const Exam& e : exams) {
        if (e.type != type) {
            throw std::invalid_argument("exam for course " + std::to_string(e.courseId) +
                                        " has a different exam type");
        }
        Exam copy = e;
        copy.id = nextId++;
        nextExams[copy.id] = copy;
        stored.push_back(copy);
    }

    exams_.swap(nextExams);
    seating_.swap(nextSeating);
    nextExamId_ = nextId;

    logInfo("Сохранено экзаменов: " + std::to_string(stored.size()) +
            ", удалено прежних: " + std::to_string(removed));
    return stored;
}

void InMemoryStore::replaceSeating(int examId, const std::vector<SeatAssignment>& seats) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!exams_.count(examId)) {
        throw std::invalid_argument("exam " + std::to_string(examId) + " is not stored");
    }
    for (const SeatAssignment& s : seats) {
        if (s.examId != examId) {
            throw std::invalid_argument("seat of student " + std::to_string(s.studentId) +
                                        " belongs to another exam");
        }
    }
    seating_[examId] = seats;
}

std::vector<Exam> InMemoryStore::loadExams(ExamType type) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Exam> result;
    for (const auto& p : exams_) {
        if (p.second.type == type) result.push_back(p.second);
    }
    return result;
}

std::vector<SeatAssignment> InMemoryStore::loadSeating(int examId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = seating_.find(examId);
    if (it == seating_.end()) return {};
    return it->second;
}
