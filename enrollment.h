#include <map>
#include <set>
#include <vector>

#include "model.h"

#pragma once

// Индекс записей студентов на курсы и граф конфликтов курсов.
// Ребро (a, b) есть, если хотя бы один студент записан на оба курса.
// Значение неизменяемое: при изменении записей строится заново через build().
class EnrollmentIndex {
public:
    EnrollmentIndex() = default;

    // courseFilter пустой: учитываются все курсы
    static EnrollmentIndex build(
        const std::vector<Student>& students,
        const std::set<int>& courseFilter = {}
    );

    const std::set<int>& conflictsOf(int courseId) const;
    bool conflicting(int a, int b) const;
    int degree(int courseId) const;

    // Студенты курса, по возрастанию id
    const std::vector<int>& studentsOf(int courseId) const;
    int studentCount(int courseId) const;

    // Количество рёбер графа конфликтов
    size_t conflictPairCount() const;

private:
    std::map<int, std::set<int>> adj_;
    std::map<int, std::vector<int>> students_;
};
