#include "enrollment.h"

#include <algorithm>

namespace {
    const std::set<int> kNoConflicts;
    const std::vector<int> kNoStudents;
}

EnrollmentIndex EnrollmentIndex::build(
    const std::vector<Student>& students,
    const std::set<int>& courseFilter
) {
    EnrollmentIndex index;

    for (const Student& s : students) {
        // курсы студента без повторов и только из выборки
        std::vector<int> courses;
        for (int c : s.courseIds) {
            if (!courseFilter.empty() && !courseFilter.count(c)) continue;
            courses.push_back(c);
        }
        std::sort(courses.begin(), courses.end());
        courses.erase(std::unique(courses.begin(), courses.end()), courses.end());

        for (int c : courses) {
            index.students_[c].push_back(s.id);
        }

        // попарно связываем курсы одного студента
        for (size_t i = 0; i < courses.size(); ++i) {
            for (size_t j = i + 1; j < courses.size(); ++j) {
                index.adj_[courses[i]].insert(courses[j]);
                index.adj_[courses[j]].insert(courses[i]);
            }
        }
    }

    for (auto& p : index.students_) {
        std::vector<int>& ids = p.second;
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    }

    return index;
}

const std::set<int>& EnrollmentIndex::conflictsOf(int courseId) const {
    auto it = adj_.find(courseId);
    if (it == adj_.end()) return kNoConflicts;
    return it->second;
}

bool EnrollmentIndex::conflicting(int a, int b) const {
    if (a == b) return false;
    const std::set<int>& neighbours = conflictsOf(a);
    return neighbours.count(b) > 0;
}

int EnrollmentIndex::degree(int courseId) const {
    return static_cast<int>(conflictsOf(courseId).size());
}

const std::vector<int>& EnrollmentIndex::studentsOf(int courseId) const {
    auto it = students_.find(courseId);
    if (it == students_.end()) return kNoStudents;
    return it->second;
}

int EnrollmentIndex::studentCount(int courseId) const {
    return static_cast<int>(studentsOf(courseId).size());
}

size_t EnrollmentIndex::conflictPairCount() const {
    size_t twice = 0;
    for (const auto& p : adj_) twice += p.second.size();
    return twice / 2;
}
