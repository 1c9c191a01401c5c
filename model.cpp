#include "model.h"

const char* examTypeToString(ExamType type) {
    switch (type) {
        case ExamType::Midterm: return "midterm";
        case ExamType::Final:   return "final";
        case ExamType::Makeup:  return "makeup";
    }
    return "midterm";
}

bool examTypeFromString(const std::string& s, ExamType& out) {
    if (s == "midterm") {
        out = ExamType::Midterm;
        return true;
    }
    if (s == "final") {
        out = ExamType::Final;
        return true;
    }
    if (s == "makeup") {
        out = ExamType::Makeup;
        return true;
    }
    return false;
}
