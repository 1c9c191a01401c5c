#include "api_dto.h"
#include "calendar.h"
#include "enrollment.h"

#include <map>

// простые утилиты для поиска по id
static const Course* findCourseById_ui(const std::vector<Course>& courses, int id) {
    for (const Course& c : courses) if (c.id == id) return &c;
    return nullptr;
}

static const Classroom* findClassroomById_ui(const std::vector<Classroom>& rooms, int id) {
    for (const Classroom& r : rooms) if (r.id == id) return &r;
    return nullptr;
}

static std::string roomLabel(const Classroom* r, int id) {
    if (!r) return "#" + std::to_string(id);
    return r->code.empty() ? r->name : r->code;
}

std::vector<ExamView> buildExamViews(
    const std::vector<Exam>& exams,
    const DomainData& data
) {
    // повторная запись студента на курс считается один раз
    EnrollmentIndex index = EnrollmentIndex::build(data.students);

    std::vector<ExamView> result;

    for (const Exam& exam : exams) {
        const Course* c = findCourseById_ui(data.courses, exam.courseId);

        ExamView ev;
        ev.examId          = exam.id;
        ev.courseId        = exam.courseId;
        ev.courseCode      = c ? c->code : "?";
        ev.courseName      = c ? c->name : "Unknown course";
        ev.classLevel      = c ? c->classLevel : 0;
        ev.examType        = examTypeToString(exam.type);
        ev.date            = exam.date;
        ev.weekday         = weekdayName(isoWeekday(exam.date));
        ev.startTime       = formatTime(exam.startMinutes);
        ev.endTime         = formatTime(exam.endMinutes);
        ev.durationMinutes = exam.endMinutes - exam.startMinutes;
        ev.studentCount    = index.studentCount(exam.courseId);

        for (int roomId : exam.classroomIds) {
            ev.classrooms.push_back(roomLabel(findClassroomById_ui(data.classrooms, roomId), roomId));
        }

        result.push_back(ev);
    }

    return result;
}

SeatingView buildSeatingView(
    const SeatingPlan& plan,
    const Exam& exam,
    const DomainData& data
) {
    std::map<int, const Student*> students;
    for (const Student& s : data.students) students[s.id] = &s;

    const Course* c = findCourseById_ui(data.courses, exam.courseId);

    SeatingView view;
    view.examId     = plan.examId;
    view.courseCode = c ? c->code : "?";

    std::map<int, size_t> gridIndex;
    for (const RoomFill& fill : plan.rooms) {
        const Classroom* r = findClassroomById_ui(data.classrooms, fill.classroomId);

        RoomGridView g;
        g.classroomId = fill.classroomId;
        g.classroom   = roomLabel(r, fill.classroomId);
        g.placed      = fill.placed;
        if (r) {
            g.grid.assign(r->rows, std::vector<std::string>(r->columns * r->seatGroup));
        }
        gridIndex[fill.classroomId] = view.rooms.size();
        view.rooms.push_back(g);
    }

    for (const SeatAssignment& s : plan.seats) {
        auto st = students.find(s.studentId);

        SeatView sv;
        sv.classroomId   = s.classroomId;
        sv.classroom     = roomLabel(findClassroomById_ui(data.classrooms, s.classroomId),
                                     s.classroomId);
        sv.row           = s.row;
        sv.column        = s.column;
        sv.studentId     = s.studentId;
        sv.studentNumber = st != students.end() ? st->second->number : "";
        sv.studentName   = st != students.end() ? st->second->name : "";
        view.seats.push_back(sv);

        auto gi = gridIndex.find(s.classroomId);
        if (gi == gridIndex.end()) continue;
        std::vector<std::vector<std::string>>& grid = view.rooms[gi->second].grid;
        if (s.row >= 1 && s.row <= static_cast<int>(grid.size()) &&
            s.column >= 1 && s.column <= static_cast<int>(grid[s.row - 1].size())) {
            grid[s.row - 1][s.column - 1] =
                sv.studentNumber.empty() ? std::to_string(s.studentId) : sv.studentNumber;
        }
    }

    return view;
}
