#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_json.h"
#include "config.h"
#include "enrollment.h"
#include "errors.h"
#include "generator.h"
#include "logger.h"
#include "memory_store.h"
#include "model.h"
#include "seating.h"

// коды возврата
static const int EXIT_USAGE      = 1;
static const int EXIT_INVALID    = 2;
static const int EXIT_INFEASIBLE = 3;
static const int EXIT_CAPACITY   = 4;
static const int EXIT_INTERNAL   = 5;

static int usage() {
    std::cerr << "usage:\n"
              << "  examplan schedule <input.json>\n"
              << "  examplan seating  <input.json> [seed]\n";
    return EXIT_USAGE;
}

// Рассадка по всем экзаменам, сохранённым в store
static void seatAll(
    PersistenceProvider& store,
    ExportProvider& exporter,
    const InputDocument& doc,
    ExamType type,
    unsigned int seed
) {
    EnrollmentIndex index = EnrollmentIndex::build(doc.data.students);

    std::map<int, const Student*> studentById;
    for (const Student& s : doc.data.students) studentById[s.id] = &s;
    std::map<int, const Classroom*> roomById;
    for (const Classroom& r : doc.data.classrooms) roomById[r.id] = &r;

    for (const Exam& exam : store.loadExams(type)) {
        std::vector<Student> enrolled;
        for (int sid : index.studentsOf(exam.courseId)) enrolled.push_back(*studentById.at(sid));

        std::vector<Classroom> rooms;
        for (int rid : exam.classroomIds) rooms.push_back(*roomById.at(rid));

        unsigned int examSeed = seed + static_cast<unsigned int>(exam.id);
        SeatingPlan plan = assignSeating(exam, enrolled, rooms, examSeed, doc.seating.layout);
        store.replaceSeating(exam.id, plan.seats);

        exporter.exportSeating(plan, exam, doc.data);
    }
}

int main(int argc, char** argv) {
    try {
        AppConfig app = AppConfig::fromEnv();
        configureLogging(app.logFile, app.logLevel);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return EXIT_USAGE;
    }

    if (argc < 3) return usage();

    std::string command = argv[1];
    std::string path    = argv[2];
    if (command != "schedule" && command != "seating") return usage();

    try {
        JsonImportProvider importer = JsonImportProvider::fromFile(path);
        InputDocument doc = importer.loadDocument();
        std::vector<Course> courses = selectedCourses(doc);

        ScheduleResult result = scheduleExams(
            courses,
            doc.data.students,
            doc.data.classrooms,
            doc.schedule
        );

        JsonExporter exporter(std::cout);

        if (command == "schedule") {
            exporter.exportSchedule(result, doc.data);
            return 0;
        }

        unsigned int seed = doc.seating.seed;
        if (argc >= 4) seed = static_cast<unsigned int>(std::stoul(argv[3]));

        InMemoryStore store;
        std::vector<int> courseIds;
        for (const Course& c : courses) courseIds.push_back(c.id);
        store.replaceExams(result.examType, courseIds, result.exams);

        logInfo("Рассадка для " + std::to_string(result.exams.size()) +
                " экзаменов, seed=" + std::to_string(seed));
        seatAll(store, exporter, doc, result.examType, seed);
        return 0;

    } catch (const InvalidInputError& ex) {
        logError(ex.what());
        std::cout << errorToJson(ex).dump(2) << "\n";
        return EXIT_INVALID;
    } catch (const InfeasibleScheduleError& ex) {
        logError(ex.what());
        std::cout << errorToJson(ex).dump(2) << "\n";
        return EXIT_INFEASIBLE;
    } catch (const CapacityShortfallError& ex) {
        logError(ex.what());
        std::cout << errorToJson(ex).dump(2) << "\n";
        return EXIT_CAPACITY;
    } catch (const VerificationError& ex) {
        logError(ex.what());
        std::cout << errorToJson(ex).dump(2) << "\n";
        return EXIT_INTERNAL;
    } catch (const SchedulingError& ex) {
        logError(ex.what());
        std::cout << errorToJson(ex).dump(2) << "\n";
        return EXIT_INVALID;
    } catch (const nlohmann::json::exception& ex) {
        logError(std::string("Некорректный JSON: ") + ex.what());
        return EXIT_INVALID;
    } catch (const std::exception& ex) {
        logError(std::string("Ошибка: ") + ex.what());
        return EXIT_USAGE;
    }
}
