#include "db.h"

#include "logger.h"

#include <cstdlib>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <pqxx/pqxx>

namespace db {

// ==================== DbConfig::fromEnv ====================

static std::string getEnvOrThrow(const char* name) {
    const char* val = std::getenv(name);
    if (!val) {
        std::string msg = "Environment variable ";
        msg += name;
        msg += " is not set";
        throw std::runtime_error(msg);
    }
    return std::string(val);
}

DbConfig DbConfig::fromEnv() {
    DbConfig cfg;
    cfg.host     = getEnvOrThrow("EXAMPLAN_DB_HOST");
    cfg.dbname   = getEnvOrThrow("EXAMPLAN_DB_NAME");
    cfg.user     = getEnvOrThrow("EXAMPLAN_DB_USER");
    cfg.password = getEnvOrThrow("EXAMPLAN_DB_PASSWORD");

    const char* portStr = std::getenv("EXAMPLAN_DB_PORT");
    cfg.port = portStr ? std::stoi(portStr) : 5432; // по умолчанию 5432

    return cfg;
}

// ==================== ConnectionFactory ====================

ConnectionFactory::ConnectionFactory(const DbConfig& cfg)
    : config(cfg) {}

std::unique_ptr<pqxx::connection> ConnectionFactory::createConnection() const {
    std::stringstream ss;
    ss << "host=" << config.host
       << " port=" << config.port
       << " dbname=" << config.dbname
       << " user=" << config.user
       << " password=" << config.password;

    return std::make_unique<pqxx::connection>(ss.str());
}

// ==================== PgStore: справочники ====================

DomainData PgStore::loadDomainData() {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    DomainData d;

    pqxx::result courses = tx.exec(R"SQL(
        SELECT id, code, name, COALESCE(instructor, '') AS instructor, class_level, mandatory
        FROM course
        ORDER BY id
    )SQL");
    for (const auto& r : courses) {
        Course c;
        c.id         = r["id"].as<int>();
        c.code       = r["code"].as<std::string>();
        c.name       = r["name"].as<std::string>();
        c.instructor = r["instructor"].as<std::string>();
        c.classLevel = r["class_level"].as<int>();
        c.mandatory  = r["mandatory"].as<bool>();
        d.courses.push_back(c);
    }

    pqxx::result students = tx.exec(R"SQL(
        SELECT id, number, name, class_level
        FROM student
        ORDER BY id
    )SQL");
    std::map<int, size_t> studentIndex;
    for (const auto& r : students) {
        Student s;
        s.id         = r["id"].as<int>();
        s.number     = r["number"].as<std::string>();
        s.name       = r["name"].as<std::string>();
        s.classLevel = r["class_level"].as<int>();
        studentIndex[s.id] = d.students.size();
        d.students.push_back(s);
    }

    pqxx::result links = tx.exec(R"SQL(
        SELECT student_id, course_id
        FROM student_course
        ORDER BY student_id, course_id
    )SQL");
    for (const auto& r : links) {
        auto it = studentIndex.find(r["student_id"].as<int>());
        if (it == studentIndex.end()) continue;
        d.students[it->second].courseIds.push_back(r["course_id"].as<int>());
    }

    pqxx::result rooms = tx.exec(R"SQL(
        SELECT id, code, name, capacity, seat_rows, seat_columns, seat_group
        FROM classroom
        ORDER BY id
    )SQL");
    for (const auto& r : rooms) {
        Classroom c;
        c.id        = r["id"].as<int>();
        c.code      = r["code"].as<std::string>();
        c.name      = r["name"].as<std::string>();
        c.capacity  = r["capacity"].as<int>();
        c.rows      = r["seat_rows"].as<int>();
        c.columns   = r["seat_columns"].as<int>();
        c.seatGroup = r["seat_group"].as<int>();
        d.classrooms.push_back(c);
    }

    tx.commit();

    logInfo("Загружено из БД: курсов " + std::to_string(d.courses.size()) +
            ", студентов " + std::to_string(d.students.size()) +
            ", аудиторий " + std::to_string(d.classrooms.size()));
    return d;
}

// ==================== PgStore: экзамены ====================

std::vector<Exam> PgStore::replaceExams(
    ExamType type,
    const std::vector<int>& courseIds,
    const std::vector<Exam>& exams
) {
    const std::string typeStr = examTypeToString(type);

    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    // seating и exam_classroom удаляются каскадом
    for (int courseId : courseIds) {
        tx.exec_params(
            "DELETE FROM exam WHERE exam_type = $1 AND course_id = $2",
            typeStr,
            courseId
        );
    }

    std::vector<Exam> stored;
    for (const Exam& e : exams) {
        if (e.type != type) {
            throw std::invalid_argument("exam for course " + std::to_string(e.courseId) +
                                        " has a different exam type");
        }

        pqxx::row row = tx.exec_params1(
            R"SQL(
                INSERT INTO exam (course_id, exam_type, exam_date, start_minutes, end_minutes)
                VALUES ($1, $2, $3::date, $4, $5)
                RETURNING id
            )SQL",
            e.courseId,
            typeStr,
            e.date,
            e.startMinutes,
            e.endMinutes
        );

        Exam copy = e;
        copy.id = row["id"].as<int>();

        for (size_t i = 0; i < e.classroomIds.size(); ++i) {
            tx.exec_params(
                "INSERT INTO exam_classroom (exam_id, classroom_id, position) VALUES ($1, $2, $3)",
                copy.id,
                e.classroomIds[i],
                static_cast<int>(i)
            );
        }
        stored.push_back(copy);
    }

    tx.commit();

    logInfo("В БД сохранено экзаменов (" + typeStr + "): " + std::to_string(stored.size()));
    return stored;
}

std::vector<Exam> PgStore::loadExams(ExamType type) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    pqxx::result rows = tx.exec_params(
        R"SQL(
            SELECT id, course_id, exam_date::text AS exam_date, start_minutes, end_minutes
            FROM exam
            WHERE exam_type = $1
            ORDER BY exam_date, start_minutes, id
        )SQL",
        std::string(examTypeToString(type))
    );

    pqxx::result rooms = tx.exec_params(
        R"SQL(
            SELECT ec.exam_id, ec.classroom_id
            FROM exam_classroom ec
            JOIN exam e ON e.id = ec.exam_id
            WHERE e.exam_type = $1
            ORDER BY ec.exam_id, ec.position
        )SQL",
        std::string(examTypeToString(type))
    );
    tx.commit();

    std::map<int, std::vector<int>> roomsByExam;
    for (const auto& r : rooms) {
        roomsByExam[r["exam_id"].as<int>()].push_back(r["classroom_id"].as<int>());
    }

    std::vector<Exam> result;
    for (const auto& r : rows) {
        Exam e;
        e.id           = r["id"].as<int>();
        e.courseId     = r["course_id"].as<int>();
        e.type         = type;
        e.date         = r["exam_date"].as<std::string>();
        e.startMinutes = r["start_minutes"].as<int>();
        e.endMinutes   = r["end_minutes"].as<int>();
        e.classroomIds = roomsByExam[e.id];
        result.push_back(std::move(e));
    }
    return result;
}

// ==================== PgStore: рассадка ====================

void PgStore::replaceSeating(int examId, const std::vector<SeatAssignment>& seats) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    pqxx::result exists = tx.exec_params("SELECT 1 FROM exam WHERE id = $1", examId);
    if (exists.empty()) {
        throw std::invalid_argument("exam " + std::to_string(examId) + " is not stored");
    }

    tx.exec_params("DELETE FROM seating WHERE exam_id = $1", examId);

    for (const SeatAssignment& s : seats) {
        if (s.examId != examId) {
            throw std::invalid_argument("seat of student " + std::to_string(s.studentId) +
                                        " belongs to another exam");
        }
        tx.exec_params(
            R"SQL(
                INSERT INTO seating (exam_id, classroom_id, seat_row, seat_col, student_id)
                VALUES ($1, $2, $3, $4, $5)
            )SQL",
            s.examId,
            s.classroomId,
            s.row,
            s.column,
            s.studentId
        );
    }

    tx.commit();
    logInfo("В БД сохранена рассадка экзамена id=" + std::to_string(examId) +
            ": мест " + std::to_string(seats.size()));
}

std::vector<SeatAssignment> PgStore::loadSeating(int examId) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    pqxx::result rows = tx.exec_params(
        R"SQL(
            SELECT exam_id, classroom_id, seat_row, seat_col, student_id
            FROM seating
            WHERE exam_id = $1
            ORDER BY classroom_id, seat_row, seat_col
        )SQL",
        examId
    );
    tx.commit();

    std::vector<SeatAssignment> result;
    for (const auto& r : rows) {
        SeatAssignment s;
        s.examId      = r["exam_id"].as<int>();
        s.classroomId = r["classroom_id"].as<int>();
        s.row         = r["seat_row"].as<int>();
        s.column      = r["seat_col"].as<int>();
        s.studentId   = r["student_id"].as<int>();
        result.push_back(s);
    }
    return result;
}

bool PgStore::ping() {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};
    auto r = tx.exec("SELECT 1");
    tx.commit();
    return !r.empty();
}

} // namespace db
