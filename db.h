#pragma once

#include <pqxx/pqxx>

#include <memory>
#include <string>
#include <vector>

#include "model.h"
#include "providers.h"

namespace db {

// --- Конфиг подключения к БД ---
struct DbConfig {
    std::string host;
    int         port;
    std::string dbname;
    std::string user;
    std::string password;

    static DbConfig fromEnv();
};

// --- Фабрика соединений ---
class ConnectionFactory {
public:
    explicit ConnectionFactory(const DbConfig& cfg);

    std::unique_ptr<pqxx::connection> createConnection() const;

private:
    DbConfig config;
};

// --- Справочники и результаты в PostgreSQL (таблицы из schema.sql) ---
// Каждая операция записи выполняется в одной транзакции.
class PgStore : public ImportProvider, public PersistenceProvider {
public:
    explicit PgStore(ConnectionFactory& factory)
        : factory_(factory) {}

    DomainData loadDomainData() override;

    std::vector<Exam> replaceExams(
        ExamType type,
        const std::vector<int>& courseIds,
        const std::vector<Exam>& exams
    ) override;

    void replaceSeating(int examId, const std::vector<SeatAssignment>& seats) override;

    std::vector<Exam> loadExams(ExamType type) override;
    std::vector<SeatAssignment> loadSeating(int examId) override;

    // SELECT 1 для health-check
    bool ping();

private:
    ConnectionFactory& factory_;
};

} // namespace db
