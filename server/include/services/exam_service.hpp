#ifndef SCANLINK_SERVER_EXAM_SERVICE_HPP
#define SCANLINK_SERVER_EXAM_SERVICE_HPP

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "shared/logging/logger.h"

namespace scanlink
{
    namespace api
    {
        class ExamApiClient;
    }

    namespace services
    {

        /**
         * Task status values understood by the exam manager
         */
        namespace task_status
        {
            constexpr const char *IN_PROGRESS = "INPROGRESS";
            constexpr const char *FINISHED = "FINISHED";
            constexpr const char *ERROR = "ERROR";
        } // namespace task_status

        /**
         * Exam manager operations used by the device manager
         *
         * Tasks, results and sequences are exchanged as JSON documents so that
         * fields this service does not interpret survive a read-modify-write.
         * Lookups return empty on 404; other failures throw CollaboratorError.
         */
        class ExamService
        {
        public:
            virtual ~ExamService() = default;

            virtual std::optional<nlohmann::json> get_task(const std::string &task_id, const std::string &token) = 0;
            virtual void set_task(const std::string &task_id, const nlohmann::json &task, const std::string &token) = 0;

            /** @return id of the newly created result */
            virtual std::string create_blank_result(const std::string &task_id, const std::string &token) = 0;
            virtual void set_result(const std::string &result_id, const nlohmann::json &result, const std::string &token) = 0;

            virtual std::optional<nlohmann::json> get_sequence(const std::string &sequence_id, const std::string &token) = 0;
        };

        /**
         * ExamService over HTTP using an oatpp ApiClient
         */
        class HttpExamService : public ExamService
        {
        public:
            HttpExamService(const std::string &host, uint16_t port);
            ~HttpExamService() override;

            std::optional<nlohmann::json> get_task(const std::string &task_id, const std::string &token) override;
            void set_task(const std::string &task_id, const nlohmann::json &task, const std::string &token) override;
            std::string create_blank_result(const std::string &task_id, const std::string &token) override;
            void set_result(const std::string &result_id, const nlohmann::json &result, const std::string &token) override;
            std::optional<nlohmann::json> get_sequence(const std::string &sequence_id, const std::string &token) override;

        private:
            std::shared_ptr<api::ExamApiClient> client_;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_EXAM_SERVICE_HPP
