#include "services/exam_service.hpp"

#include "api/exam_api_client.hpp"
#include "oatpp/network/tcp/client/ConnectionProvider.hpp"
#include "oatpp/parser/json/mapping/ObjectMapper.hpp"
#include "oatpp/web/client/HttpRequestExecutor.hpp"

#include "shared/common/errors.h"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;

        namespace
        {
            const char *JSON_CONTENT_TYPE = "application/json";

            std::string bearer(const std::string &token)
            {
                return "Bearer " + token;
            }

            /**
             * Parse a response body; 404 yields empty, other non-2xx statuses throw.
             */
            std::optional<nlohmann::json> read_json(const std::shared_ptr<oatpp::web::protocol::http::incoming::Response> &response,
                                                    const std::string &what)
            {
                int status = response->getStatusCode();
                oatpp::String body = response->readBodyToString();
                std::string text = body ? *body : std::string();

                if (status == 404)
                {
                    return std::nullopt;
                }
                if (status < 200 || status >= 300)
                {
                    throw CollaboratorError(what + " failed with HTTP " + std::to_string(status) + ": " + text, status);
                }
                if (text.empty())
                {
                    return nlohmann::json::object();
                }

                nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
                if (parsed.is_discarded())
                {
                    throw CollaboratorError(what + " returned invalid JSON", status);
                }
                return parsed;
            }
        } // namespace

        HttpExamService::HttpExamService(const std::string &host, uint16_t port)
            : logger_(logging::get_logger("ExamService"))
        {
            auto connection_provider = oatpp::network::tcp::client::ConnectionProvider::createShared(
                {host, port, oatpp::network::Address::IP_4});
            auto executor = oatpp::web::client::HttpRequestExecutor::createShared(connection_provider);
            auto mapper = oatpp::parser::json::mapping::ObjectMapper::createShared();
            client_ = api::ExamApiClient::createShared(executor, mapper);

            logger_->info("Exam manager client ready", LogContext().add("host", host).add("port", port));
        }

        HttpExamService::~HttpExamService() = default;

        std::optional<nlohmann::json> HttpExamService::get_task(const std::string &task_id, const std::string &token)
        {
            try
            {
                return read_json(client_->getTask(task_id, bearer(token)), "get_task");
            }
            catch (const CollaboratorError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw CollaboratorError(std::string("get_task request failed: ") + e.what());
            }
        }

        void HttpExamService::set_task(const std::string &task_id, const nlohmann::json &task, const std::string &token)
        {
            std::optional<nlohmann::json> result;
            try
            {
                result = read_json(client_->setTask(task_id, bearer(token), JSON_CONTENT_TYPE, task.dump()), "set_task");
            }
            catch (const CollaboratorError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw CollaboratorError(std::string("set_task request failed: ") + e.what());
            }

            if (!result)
            {
                throw CollaboratorError("Task " + task_id + " not found", 404);
            }
        }

        std::string HttpExamService::create_blank_result(const std::string &task_id, const std::string &token)
        {
            std::optional<nlohmann::json> result;
            try
            {
                result = read_json(client_->createBlankResult(task_id, bearer(token)), "create_blank_result");
            }
            catch (const CollaboratorError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw CollaboratorError(std::string("create_blank_result request failed: ") + e.what());
            }

            if (!result || !result->contains("id"))
            {
                throw CollaboratorError("create_blank_result returned no result id");
            }
            const auto &id = (*result)["id"];
            return id.is_string() ? id.get<std::string>() : id.dump();
        }

        void HttpExamService::set_result(const std::string &result_id, const nlohmann::json &result, const std::string &token)
        {
            std::optional<nlohmann::json> response;
            try
            {
                response = read_json(client_->setResult(result_id, bearer(token), JSON_CONTENT_TYPE, result.dump()), "set_result");
            }
            catch (const CollaboratorError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw CollaboratorError(std::string("set_result request failed: ") + e.what());
            }

            if (!response)
            {
                throw CollaboratorError("Result " + result_id + " not found", 404);
            }
        }

        std::optional<nlohmann::json> HttpExamService::get_sequence(const std::string &sequence_id, const std::string &token)
        {
            try
            {
                return read_json(client_->getSequence(sequence_id, bearer(token)), "get_sequence");
            }
            catch (const CollaboratorError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                throw CollaboratorError(std::string("get_sequence request failed: ") + e.what());
            }
        }

    } // namespace services
} // namespace scanlink
