#ifndef SCANLINK_SERVER_EXAM_API_CLIENT_HPP
#define SCANLINK_SERVER_EXAM_API_CLIENT_HPP

#include "oatpp/web/client/ApiClient.hpp"
#include "oatpp/core/macro/codegen.hpp"

namespace scanlink
{
    namespace api
    {

#include OATPP_CODEGEN_BEGIN(ApiClient)

        /**
         * Exam manager REST endpoints. Bodies are JSON strings built with nlohmann.
         */
        class ExamApiClient : public oatpp::web::client::ApiClient
        {
            API_CLIENT_INIT(ExamApiClient)

            API_CALL("GET", "/api/v1/exam/task/{task_id}", getTask,
                     PATH(String, taskId, "task_id"),
                     HEADER(String, authorization, "Authorization"))

            API_CALL("PUT", "/api/v1/exam/task/{task_id}", setTask,
                     PATH(String, taskId, "task_id"),
                     HEADER(String, authorization, "Authorization"),
                     HEADER(String, contentType, "Content-Type"),
                     BODY_STRING(String, body))

            API_CALL("POST", "/api/v1/exam/blank/{task_id}", createBlankResult,
                     PATH(String, taskId, "task_id"),
                     HEADER(String, authorization, "Authorization"))

            API_CALL("PUT", "/api/v1/exam/result/{result_id}", setResult,
                     PATH(String, resultId, "result_id"),
                     HEADER(String, authorization, "Authorization"),
                     HEADER(String, contentType, "Content-Type"),
                     BODY_STRING(String, body))

            API_CALL("GET", "/api/v1/exam/sequence/{sequence_id}", getSequence,
                     PATH(String, sequenceId, "sequence_id"),
                     HEADER(String, authorization, "Authorization"))
        };

#include OATPP_CODEGEN_END(ApiClient)

    } // namespace api
} // namespace scanlink

#endif // SCANLINK_SERVER_EXAM_API_CLIENT_HPP
