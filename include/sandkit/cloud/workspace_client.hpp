/**
 * @file workspace_client.hpp
 * @brief Synchronous client for the remote workspace API
 *
 * WorkspaceApi is the seam between the cloud backend and the remote
 * service. Every call blocks; the backend dispatches them through its
 * BlockingBridge. HttpWorkspaceClient implements the interface over HTTPS
 * with libcurl.
 *
 * **Endpoints** (relative to the server URL):
 * ```
 * POST   /sandbox                                        create   → {"id"}
 * DELETE /sandbox/{id}                                   delete
 * POST   /toolbox/{id}/toolbox/process/execute           execute  → {"exitCode","result"}
 * GET    /toolbox/{id}/toolbox/files/download?path=...   download → bytes
 * POST   /toolbox/{id}/toolbox/files/upload?path=...     upload   (multipart "file")
 * ```
 *
 * @date 2026
 */

#pragma once

#include "sandkit/core/command_result.hpp"

#include <chrono>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace sandkit {
namespace cloud {

/**
 * @struct WorkspaceSpec
 * @brief Image, region and sizing of a workspace to create
 */
struct WorkspaceSpec {
    std::string image;            ///< Workspace image
    std::string target;           ///< Region
    int cpu{2};                   ///< CPU cores
    int memory{4};                ///< Memory (GB)
    int disk{10};                 ///< Disk (GB)
    int auto_stop_interval{30};   ///< Minutes, 0 disables

    /// Request body of the create call
    nlohmann::json ToJson() const;
};

/**
 * @struct ProcessRequest
 * @brief One command to run in a workspace
 */
struct ProcessRequest {
    std::string command;                      ///< Shell command line
    std::string cwd;                          ///< Working directory
    std::map<std::string, std::string> env;   ///< Extra environment
    std::chrono::seconds timeout{120};        ///< Passed to the server as a hint

    /// Request body of the execute call
    nlohmann::json ToJson() const;
};

/**
 * @class WorkspaceApi
 * @brief Blocking remote workspace operations
 *
 * Implementations throw core::NotFoundError for a missing file and
 * core::TransportError for every other failure to reach or satisfy the
 * service.
 */
class WorkspaceApi {
public:
    virtual ~WorkspaceApi() = default;

    /// @return Workspace ID
    virtual std::string CreateWorkspace(const WorkspaceSpec& spec) = 0;
    virtual void DeleteWorkspace(const std::string& workspace_id) = 0;

    /**
     * @brief Run a command; the raw response is mapped by AdaptExecResponse()
     */
    virtual nlohmann::json ExecuteProcess(const std::string& workspace_id,
                                          const ProcessRequest& request) = 0;

    virtual std::string DownloadFile(const std::string& workspace_id, const std::string& path) = 0;
    virtual void UploadFile(const std::string& workspace_id, const std::string& path,
                            const std::string& content) = 0;
};

/**
 * @brief Map an execute response onto CommandResult
 *
 * `exitCode` (integer, required) becomes the exit code, `result` the
 * stdout and the optional `stderr` the stderr.
 *
 * @throws core::TransportError if the response does not have that shape
 */
core::CommandResult AdaptExecResponse(const nlohmann::json& response);

/**
 * @class HttpWorkspaceClient
 * @brief WorkspaceApi over HTTPS (libcurl, bearer-token authentication)
 *
 * Each call uses its own easy handle, so one client may serve several
 * bridge workers at once.
 *
 * **Usage Example**:
 * @code
 * HttpWorkspaceClient client("https://api.daytona.io", api_key);
 * std::string id = client.CreateWorkspace(spec);
 *
 * ProcessRequest request;
 * request.command = "python3 --version";
 * request.cwd = "/workspace";
 * auto result = AdaptExecResponse(client.ExecuteProcess(id, request));
 *
 * client.DeleteWorkspace(id);
 * @endcode
 */
class HttpWorkspaceClient : public WorkspaceApi {
public:
    /// Seconds an execute request may outlive its command timeout
    static constexpr int kRequestTimeoutGraceSeconds = 10;

    /**
     * @param server_url API base URL (no trailing slash)
     * @param api_key Bearer credential
     * @param request_timeout Bound on non-execute requests
     */
    HttpWorkspaceClient(std::string server_url, std::string api_key,
                        std::chrono::seconds request_timeout = std::chrono::seconds(120));

    std::string CreateWorkspace(const WorkspaceSpec& spec) override;
    void DeleteWorkspace(const std::string& workspace_id) override;
    nlohmann::json ExecuteProcess(const std::string& workspace_id,
                                  const ProcessRequest& request) override;
    std::string DownloadFile(const std::string& workspace_id, const std::string& path) override;
    void UploadFile(const std::string& workspace_id, const std::string& path,
                    const std::string& content) override;

    const std::string& GetServerUrl() const { return server_url_; }

private:
    struct HttpResponse {
        long status{0};
        std::string body;
    };

    struct Upload {
        std::string file_name;
        const std::string* content{nullptr};
    };

    HttpResponse Perform(const std::string& method, const std::string& url,
                         const std::string* json_body, const Upload* upload,
                         std::chrono::milliseconds timeout) const;
    std::string ToolboxUrl(const std::string& workspace_id, const std::string& suffix) const;
    static std::string Escape(const std::string& value);

    std::string server_url_;
    std::string api_key_;
    std::chrono::seconds request_timeout_;
};

} // namespace cloud
} // namespace sandkit
