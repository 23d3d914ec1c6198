/**
 * @file workspace_client.cpp
 * @brief libcurl implementation of the remote workspace API
 *
 * **Status Mapping**:
 * - curl failure (DNS, TLS, timeout)   → TransportError
 * - HTTP 404 on download               → NotFoundError
 * - any other HTTP status >= 400       → TransportError (with response body)
 *
 * @date 2026
 */

#include "sandkit/cloud/workspace_client.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <memory>
#include <mutex>

using json = nlohmann::json;

namespace sandkit {
namespace cloud {

namespace {

void EnsureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

std::size_t StringWriter(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* sink = static_cast<std::string*>(userdata);
    sink->append(data, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

std::string DescribeFailure(const std::string& what, long status, const std::string& body) {
    std::string message = what + " failed with HTTP " + std::to_string(status);
    std::string detail = utils::StringUtils::Trim(body);
    if (!detail.empty()) {
        message += ": " + utils::StringUtils::Truncate(detail, 300);
    }
    return message;
}

json ParseJsonBody(const std::string& what, const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw core::TransportError(what + " returned malformed JSON: " + e.what());
    }
}

} // anonymous namespace

// ============================================================================
// REQUEST BODIES
// ============================================================================

json WorkspaceSpec::ToJson() const {
    return {
        {"image", image},
        {"target", target},
        {"cpu", cpu},
        {"memory", memory},
        {"disk", disk},
        {"autoStopInterval", auto_stop_interval}
    };
}

json ProcessRequest::ToJson() const {
    json body = {
        {"command", command},
        {"timeout", timeout.count()}
    };
    if (!cwd.empty()) {
        body["cwd"] = cwd;
    }
    if (!env.empty()) {
        body["env"] = env;
    }
    return body;
}

// ============================================================================
// RESPONSE ADAPTER
// ============================================================================

core::CommandResult AdaptExecResponse(const json& response) {
    if (!response.is_object()) {
        throw core::TransportError("Execute response is not a JSON object");
    }

    auto exit_code = response.find("exitCode");
    if (exit_code == response.end() || !exit_code->is_number_integer()) {
        throw core::TransportError("Execute response has no integer exitCode");
    }

    auto read_text = [&response](const char* key) -> std::string {
        auto it = response.find(key);
        if (it == response.end() || it->is_null()) {
            return "";
        }
        if (!it->is_string()) {
            throw core::TransportError(std::string("Execute response field '") + key +
                                       "' is not a string");
        }
        return it->get<std::string>();
    };

    return core::CommandResult(exit_code->get<int>(), read_text("result"), read_text("stderr"));
}

// ============================================================================
// HTTP CLIENT
// ============================================================================

HttpWorkspaceClient::HttpWorkspaceClient(std::string server_url, std::string api_key,
                                         std::chrono::seconds request_timeout)
    : server_url_(std::move(server_url)),
      api_key_(std::move(api_key)),
      request_timeout_(request_timeout) {
    EnsureCurlInitialized();
    while (utils::StringUtils::EndsWith(server_url_, "/")) {
        server_url_.pop_back();
    }
}

std::string HttpWorkspaceClient::Escape(const std::string& value) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw core::TransportError("curl_easy_init failed");
    }

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        throw core::TransportError("Failed to URL-encode '" + value + "'");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string HttpWorkspaceClient::ToolboxUrl(const std::string& workspace_id,
                                            const std::string& suffix) const {
    return server_url_ + "/toolbox/" + Escape(workspace_id) + "/toolbox" + suffix;
}

HttpWorkspaceClient::HttpResponse HttpWorkspaceClient::Perform(
    const std::string& method,
    const std::string& url,
    const std::string* json_body,
    const Upload* upload,
    std::chrono::milliseconds timeout) const {

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw core::TransportError("curl_easy_init failed");
    }

    HttpResponse response;
    char error_message[CURL_ERROR_SIZE] = {0};

    HeaderList headers;
    auto append_header = [&headers](const std::string& header) {
        curl_slist* extended = curl_slist_append(headers.get(), header.c_str());
        if (extended == nullptr) {
            throw core::TransportError("curl_slist_append failed");
        }
        headers.release();
        headers.reset(extended);
    };

    append_header("Authorization: Bearer " + api_key_);
    append_header("Accept: application/json");

    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_message);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &StringWriter);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "sandkit/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, 10000L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

    MimeHandle mime;
    if (upload != nullptr) {
        mime.reset(curl_mime_init(curl.get()));
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, "file");
        curl_mime_filename(part, upload->file_name.c_str());
        curl_mime_data(part, upload->content->data(), upload->content->size());
        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    } else if (json_body != nullptr) {
        append_header("Content-Type: application/json");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
    }

    if (method == "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    } else if (method != "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    spdlog::debug("{} {}", method, url);

    CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        std::string reason = error_message[0] != '\0' ? error_message : curl_easy_strerror(code);
        throw core::TransportError(method + " " + url + " failed: " + reason);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

// ============================================================================
// WORKSPACE LIFECYCLE
// ============================================================================

std::string HttpWorkspaceClient::CreateWorkspace(const WorkspaceSpec& spec) {
    const std::string body = spec.ToJson().dump();
    auto response = Perform("POST", server_url_ + "/sandbox", &body, nullptr, request_timeout_);
    if (response.status >= 400) {
        throw core::TransportError(DescribeFailure("Create workspace", response.status, response.body));
    }

    json created = ParseJsonBody("Create workspace", response.body);
    auto id = created.find("id");
    if (!created.is_object() || id == created.end() || !id->is_string() ||
        id->get<std::string>().empty()) {
        throw core::TransportError("Create workspace response has no id");
    }
    return id->get<std::string>();
}

void HttpWorkspaceClient::DeleteWorkspace(const std::string& workspace_id) {
    auto response = Perform("DELETE", server_url_ + "/sandbox/" + Escape(workspace_id),
                            nullptr, nullptr, request_timeout_);
    if (response.status >= 400) {
        throw core::TransportError(DescribeFailure("Delete workspace", response.status, response.body));
    }
}

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

json HttpWorkspaceClient::ExecuteProcess(const std::string& workspace_id,
                                         const ProcessRequest& request) {
    const std::string body = request.ToJson().dump();
    auto timeout = request.timeout + std::chrono::seconds(kRequestTimeoutGraceSeconds);

    auto response = Perform("POST", ToolboxUrl(workspace_id, "/process/execute"), &body, nullptr,
                            timeout);
    if (response.status >= 400) {
        throw core::TransportError(DescribeFailure("Execute", response.status, response.body));
    }
    return ParseJsonBody("Execute", response.body);
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::string HttpWorkspaceClient::DownloadFile(const std::string& workspace_id,
                                              const std::string& path) {
    auto response = Perform("GET", ToolboxUrl(workspace_id, "/files/download?path=" + Escape(path)),
                            nullptr, nullptr, request_timeout_);
    if (response.status == 404) {
        throw core::NotFoundError("File not found: " + path);
    }
    if (response.status >= 400) {
        throw core::TransportError(DescribeFailure("Download " + path, response.status, response.body));
    }
    return std::move(response.body);
}

void HttpWorkspaceClient::UploadFile(const std::string& workspace_id, const std::string& path,
                                     const std::string& content) {
    Upload upload;
    upload.file_name = utils::StringUtils::BaseName(path);
    upload.content = &content;

    auto response = Perform("POST", ToolboxUrl(workspace_id, "/files/upload?path=" + Escape(path)),
                            nullptr, &upload, request_timeout_);
    if (response.status >= 400) {
        throw core::TransportError(DescribeFailure("Upload " + path, response.status, response.body));
    }
}

} // namespace cloud
} // namespace sandkit
