/**
 * @file browser_tool.cpp
 * @brief web_browse tool: a generated Playwright script run once in the sandbox
 *
 * User input reaches the script only as escaped string literals: the URL
 * through JSON serialization, the selector through EscapeSelector().
 *
 * @date 2026
 */

#include "sandkit/tools/sandbox_tools.hpp"
#include "sandkit/core/errors.hpp"
#include "sandkit/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

using json = nlohmann::json;

namespace sandkit {
namespace tools {

using utils::StringUtils;

std::string EscapeSelector(const std::string& selector) {
    std::string escaped;
    escaped.reserve(selector.size());

    for (char c : selector) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"': escaped += "\\\""; break;
            case '\r':
            case '\n': escaped += ' '; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string BuildBrowserScript(const std::string& url,
                               const std::optional<std::string>& selector,
                               std::size_t max_content_chars) {
    std::string extract_code;
    if (selector && !selector->empty()) {
        extract_code =
            "            elements = await page.query_selector_all(\"" + EscapeSelector(*selector) + "\")\n"
            "            texts = []\n"
            "            for el in elements:\n"
            "                text = await el.text_content()\n"
            "                if text:\n"
            "                    texts.append(text.strip())\n"
            "            content = \"\\n\".join(texts)\n";
    } else {
        extract_code =
            "            content = await page.text_content(\"body\") or \"\"\n";
    }

    // Replacement keeps the literal valid even for a URL with invalid UTF-8
    const std::string safe_url = json(url).dump(-1, ' ', false, json::error_handler_t::replace);

    std::ostringstream script;
    script << "import asyncio\n"
           << "import json\n"
           << "\n"
           << "async def main():\n"
           << "    try:\n"
           << "        from playwright.async_api import async_playwright\n"
           << "\n"
           << "        async with async_playwright() as p:\n"
           << "            browser = await p.chromium.launch(headless=True)\n"
           << "            page = await browser.new_page()\n"
           << "\n"
           << "            await page.goto(" << safe_url << ", wait_until=\"domcontentloaded\")\n"
           << "\n"
           << "            title = await page.title()\n"
           << extract_code
           << "\n"
           << "            result = {\n"
           << "                \"status\": \"success\",\n"
           << "                \"url\": page.url,\n"
           << "                \"title\": title,\n"
           << "                \"content\": content[:" << max_content_chars << "]\n"
           << "            }\n"
           << "\n"
           << "            await browser.close()\n"
           << "            print(json.dumps(result))\n"
           << "\n"
           << "    except Exception as e:\n"
           << "        print(json.dumps({\"status\": \"error\", \"error\": str(e)}))\n"
           << "\n"
           << "asyncio.run(main())\n";
    return script.str();
}

json WebBrowse(const SandboxToolExecutor& executor,
               const std::string& url,
               const std::optional<std::string>& selector) {
    spdlog::info("Web browse: {}", url);

    auto& sandbox = executor.GetSandbox();
    const std::string script_path = core::workspace::kBrowserScriptPath;

    core::CommandResult result;
    try {
        sandbox.WriteFile(script_path,
                          BuildBrowserScript(url, selector, executor.GetMaxOutputChars())).get();
        result = sandbox.RunCommand("python3 " + script_path, core::workspace::kRoot,
                                    kBrowseTimeout, {}).get();
    } catch (const core::SandboxError& e) {
        spdlog::error("Browser operation failed: {}", e.what());
        return MakeErrorResult(e.what());
    }

    const std::string output = StringUtils::Trim(result.GetStdout());
    if (result.IsSuccess() && !output.empty()) {
        try {
            auto parsed = json::parse(output);
            if (parsed.is_object()) {
                return parsed;
            }
        } catch (const json::parse_error& e) {
            spdlog::error("Browser script printed malformed JSON: {}", e.what());
        }
    }

    const std::string& stderr_output = result.GetStderr();
    return MakeErrorResult(stderr_output.empty() ? "Browser operation failed"
                                                 : executor.Truncate(stderr_output));
}

Tool CreateWebBrowseTool(const SandboxToolExecutor& executor) {
    Tool tool;
    tool.name = "web_browse";
    tool.description =
        "Browse a webpage and extract information. "
        "Returns page title and text content. "
        "Use 'selector' to target specific CSS elements.";
    tool.parameters = {
        {"type", "object"},
        {"properties", {
            {"url", {{"type", "string"},
                     {"description", "URL to browse."}}},
            {"selector", {{"type", "string"},
                          {"description", "Optional CSS selector to extract specific elements."}}}
        }},
        {"required", {"url"}}
    };
    tool.handler = [&executor](const json& params) {
        std::optional<std::string> selector;
        auto it = params.find("selector");
        if (it != params.end() && !it->is_null()) {
            selector = it->get<std::string>();
        }
        return WebBrowse(executor, params.at("url").get<std::string>(), selector);
    };
    return tool;
}

} // namespace tools
} // namespace sandkit
