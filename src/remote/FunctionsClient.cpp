#include "remote/FunctionsClient.hpp"
#include "error/Error.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace aax::remote;
using namespace aax::util;
using namespace aax::error;
using namespace aax::log;
using json = nlohmann::json;

FunctionsClient::FunctionsClient(config::BackendConfig cfg, config::AuthConfig auth)
    : cfg_(std::move(cfg)), auth_(std::move(auth)) {
    ensureCurlGlobalInit();
}

json FunctionsClient::call(const std::string& function, const json& data) {
    if (auth_.user_id.empty() || auth_.id_token.empty()) throw Error::noUserSignedIn();
    if (cfg_.functions_base_url.empty()) throw Error::triggerFailed("no backend configured for " + function);

    const auto url = cfg_.functions_base_url + "/" + function;
    const auto body = json{{"data", data}}.dump();

    SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Authorization: Bearer " + auth_.id_token);

    Registry::remote()->debug("[FunctionsClient] POST {}", url);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.request_timeout_seconds));
    });

    if (resp.transportFailed()) {
        Registry::remote()->error("[FunctionsClient] {} failed: {}", function, resp.describe());
        throw Error::triggerFailed(fmt::format("{}: {}", function, resp.describe()));
    }

    if (resp.http == 401 || resp.http == 403) {
        Registry::remote()->error("[FunctionsClient] {} rejected credentials (HTTP {})", function, resp.http);
        throw Error::noUserSignedIn();
    }

    const auto reply = json::parse(resp.body, nullptr, false);

    if (!resp.ok()) {
        std::string message = resp.body;
        if (!reply.is_discarded() && reply.contains("error") && reply["error"].is_object())
            message = reply["error"].value("message", resp.body);
        Registry::remote()->error("[FunctionsClient] {} returned HTTP {}: {}", function, resp.http, message);
        throw Error::triggerFailed(fmt::format("{} (HTTP {}): {}", function, resp.http, message));
    }

    if (reply.is_discarded()) throw Error::triggerFailed(function + " returned a non-JSON reply");
    return reply.value("result", json());
}
