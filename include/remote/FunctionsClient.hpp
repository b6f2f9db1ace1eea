#pragma once

#include "remote/Backend.hpp"
#include "config/Config.hpp"

namespace aax::remote {

// Callable-function protocol: POST {base}/{function} with {"data": ...} and
// the user's ID token as a bearer credential; the reply carries "result".
class FunctionsClient final : public Backend {
public:
    FunctionsClient(config::BackendConfig cfg, config::AuthConfig auth);

    nlohmann::json call(const std::string& function, const nlohmann::json& data) override;

private:
    config::BackendConfig cfg_;
    config::AuthConfig auth_;
};

}
