#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace aax::remote {

// Authenticated callable functions on the processing backend. Blocking.
class Backend {
public:
    virtual ~Backend() = default;

    // Throws error::Error: NoUserSignedIn without credentials, TriggerFailed otherwise.
    virtual nlohmann::json call(const std::string& function, const nlohmann::json& data) = 0;
};

}
