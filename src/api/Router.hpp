#pragma once

#include <functional>
#include <map>
#include <string>

#include "api/Controllers.hpp"

namespace mse::api {

class Router {
public:
    explicit Router(const Controllers& controllers);

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    std::map<std::string, Handler> routes_;
};

}  // namespace mse::api
