#pragma once
#include "Api/ApiServer.hpp"

class MainApp;

namespace ApiWiring {
    // Collega le route REST ai metodi di MainApp
    ApiServer::Callbacks MakeCallbacks(MainApp& app);
}
