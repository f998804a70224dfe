#pragma once

namespace sm::cli {

class Router;

void registerCommands(Router& router);

}
